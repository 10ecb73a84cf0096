//
//  Decoder.hpp
//  Z80Step
//
//  Created by Thomas Harte on 19/10/2026.
//  Copyright © 2026 Thomas Harte. All rights reserved.
//

#pragma once

#include "InstructionSets/Z80/Instruction.hpp"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace Z80Step::InstructionSet::Z80 {

/*!
	Produces human-readable descriptions of unprefixed Z80 instructions.

	Templates use @c * to mark a one-byte immediate and @c ** to mark a little-endian word;
	substituted operands are formatted as upper-case hex with a trailing 'h'.
*/
class Decoder {
public:
	/*!
		Decodes the instruction at @c address within @c memory. Never reads outside of @c memory;
		an instruction that would run beyond its end is reported as unrecognised, with the length it
		would have had.
	*/
	static Instruction decode(const std::vector<uint8_t> &memory, uint16_t address);

	/// @returns The mnemonic template for @c opcode; every opcode has one.
	static const char *mnemonic_template(uint8_t opcode);

	/// @returns The total length in bytes of the instruction with opcode @c opcode.
	static int length_of(uint8_t opcode);
};

}
