//
//  Instruction.hpp
//  Z80Step
//
//  Created by Thomas Harte on 19/10/2026.
//  Copyright © 2026 Thomas Harte. All rights reserved.
//

#pragma once

#include <cstdint>
#include <ostream>
#include <string>
#include <vector>

namespace Z80Step::InstructionSet::Z80 {

/// The mnemonic given to an instruction that could not be fully read.
constexpr const char *UnrecognisedMnemonic = "??";

/*!
	A decoded instruction: its mnemonic with any operand substituted, the bytes it was read from
	and its total length.
*/
struct Instruction {
	std::string mnemonic = UnrecognisedMnemonic;
	std::vector<uint8_t> bytes;
	int length = 1;

	/// @c false if the instruction runs beyond the end of memory, in which case @c bytes holds
	/// at most the opcode and @c mnemonic is @c UnrecognisedMnemonic.
	bool recognised = false;

	bool operator ==(const Instruction &) const = default;
};

inline std::ostream &operator <<(std::ostream &stream, const Instruction &instruction) {
	stream << instruction.mnemonic;
	return stream;
}

}
