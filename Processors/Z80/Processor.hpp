//
//  Processor.hpp
//  Z80Step
//
//  Created by Thomas Harte on 19/10/2026.
//  Copyright © 2026 Thomas Harte. All rights reserved.
//

#pragma once

#include <cstdint>
#include <vector>

#include "ClockReceiver/ClockReceiver.hpp"
#include "InstructionSets/Z80/Instruction.hpp"
#include "Processors/Z80/Memory.hpp"
#include "Processors/Z80/Registers.hpp"
#include "Reflection/Enum.hpp"
#include "Reflection/Struct.hpp"

namespace Z80Step::CPU {

/*!
	Executes the unprefixed Z80 instruction set one whole instruction at a time, keeping a
	running count of T-states.

	Opcodes outside of the implemented groups (i.e. 0xc0–0xff) cost a 4-cycle opcode fetch and
	otherwise have no effect.
*/
class Processor {
public:
	struct Options: public Reflection::StructImpl<Options> {
		/// Suspend: HALT stops instruction fetch until the next reset; each subsequent step costs 4 T-states.
		/// Continue: HALT is logged and execution continues with the next instruction.
		ReflectableEnum(HaltBehaviour, Suspend, Continue);
		HaltBehaviour halt = HaltBehaviour::Suspend;

		Options() {
			if(needs_declare()) {
				DeclareField(halt);
				AnnounceEnum(HaltBehaviour);
			}
		}
	};

	/// Creates a processor with @c image as its memory, starting at address 0, and resets it.
	explicit Processor(std::vector<uint8_t> image);
	Processor(std::vector<uint8_t> image, const Options &options);

	/// Resets all registers, the T-state count and any halted state; memory is unaffected.
	void reset();

	/// Performs exactly one instruction, or one 4-cycle idle step if halted.
	void step();

	/// @returns A description of the instruction at @c address; does not affect processor state.
	InstructionSet::Z80::Instruction decode(uint16_t address) const;

	uint16_t value_of(Register r) const {
		return registers_.value_of(r);
	}
	void set_value_of(Register r, uint16_t value) {
		registers_.set_value_of(r, value);
	}

	const Flags &flags() const {
		return registers_.main.flags;
	}
	const Registers &registers() const {
		return registers_;
	}

	/// @returns The total number of T-states elapsed since reset.
	Cycles cycles() const {
		return cycles_;
	}

	bool is_halted() const {
		return halted_;
	}

	const Memory &memory() const {
		return memory_;
	}
	Memory &memory() {
		return memory_;
	}

	const Options &options() const {
		return options_;
	}

private:
	Memory memory_;
	Registers registers_;
	Options options_;
	Cycles cycles_;
	bool halted_ = false;

	uint8_t fetch();
	uint16_t fetch_word();
	void relative_jump(uint8_t offset);

	/// Reads or writes the register selected by a 3-bit register field, with 6 being (HL).
	uint8_t read_register(int index);
	void write_register(int index, uint8_t value);

	/// @returns The register pair selected by a 2-bit pair field: BC, DE, HL or SP.
	uint16_t &pair(int index);

	/// @returns @c true if the condition NZ, Z, NC or C selected by @c index holds.
	bool condition(int index) const;

	/// Performs the work of @c opcode, which has already been fetched. @returns its cost in T-states.
	int execute(uint8_t opcode);
	void execute_alu(int operation, uint8_t operand);
};

}
