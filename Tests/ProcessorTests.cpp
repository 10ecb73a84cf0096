//
//  ProcessorTests.cpp
//  Z80Step
//
//  Created by Thomas Harte on 19/10/2026.
//  Copyright © 2026 Thomas Harte. All rights reserved.
//

#include <gtest/gtest.h>

#include <algorithm>
#include <iterator>
#include <vector>

#include "Processors/Z80/Processor.hpp"

using namespace Z80Step::CPU;

namespace {

int64_t cycles(const Processor &processor) {
	return processor.cycles().as_integral();
}

uint16_t pc(const Processor &processor) {
	return processor.value_of(Register::ProgramCounter);
}

/// @returns A 256-byte image beginning with @c program, with BC, DE and HL all pointing at 0x0080.
Processor padded(std::vector<uint8_t> program) {
	program.resize(256);
	Processor processor(std::move(program));
	processor.set_value_of(Register::BC, 0x0080);
	processor.set_value_of(Register::DE, 0x0080);
	processor.set_value_of(Register::HL, 0x0080);
	return processor;
}

}

// MARK: - Reset.

TEST(ProcessorTests, ConstructionResets) {
	const Processor processor({0x00});
	EXPECT_EQ(pc(processor), 0);
	EXPECT_EQ(processor.value_of(Register::R), 0);
	EXPECT_EQ(processor.value_of(Register::AF), 0xff00);
	EXPECT_EQ(processor.value_of(Register::StackPointer), 0xffff);
	EXPECT_EQ(cycles(processor), 0);
	EXPECT_FALSE(processor.is_halted());
	EXPECT_EQ(processor.memory().size(), 1u);
}

// MARK: - Scenarios.

TEST(ProcessorTests, NOP) {
	Processor processor({0x00});
	const uint16_t af = processor.value_of(Register::AF);

	processor.step();
	EXPECT_EQ(pc(processor), 1);
	EXPECT_EQ(cycles(processor), 4);
	EXPECT_EQ(processor.value_of(Register::AF), af);
	EXPECT_EQ(processor.value_of(Register::R), 1);
}

TEST(ProcessorTests, LoadPairImmediate) {
	Processor processor({0x01, 0x34, 0x12});
	processor.step();

	EXPECT_EQ(processor.value_of(Register::BC), 0x1234);
	EXPECT_EQ(processor.value_of(Register::B), 0x12);
	EXPECT_EQ(processor.value_of(Register::C), 0x34);
	EXPECT_EQ(pc(processor), 3);
	EXPECT_EQ(cycles(processor), 10);
}

TEST(ProcessorTests, IncrementAOverflow) {
	for(const uint16_t carry: {0, 1}) {
		Processor processor({0x3c});
		processor.set_value_of(Register::A, 0x7f);
		processor.set_value_of(Register::Flags, carry ? Flag::Carry : 0);
		processor.step();

		EXPECT_EQ(processor.value_of(Register::A), 0x80);
		EXPECT_EQ(processor.flags().sign, 1);
		EXPECT_EQ(processor.flags().zero, 0);
		EXPECT_EQ(processor.flags().half_carry, 1);
		EXPECT_EQ(processor.flags().parity_overflow, 1);
		EXPECT_EQ(processor.flags().subtract, 0);
		EXPECT_EQ(processor.flags().carry, carry);
		EXPECT_EQ(processor.value_of(Register::AF), 0x8094 | carry);
		EXPECT_EQ(cycles(processor), 4);
	}
}

TEST(ProcessorTests, RelativeJumpBackwards) {
	Processor processor({0x00, 0x18, 0xfe});
	processor.step();
	processor.step();

	EXPECT_EQ(pc(processor), 1);
	EXPECT_EQ(cycles(processor), 16);
}

// MARK: - Timing.

TEST(ProcessorTests, TStates) {
	struct Timing {
		std::vector<uint8_t> program;
		int cycles;
	};
	const std::vector<Timing> timings = {
		{{0x00}, 4},						// NOP
		{{0x01, 0x00, 0x00}, 10},			// LD BC, nn
		{{0x02}, 7},		{{0x12}, 7},	// LD (BC), A; LD (DE), A
		{{0x0a}, 7},		{{0x1a}, 7},	// LD A, (BC); LD A, (DE)
		{{0x03}, 6},		{{0x3b}, 6},	// INC BC; DEC SP
		{{0x04}, 4},		{{0x2d}, 4},	// INC B; DEC L
		{{0x34}, 11},		{{0x35}, 11},	// INC (HL); DEC (HL)
		{{0x06, 0x00}, 7},					// LD B, n
		{{0x36, 0x00}, 10},					// LD (HL), n
		{{0x41}, 4},						// LD B, C
		{{0x46}, 7},		{{0x70}, 7},	// LD B, (HL); LD (HL), B
		{{0x07}, 4},		{{0x0f}, 4},	{{0x17}, 4},	{{0x1f}, 4},
		{{0x08}, 4},						// EX AF, AF'
		{{0x09}, 11},						// ADD HL, BC
		{{0x18, 0x00}, 12},					// JR
		{{0x22, 0x90, 0x00}, 16},			// LD (nn), HL
		{{0x2a, 0x90, 0x00}, 16},			// LD HL, (nn)
		{{0x32, 0x90, 0x00}, 13},			// LD (nn), A
		{{0x3a, 0x90, 0x00}, 13},			// LD A, (nn)
		{{0x27}, 4},		{{0x2f}, 4},	{{0x37}, 4},	{{0x3f}, 4},
		{{0x76}, 4},						// HALT
		{{0x80}, 4},		{{0xa8}, 4},	// ADD A, B; XOR B
		{{0x86}, 7},		{{0xbe}, 7},	// ADD A, (HL); CP (HL)
		{{0xc3, 0x00, 0x00}, 4},			// JP nn, which isn't implemented.

		// B is 0 so DJNZ is taken; the flags are clear so NZ and NC are true.
		{{0x10, 0x00}, 13},
		{{0x20, 0x00}, 12},		{{0x28, 0x00}, 7},
		{{0x30, 0x00}, 12},		{{0x38, 0x00}, 7},
	};

	for(const auto &timing: timings) {
		Processor processor = padded(timing.program);
		processor.step();
		EXPECT_EQ(cycles(processor), timing.cycles) << "Opcode " << std::hex << int(timing.program[0]);
	}
}

TEST(ProcessorTests, DecrementAndJump) {
	// LD B, 3; DJNZ -2
	Processor processor({0x06, 0x03, 0x10, 0xfe});
	processor.step();
	EXPECT_EQ(processor.value_of(Register::B), 3);

	processor.step();
	EXPECT_EQ(pc(processor), 2);
	EXPECT_EQ(processor.value_of(Register::BC), 0x02ff);

	processor.step();
	EXPECT_EQ(pc(processor), 2);

	processor.step();
	EXPECT_EQ(pc(processor), 4);
	EXPECT_EQ(processor.value_of(Register::B), 0);
	EXPECT_EQ(cycles(processor), 7 + 13 + 13 + 8);
}

TEST(ProcessorTests, ConditionalJumps) {
	struct Condition {
		uint8_t opcode;
		uint8_t flags;
		bool taken;
	};
	const Condition conditions[] = {
		{0x20, 0, true},				{0x20, Flag::Zero, false},
		{0x28, 0, false},				{0x28, Flag::Zero, true},
		{0x30, 0, true},				{0x30, Flag::Carry, false},
		{0x38, 0, false},				{0x38, Flag::Carry, true},

		// Each condition tests only its own flag.
		{0x20, Flag::Carry, true},		{0x38, Flag::Zero, false},
	};

	for(const auto &condition: conditions) {
		Processor processor({condition.opcode, 0x04});
		processor.set_value_of(Register::Flags, condition.flags);
		processor.step();
		EXPECT_EQ(pc(processor), condition.taken ? 6 : 2) << std::hex << int(condition.opcode) << " " << int(condition.flags);
		EXPECT_EQ(cycles(processor), condition.taken ? 12 : 7);
	}
}

// MARK: - HALT.

TEST(ProcessorTests, HaltSuspends) {
	Processor processor({0x76, 0x00});
	processor.step();
	EXPECT_TRUE(processor.is_halted());
	EXPECT_EQ(pc(processor), 1);
	EXPECT_EQ(cycles(processor), 4);

	processor.step();
	processor.step();
	EXPECT_TRUE(processor.is_halted());
	EXPECT_EQ(pc(processor), 1);
	EXPECT_EQ(cycles(processor), 12);
	EXPECT_EQ(processor.value_of(Register::R), 3);

	processor.reset();
	EXPECT_FALSE(processor.is_halted());
	EXPECT_EQ(pc(processor), 0);
	EXPECT_EQ(cycles(processor), 0);
}

TEST(ProcessorTests, ProgramLoadedAfterConstruction) {
	// LD A, 05h; DEC A; JR NZ, -3; HALT
	const uint8_t program[] = {0x3e, 0x05, 0x3d, 0x20, 0xfd, 0x76};

	Processor processor(std::vector<uint8_t>(16));
	processor.memory().set_data_at_address(8, sizeof(program), program);
	processor.set_value_of(Register::ProgramCounter, 8);

	while(!processor.is_halted()) {
		processor.step();
	}
	EXPECT_EQ(processor.value_of(Register::A), 0x00);
	EXPECT_EQ(processor.flags().zero, 1);
	EXPECT_EQ(pc(processor), 14);

	// 7 + 5 * 4 + 4 * 12 + 7 + 4
	EXPECT_EQ(cycles(processor), 86);

	uint8_t readback[sizeof(program)]{};
	EXPECT_EQ(processor.memory().get_data_at_address(8, sizeof(readback), readback), sizeof(program));
	EXPECT_TRUE(std::equal(std::begin(program), std::end(program), std::begin(readback)));
}

TEST(ProcessorTests, HaltContinues) {
	Processor::Options options;
	options.halt = Processor::Options::HaltBehaviour::Continue;

	Processor processor({0x76, 0x00}, options);
	EXPECT_EQ(processor.options().halt, Processor::Options::HaltBehaviour::Continue);

	processor.step();
	EXPECT_FALSE(processor.is_halted());
	EXPECT_EQ(pc(processor), 1);

	processor.step();
	EXPECT_EQ(pc(processor), 2);
	EXPECT_EQ(cycles(processor), 8);
}

// MARK: - Register and memory effects.

TEST(ProcessorTests, RefreshCounterWraps) {
	Processor processor({0x00, 0x00});
	processor.set_value_of(Register::R, 0x7f);
	processor.step();
	EXPECT_EQ(processor.value_of(Register::R), 0x00);

	processor.set_value_of(Register::R, 0xff);
	processor.step();
	EXPECT_EQ(processor.value_of(Register::R), 0x80);
}

TEST(ProcessorTests, SeededRegistersSurviveExecution) {
	Processor processor({0x00, 0x04});
	processor.set_value_of(Register::HL, 0xfe00);
	processor.set_value_of(Register::BC, 0x00ff);

	processor.step();
	EXPECT_EQ(processor.value_of(Register::HL), 0xfe00);
	EXPECT_EQ(processor.value_of(Register::BC), 0x00ff);

	// INC B
	processor.step();
	EXPECT_EQ(processor.value_of(Register::BC), 0x01ff);
	EXPECT_EQ(processor.value_of(Register::H), 0xfe);
}

TEST(ProcessorTests, ExchangeAF) {
	Processor processor({0x08, 0x08});
	processor.set_value_of(Register::AF, 0x1201);
	processor.set_value_of(Register::AFDash, 0x3440);

	processor.step();
	EXPECT_EQ(processor.value_of(Register::AF), 0x3440);
	EXPECT_EQ(processor.value_of(Register::AFDash), 0x1201);
	EXPECT_EQ(processor.value_of(Register::A), 0x34);
	EXPECT_EQ(processor.flags().zero, 1);
	EXPECT_EQ(processor.flags().carry, 0);
	EXPECT_EQ(processor.registers().shadow.a, 0x12);
	EXPECT_EQ(processor.registers().shadow.flags.carry, 1);
	EXPECT_EQ(processor.registers().shadow.af, 0x1201);

	processor.step();
	EXPECT_EQ(processor.value_of(Register::AF), 0x1201);
	EXPECT_EQ(processor.flags().carry, 1);
}

TEST(ProcessorTests, AddHL) {
	Processor processor({0x09, 0x29});
	processor.set_value_of(Register::HL, 0x0fff);
	processor.set_value_of(Register::BC, 0x0001);

	processor.step();
	EXPECT_EQ(processor.value_of(Register::HL), 0x1000);
	EXPECT_EQ(processor.value_of(Register::H), 0x10);
	EXPECT_EQ(processor.value_of(Register::L), 0x00);
	EXPECT_EQ(processor.flags().half_carry, 1);
	EXPECT_EQ(processor.flags().carry, 0);

	// ADD HL, HL
	processor.step();
	EXPECT_EQ(processor.value_of(Register::HL), 0x2000);
	EXPECT_EQ(processor.flags().half_carry, 0);
	EXPECT_EQ(processor.flags().bit5, 1);
	EXPECT_EQ(processor.value_of(Register::AF) & 0xff, processor.value_of(Register::Flags));
}

TEST(ProcessorTests, IncrementDecrementPairs) {
	Processor processor({0x03, 0x1b, 0x33});
	processor.set_value_of(Register::BC, 0xffff);
	processor.set_value_of(Register::DE, 0x0000);
	processor.set_value_of(Register::StackPointer, 0x1234);
	const uint16_t af = processor.value_of(Register::AF);

	processor.step();
	processor.step();
	processor.step();
	EXPECT_EQ(processor.value_of(Register::BC), 0x0000);
	EXPECT_EQ(processor.value_of(Register::B), 0x00);
	EXPECT_EQ(processor.value_of(Register::DE), 0xffff);
	EXPECT_EQ(processor.value_of(Register::E), 0xff);
	EXPECT_EQ(processor.value_of(Register::StackPointer), 0x1235);
	EXPECT_EQ(processor.value_of(Register::AF), af);
}

TEST(ProcessorTests, AbsoluteLoadsAndStores) {
	// LD HL, (0006); LD (0008), HL; then data.
	Processor processor({0x2a, 0x06, 0x00, 0x22, 0x08, 0x00, 0x34, 0x12, 0x00, 0x00});

	processor.step();
	EXPECT_EQ(processor.value_of(Register::HL), 0x1234);
	EXPECT_EQ(processor.value_of(Register::H), 0x12);
	EXPECT_EQ(processor.value_of(Register::L), 0x34);

	processor.step();
	EXPECT_EQ(processor.memory().read(0x08), 0x34);
	EXPECT_EQ(processor.memory().read(0x09), 0x12);
	EXPECT_EQ(cycles(processor), 32);
}

TEST(ProcessorTests, AccumulatorViaAbsoluteAddress) {
	// LD A, (0006); LD (0007), A; then the data bytes.
	Processor processor({0x3a, 0x06, 0x00, 0x32, 0x07, 0x00, 0x5a, 0x00});
	processor.step();
	EXPECT_EQ(processor.value_of(Register::A), 0x5a);

	processor.step();
	EXPECT_EQ(processor.memory().read(0x07), 0x5a);
	EXPECT_EQ(cycles(processor), 26);
}

TEST(ProcessorTests, IndirectLoads) {
	Processor processor({0x02, 0x1a, 0x00, 0x00});
	processor.set_value_of(Register::A, 0x77);
	processor.set_value_of(Register::BC, 0x0002);
	processor.set_value_of(Register::DE, 0x0003);
	processor.memory().write(0x03, 0x99);

	processor.step();
	EXPECT_EQ(processor.memory().read(0x02), 0x77);

	processor.step();
	EXPECT_EQ(processor.value_of(Register::A), 0x99);
}

TEST(ProcessorTests, RegisterMoves) {
	// LD B, A; LD (HL), B; LD E, (HL); LD H, 0x12
	Processor processor({0x47, 0x70, 0x5e, 0x26, 0x12, 0x00});
	processor.set_value_of(Register::A, 0x42);
	processor.set_value_of(Register::HL, 0x0005);

	processor.step();
	EXPECT_EQ(processor.value_of(Register::B), 0x42);
	EXPECT_EQ(processor.value_of(Register::BC) >> 8, 0x42);

	processor.step();
	EXPECT_EQ(processor.memory().read(0x05), 0x42);

	processor.step();
	EXPECT_EQ(processor.value_of(Register::E), 0x42);
	EXPECT_EQ(processor.value_of(Register::DE) & 0xff, 0x42);

	processor.step();
	EXPECT_EQ(processor.value_of(Register::HL), 0x1205);
	EXPECT_EQ(cycles(processor), 4 + 7 + 7 + 7);
}

TEST(ProcessorTests, MemoryIncrementDecrement) {
	// DEC (HL); INC (HL); then two data bytes.
	Processor processor({0x35, 0x34, 0x00, 0x7f});
	processor.set_value_of(Register::HL, 0x0002);

	processor.step();
	EXPECT_EQ(processor.memory().read(0x02), 0xff);
	EXPECT_EQ(processor.flags().half_carry, 1);
	EXPECT_EQ(processor.flags().subtract, 1);
	EXPECT_EQ(processor.flags().sign, 1);

	processor.set_value_of(Register::HL, 0x0003);
	processor.step();
	EXPECT_EQ(processor.memory().read(0x03), 0x80);
	EXPECT_EQ(processor.flags().parity_overflow, 1);
	EXPECT_EQ(processor.flags().subtract, 0);
	EXPECT_EQ(cycles(processor), 22);
}

TEST(ProcessorTests, ArithmeticGroup) {
	// ADD A, B; SUB A; CP B; ADC A, B; SBC A, C; AND (HL); XOR A; OR C
	Processor processor({0x80, 0x97, 0xb8, 0x88, 0x99, 0xa6, 0xaf, 0xb1, 0x0f});
	processor.set_value_of(Register::A, 0x7f);
	processor.set_value_of(Register::BC, 0x0102);
	processor.set_value_of(Register::HL, 0x0008);

	processor.step();
	EXPECT_EQ(processor.value_of(Register::A), 0x80);
	EXPECT_EQ(processor.flags().parity_overflow, 1);

	processor.step();
	EXPECT_EQ(processor.value_of(Register::A), 0x00);
	EXPECT_EQ(processor.flags().zero, 1);
	EXPECT_EQ(processor.flags().subtract, 1);

	// CP B: 0 - 1 borrows, but A is unchanged.
	processor.step();
	EXPECT_EQ(processor.value_of(Register::A), 0x00);
	EXPECT_EQ(processor.flags().carry, 1);

	// ADC A, B: 0 + 1 + carry.
	processor.step();
	EXPECT_EQ(processor.value_of(Register::A), 0x02);
	EXPECT_EQ(processor.flags().carry, 0);

	// SBC A, C: 2 - 2 - 0.
	processor.step();
	EXPECT_EQ(processor.value_of(Register::A), 0x00);
	EXPECT_EQ(processor.flags().zero, 1);

	// AND (HL): (HL) is 0x0f.
	processor.set_value_of(Register::A, 0xfc);
	processor.step();
	EXPECT_EQ(processor.value_of(Register::A), 0x0c);
	EXPECT_EQ(processor.flags().half_carry, 1);
	EXPECT_EQ(processor.flags().parity_overflow, 1);

	processor.step();
	EXPECT_EQ(processor.value_of(Register::A), 0x00);
	EXPECT_EQ(processor.flags().zero, 1);

	processor.step();
	EXPECT_EQ(processor.value_of(Register::A), 0x02);
	EXPECT_EQ(processor.flags().parity_overflow, 0);
	EXPECT_EQ(processor.value_of(Register::AF), 0x0200);
	EXPECT_EQ(cycles(processor), 4 * 7 + 7);
}

TEST(ProcessorTests, AccumulatorMiscellany) {
	// RLCA; DAA; CPL; SCF; CCF
	Processor processor({0x07, 0x27, 0x2f, 0x37, 0x3f});
	processor.set_value_of(Register::AF, 0x4d00);

	processor.step();
	EXPECT_EQ(processor.value_of(Register::A), 0x9a);
	EXPECT_EQ(processor.flags().carry, 0);

	processor.step();
	EXPECT_EQ(processor.value_of(Register::A), 0x00);
	EXPECT_EQ(processor.flags().carry, 1);

	processor.step();
	EXPECT_EQ(processor.value_of(Register::A), 0xff);
	EXPECT_EQ(processor.flags().subtract, 1);

	processor.step();
	EXPECT_EQ(processor.flags().carry, 1);
	EXPECT_EQ(processor.flags().subtract, 0);

	processor.step();
	EXPECT_EQ(processor.flags().carry, 0);
	EXPECT_EQ(processor.flags().half_carry, 1);
}

TEST(ProcessorTests, UnimplementedOpcode) {
	Processor processor({0xc3, 0x00, 0x00});
	const uint16_t af = processor.value_of(Register::AF);
	const uint16_t sp = processor.value_of(Register::StackPointer);

	processor.step();
	EXPECT_EQ(pc(processor), 1);
	EXPECT_EQ(cycles(processor), 4);
	EXPECT_EQ(processor.value_of(Register::AF), af);
	EXPECT_EQ(processor.value_of(Register::StackPointer), sp);
	EXPECT_FALSE(processor.is_halted());
}

// MARK: - Memory boundaries.

TEST(ProcessorTests, AccessBeyondImage) {
	// LD A, (8000); LD (8000), A
	Processor processor({0x3a, 0x00, 0x80, 0x32, 0x00, 0x80});
	processor.set_value_of(Register::A, 0x00);

	processor.step();
	EXPECT_EQ(processor.value_of(Register::A), 0xff);

	processor.step();
	EXPECT_EQ(processor.memory().size(), 6u);
	EXPECT_EQ(processor.memory().read(0x8000), 0xff);
}

TEST(ProcessorTests, OperandFetchBeyondImage) {
	// LD BC, nn with only one operand byte present.
	Processor processor({0x01, 0x34});
	processor.step();
	EXPECT_EQ(processor.value_of(Register::BC), 0xff34);
	EXPECT_EQ(pc(processor), 3);
}

TEST(ProcessorTests, DecodeDoesNotAlterState) {
	Processor processor({0x01, 0x34});
	const auto instruction = processor.decode(0);
	EXPECT_EQ(instruction.mnemonic, "??");
	EXPECT_EQ(instruction.length, 3);
	EXPECT_EQ(pc(processor), 0);
	EXPECT_EQ(cycles(processor), 0);
	EXPECT_EQ(processor.decode(0), instruction);
}

TEST(ProcessorTests, Deterministic) {
	const std::vector<uint8_t> program = {
		0x21, 0x00, 0x10,	// LD HL, 1000h
		0x01, 0x23, 0x01,	// LD BC, 0123h
		0x09,				// ADD HL, BC
		0x3e, 0x45,			// LD A, 45h
		0x80,				// ADD A, B
		0x27,				// DAA
		0x10, 0xf3,			// DJNZ to the start
	};

	Processor first(program), second(program);
	for(int c = 0; c < 50; ++c) {
		first.step();
		second.step();
	}

	for(const auto r: {Register::ProgramCounter, Register::AF, Register::BC, Register::DE, Register::HL, Register::R}) {
		EXPECT_EQ(first.value_of(r), second.value_of(r));
	}
	EXPECT_EQ(first.cycles(), second.cycles());
}
