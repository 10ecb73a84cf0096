//
//  Decoder.cpp
//  Z80Step
//
//  Created by Thomas Harte on 19/10/2026.
//  Copyright © 2026 Thomas Harte. All rights reserved.
//

#include "InstructionSets/Z80/Decoder.hpp"

#include <algorithm>
#include <cstdio>
#include <cstring>

using namespace Z80Step::InstructionSet::Z80;

namespace {

// Opcodes beyond this one are never followed by operands, as far as the decoder is concerned.
constexpr uint8_t LastOperandOpcode = 0x9f;

constexpr const char *mnemonics[256] = {
	/* 0x00 – 0x0f */
	"NOP",				"LD BC, **",		"LD (BC), A",		"INC BC",
	"INC B",			"DEC B",			"LD B, *",			"RLCA",
	"EX AF, AF'",		"ADD HL, BC",		"LD A, (BC)",		"DEC BC",
	"INC C",			"DEC C",			"LD C, *",			"RRCA",

	/* 0x10 – 0x1f */
	"DJNZ *",			"LD DE, **",		"LD (DE), A",		"INC DE",
	"INC D",			"DEC D",			"LD D, *",			"RLA",
	"JR *",				"ADD HL, DE",		"LD A, (DE)",		"DEC DE",
	"INC E",			"DEC E",			"LD E, *",			"RRA",

	/* 0x20 – 0x2f */
	"JR NZ, *",			"LD HL, **",		"LD (**), HL",		"INC HL",
	"INC H",			"DEC H",			"LD H, *",			"DAA",
	"JR Z, *",			"ADD HL, HL",		"LD HL, (**)",		"DEC HL",
	"INC L",			"DEC L",			"LD L, *",			"CPL",

	/* 0x30 – 0x3f */
	"JR NC, *",			"LD SP, **",		"LD (**), A",		"INC SP",
	"INC (HL)",			"DEC (HL)",			"LD (HL), *",		"SCF",
	"JR C, *",			"ADD HL, SP",		"LD A, (**)",		"DEC SP",
	"INC A",			"DEC A",			"LD A, *",			"CCF",

	/* 0x40 – 0x4f */
	"LD B, B",			"LD B, C",			"LD B, D",			"LD B, E",
	"LD B, H",			"LD B, L",			"LD B, (HL)",		"LD B, A",
	"LD C, B",			"LD C, C",			"LD C, D",			"LD C, E",
	"LD C, H",			"LD C, L",			"LD C, (HL)",		"LD C, A",

	/* 0x50 – 0x5f */
	"LD D, B",			"LD D, C",			"LD D, D",			"LD D, E",
	"LD D, H",			"LD D, L",			"LD D, (HL)",		"LD D, A",
	"LD E, B",			"LD E, C",			"LD E, D",			"LD E, E",
	"LD E, H",			"LD E, L",			"LD E, (HL)",		"LD E, A",

	/* 0x60 – 0x6f */
	"LD H, B",			"LD H, C",			"LD H, D",			"LD H, E",
	"LD H, H",			"LD H, L",			"LD H, (HL)",		"LD H, A",
	"LD L, B",			"LD L, C",			"LD L, D",			"LD L, E",
	"LD L, H",			"LD L, L",			"LD L, (HL)",		"LD L, A",

	/* 0x70 – 0x7f */
	"LD (HL), B",		"LD (HL), C",		"LD (HL), D",		"LD (HL), E",
	"LD (HL), H",		"LD (HL), L",		"HALT",				"LD (HL), A",
	"LD A, B",			"LD A, C",			"LD A, D",			"LD A, E",
	"LD A, H",			"LD A, L",			"LD A, (HL)",		"LD A, A",

	/* 0x80 – 0x8f */
	"ADD A, B",			"ADD A, C",			"ADD A, D",			"ADD A, E",
	"ADD A, H",			"ADD A, L",			"ADD A, (HL)",		"ADD A, A",
	"ADC A, B",			"ADC A, C",			"ADC A, D",			"ADC A, E",
	"ADC A, H",			"ADC A, L",			"ADC A, (HL)",		"ADC A, A",

	/* 0x90 – 0x9f */
	"SUB B",			"SUB C",			"SUB D",			"SUB E",
	"SUB H",			"SUB L",			"SUB (HL)",			"SUB A",
	"SBC A, B",			"SBC A, C",			"SBC A, D",			"SBC A, E",
	"SBC A, H",			"SBC A, L",			"SBC A, (HL)",		"SBC A, A",

	/* 0xa0 – 0xaf */
	"AND B",			"AND C",			"AND D",			"AND E",
	"AND H",			"AND L",			"AND (HL)",			"AND A",
	"XOR B",			"XOR C",			"XOR D",			"XOR E",
	"XOR H",			"XOR L",			"XOR (HL)",			"XOR A",

	/* 0xb0 – 0xbf */
	"OR B",				"OR C",				"OR D",				"OR E",
	"OR H",				"OR L",				"OR (HL)",			"OR A",
	"CP B",				"CP C",				"CP D",				"CP E",
	"CP H",				"CP L",				"CP (HL)",			"CP A",

	/* 0xc0 – 0xcf */
	"RET NZ",			"POP BC",			"JP NZ, nn",		"JP nn",
	"CALL NZ, nn",		"PUSH BC",			"ADD A, n",			"RST 00h",
	"RET Z",			"RET",				"JP Z, nn",			"PREFIX CB",
	"CALL Z, nn",		"CALL nn",			"ADC A, n",			"RST 08h",

	/* 0xd0 – 0xdf */
	"RET NC",			"POP DE",			"JP NC, nn",		"OUT (n), A",
	"CALL NC, nn",		"PUSH DE",			"SUB n",			"RST 10h",
	"RET C",			"EXX",				"JP C, nn",			"IN A, (n)",
	"CALL C, nn",		"PREFIX DD",		"SBC A, n",			"RST 18h",

	/* 0xe0 – 0xef */
	"RET PO",			"POP HL",			"JP PO, nn",		"EX (SP), HL",
	"CALL PO, nn",		"PUSH HL",			"AND n",			"RST 20h",
	"RET PE",			"JP (HL)",			"JP PE, nn",		"EX DE, HL",
	"CALL PE, nn",		"PREFIX ED",		"XOR n",			"RST 28h",

	/* 0xf0 – 0xff */
	"RET P",			"POP AF",			"JP P, nn",			"DI",
	"CALL P, nn",		"PUSH AF",			"OR n",				"RST 30h",
	"RET M",			"LD SP, HL",		"JP M, nn",			"EI",
	"CALL M, nn",		"PREFIX FD",		"CP n",				"RST 38h",
};

}

const char *Decoder::mnemonic_template(uint8_t opcode) {
	return mnemonics[opcode];
}

int Decoder::length_of(uint8_t opcode) {
	if(opcode > LastOperandOpcode) return 1;

	const char *const mnemonic = mnemonics[opcode];
	return 1 + int(std::count(mnemonic, mnemonic + strlen(mnemonic), '*'));
}

Instruction Decoder::decode(const std::vector<uint8_t> &memory, uint16_t address) {
	Instruction instruction;
	if(address >= memory.size()) {
		return instruction;
	}

	const uint8_t opcode = memory[address];
	instruction.length = length_of(opcode);

	// Don't read beyond the end of memory; report the length anyway so that a caller can skip past.
	if(size_t(address) + size_t(instruction.length) > memory.size()) {
		instruction.bytes.push_back(opcode);
		return instruction;
	}

	instruction.bytes.assign(memory.begin() + address, memory.begin() + address + instruction.length);
	instruction.recognised = true;

	const std::string mnemonic = mnemonics[opcode];
	const auto placeholder = mnemonic.find('*');
	if(placeholder == std::string::npos || instruction.length == 1) {
		instruction.mnemonic = mnemonic;
		return instruction;
	}

	char operand[8];
	if(instruction.length == 3) {
		snprintf(operand, sizeof(operand), "%04Xh", instruction.bytes[1] | (instruction.bytes[2] << 8));
	} else {
		snprintf(operand, sizeof(operand), "%02Xh", instruction.bytes[1]);
	}
	instruction.mnemonic = mnemonic.substr(0, placeholder) + operand + mnemonic.substr(placeholder + size_t(instruction.length - 1));
	return instruction;
}
