//
//  Processor.cpp
//  Z80Step
//
//  Created by Thomas Harte on 19/10/2026.
//  Copyright © 2026 Thomas Harte. All rights reserved.
//

#include "Processors/Z80/Processor.hpp"

#include "InstructionSets/Z80/Decoder.hpp"
#include "Outputs/Log.hpp"
#include "Processors/Z80/ALU.hpp"

#include <utility>

using namespace Z80Step::CPU;

namespace {
using Logger = Z80Step::Log::Logger<Z80Step::Log::Source::Processor>;

constexpr int HLIndirect = 6;
}

Processor::Processor(std::vector<uint8_t> image) : Processor(std::move(image), Options()) {}

Processor::Processor(std::vector<uint8_t> image, const Options &options) :
	memory_(std::move(image)), options_(options)
{
	Logger::info().append("Allocated %zu bytes", memory_.size());
	reset();
}

void Processor::reset() {
	registers_.reset();
	cycles_ = Cycles(0);
	halted_ = false;
}

Z80Step::InstructionSet::Z80::Instruction Processor::decode(uint16_t address) const {
	return InstructionSet::Z80::Decoder::decode(memory_.data(), address);
}

void Processor::step() {
	int length = 4;
	if(!halted_) {
		const uint8_t opcode = fetch();
		length = execute(opcode);

		// Whichever view the instruction wrote to becomes authoritative.
		registers_.sync(is_pair_opcode(opcode) ? SyncDirection::PairsToHalves : SyncDirection::HalvesToPairs);
	}

	cycles_ += Cycles(length);
	registers_.r = uint8_t((registers_.r & 0x80) | ((registers_.r + 1) & 0x7f));
}

// MARK: - Operand access.

uint8_t Processor::fetch() {
	const uint8_t value = memory_.read(registers_.pc);
	++registers_.pc;
	return value;
}

uint16_t Processor::fetch_word() {
	const uint8_t low = fetch();
	const uint8_t high = fetch();
	return uint16_t(low | (high << 8));
}

void Processor::relative_jump(uint8_t offset) {
	registers_.pc = uint16_t(registers_.pc + int8_t(offset));
}

uint8_t Processor::read_register(int index) {
	auto &bank = registers_.main;
	switch(index) {
		case 0:	return bank.b;
		case 1:	return bank.c;
		case 2:	return bank.d;
		case 3:	return bank.e;
		case 4:	return bank.h;
		case 5:	return bank.l;
		case HLIndirect:	return memory_.read(bank.hl);
		default:	return bank.a;
	}
}

void Processor::write_register(int index, uint8_t value) {
	auto &bank = registers_.main;
	switch(index) {
		case 0:	bank.b = value;	break;
		case 1:	bank.c = value;	break;
		case 2:	bank.d = value;	break;
		case 3:	bank.e = value;	break;
		case 4:	bank.h = value;	break;
		case 5:	bank.l = value;	break;
		case HLIndirect:	memory_.write(bank.hl, value);	break;
		default:	bank.a = value;	break;
	}
}

uint16_t &Processor::pair(int index) {
	switch(index) {
		case 0:		return registers_.main.bc;
		case 1:		return registers_.main.de;
		case 2:		return registers_.main.hl;
		default:	return registers_.sp;
	}
}

bool Processor::condition(int index) const {
	const uint8_t flag = index < 2 ? registers_.main.flags.zero : registers_.main.flags.carry;
	return flag == (index & 1);
}

// MARK: - Dispatch.

int Processor::execute(uint8_t opcode) {
	const int x = opcode >> 6;
	const int y = (opcode >> 3) & 7;
	const int z = opcode & 7;
	const int p = y >> 1;
	const int q = y & 1;

	auto &bank = registers_.main;
	auto &flags = bank.flags;

	switch(x) {
		case 0:
			switch(z) {
				case 0:
					switch(y) {
						case 0:	return 4;	// NOP

						case 1:
							registers_.exchange_af();
						return 4;

						case 2: {	// DJNZ d
							const uint8_t offset = fetch();
							--bank.b;
							if(bank.b) {
								relative_jump(offset);
								return 13;
							}
						} return 8;

						case 3:		// JR d
							relative_jump(fetch());
						return 12;

						default: {	// JR cc, d
							const uint8_t offset = fetch();
							if(condition(y - 4)) {
								relative_jump(offset);
								return 12;
							}
						} return 7;
					}

				case 1:
					if(!q) {		// LD rr, nn
						pair(p) = fetch_word();
						return 10;
					}

					// ADD HL, rr
					bank.hl = ALU::add16(flags, bank.hl, pair(p));
				return 11;

				case 2:
					switch(y) {
						case 0:	memory_.write(bank.bc, bank.a);		return 7;	// LD (BC), A
						case 1:	bank.a = memory_.read(bank.bc);		return 7;	// LD A, (BC)
						case 2:	memory_.write(bank.de, bank.a);		return 7;	// LD (DE), A
						case 3:	bank.a = memory_.read(bank.de);		return 7;	// LD A, (DE)

						case 4:	memory_.write_word(fetch_word(), bank.hl);		return 16;	// LD (nn), HL
						case 5:	bank.hl = memory_.read_word(fetch_word());		return 16;	// LD HL, (nn)
						case 6:	memory_.write(fetch_word(), bank.a);			return 13;	// LD (nn), A
						default:	bank.a = memory_.read(fetch_word());		return 13;	// LD A, (nn)
					}

				case 3:		// INC rr, DEC rr
					pair(p) += q ? 0xffff : 0x0001;
				return 6;

				case 4:		// INC r
					write_register(y, ALU::inc8(flags, read_register(y)));
				return y == HLIndirect ? 11 : 4;

				case 5:		// DEC r
					write_register(y, ALU::dec8(flags, read_register(y)));
				return y == HLIndirect ? 11 : 4;

				case 6:		// LD r, n
					write_register(y, fetch());
				return y == HLIndirect ? 10 : 7;

				default:
					switch(y) {
						case 0:	bank.a = ALU::rlca(flags, bank.a);	break;
						case 1:	bank.a = ALU::rrca(flags, bank.a);	break;
						case 2:	bank.a = ALU::rla(flags, bank.a);	break;
						case 3:	bank.a = ALU::rra(flags, bank.a);	break;
						case 4:	bank.a = ALU::daa(flags, bank.a);	break;
						case 5:	bank.a = ALU::cpl(flags, bank.a);	break;
						case 6:	ALU::scf(flags, bank.a);			break;
						case 7:	ALU::ccf(flags, bank.a);			break;
					}
				return 4;
			}

		case 1:
			if(opcode == 0x76) {
				Logger::info().append("HALT at %04x", uint16_t(registers_.pc - 1));
				halted_ = options_.halt == Options::HaltBehaviour::Suspend;
				return 4;
			}

			// LD r, r'
			write_register(y, read_register(z));
		return (y == HLIndirect || z == HLIndirect) ? 7 : 4;

		case 2:		// ALU r
			execute_alu(y, read_register(z));
		return z == HLIndirect ? 7 : 4;

		default:
			Logger::error().append("Unimplemented opcode %02x at %04x", opcode, uint16_t(registers_.pc - 1));
		return 4;
	}
}

void Processor::execute_alu(int operation, uint8_t operand) {
	auto &bank = registers_.main;
	auto &flags = bank.flags;

	switch(operation) {
		case 0:	bank.a = ALU::add8(flags, bank.a, operand);	break;
		case 1:	bank.a = ALU::adc8(flags, bank.a, operand);	break;
		case 2:	bank.a = ALU::sub8(flags, bank.a, operand);	break;
		case 3:	bank.a = ALU::sbc8(flags, bank.a, operand);	break;
		case 4:	bank.a = ALU::and8(flags, bank.a, operand);	break;
		case 5:	bank.a = ALU::xor8(flags, bank.a, operand);	break;
		case 6:	bank.a = ALU::or8(flags, bank.a, operand);	break;
		default:	ALU::cp8(flags, bank.a, operand);		break;
	}
}
