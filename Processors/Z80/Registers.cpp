//
//  Registers.cpp
//  Z80Step
//
//  Created by Thomas Harte on 19/10/2026.
//  Copyright © 2026 Thomas Harte. All rights reserved.
//

#include "Processors/Z80/Registers.hpp"

#include <array>
#include <utility>

using namespace Z80Step::CPU;

// MARK: - Flags

uint8_t Flags::pack() const {
	return uint8_t(
		(sign ? Flag::Sign : 0) |
		(zero ? Flag::Zero : 0) |
		(bit5 ? Flag::Bit5 : 0) |
		(half_carry ? Flag::HalfCarry : 0) |
		(bit3 ? Flag::Bit3 : 0) |
		(parity_overflow ? Flag::Parity : 0) |
		(subtract ? Flag::Subtract : 0) |
		(carry ? Flag::Carry : 0)
	);
}

void Flags::unpack(uint8_t f) {
	sign				= (f & Flag::Sign) ? 1 : 0;
	zero				= (f & Flag::Zero) ? 1 : 0;
	bit5				= (f & Flag::Bit5) ? 1 : 0;
	half_carry			= (f & Flag::HalfCarry) ? 1 : 0;
	bit3				= (f & Flag::Bit3) ? 1 : 0;
	parity_overflow		= (f & Flag::Parity) ? 1 : 0;
	subtract			= (f & Flag::Subtract) ? 1 : 0;
	carry				= (f & Flag::Carry) ? 1 : 0;
}

// MARK: - Pair opcodes

namespace {

constexpr std::array<bool, 256> pair_opcodes = [] {
	std::array<bool, 256> table{};
	for(const uint8_t opcode: {
		0x01, 0x03, 0x08, 0x09, 0x0b,
		0x11, 0x13, 0x19, 0x1b,
		0x21, 0x23, 0x29, 0x2a, 0x2b,
		0x31, 0x33, 0x39, 0x3b,
	}) {
		table[opcode] = true;
	}
	return table;
}();

void sync_bank(RegisterBank &bank, SyncDirection direction) {
	if(direction == SyncDirection::PairsToHalves) {
		bank.a = uint8_t(bank.af >> 8);
		bank.b = uint8_t(bank.bc >> 8);
		bank.c = uint8_t(bank.bc);
		bank.d = uint8_t(bank.de >> 8);
		bank.e = uint8_t(bank.de);
		bank.h = uint8_t(bank.hl >> 8);
		bank.l = uint8_t(bank.hl);
	} else {
		bank.bc = uint16_t((bank.b << 8) | bank.c);
		bank.de = uint16_t((bank.d << 8) | bank.e);
		bank.hl = uint16_t((bank.h << 8) | bank.l);
	}

	bank.af = uint16_t((bank.a << 8) | bank.flags.pack());
}

}

bool Z80Step::CPU::is_pair_opcode(uint8_t opcode) {
	return pair_opcodes[opcode];
}

// MARK: - Registers

Registers::Registers() {
	reset();
}

void Registers::reset() {
	for(auto bank: {&main, &shadow}) {
		bank->a = bank->b = bank->c = bank->d = bank->e = bank->h = bank->l = 0xff;
		bank->flags = Flags();
	}
	sync(SyncDirection::HalvesToPairs);

	sp = ix = iy = 0xffff;
	i = 0xff;
	pc = 0;
	r = 0;
}

void Registers::sync(SyncDirection direction) {
	sync_bank(main, direction);
	sync_bank(shadow, direction);
}

void Registers::exchange_af() {
	std::swap(main.a, shadow.a);
	std::swap(main.flags, shadow.flags);
	std::swap(main.af, shadow.af);
}

uint16_t Registers::value_of(Register reg) const {
	switch(reg) {
		case Register::ProgramCounter:	return pc;
		case Register::StackPointer:	return sp;

		case Register::A:			return main.a;
		case Register::Flags:		return main.flags.pack();
		case Register::AF:			return main.af;
		case Register::B:			return main.b;
		case Register::C:			return main.c;
		case Register::BC:			return main.bc;
		case Register::D:			return main.d;
		case Register::E:			return main.e;
		case Register::DE:			return main.de;
		case Register::H:			return main.h;
		case Register::L:			return main.l;
		case Register::HL:			return main.hl;

		case Register::ADash:		return shadow.a;
		case Register::FlagsDash:	return shadow.flags.pack();
		case Register::AFDash:		return shadow.af;
		case Register::BDash:		return shadow.b;
		case Register::CDash:		return shadow.c;
		case Register::BCDash:		return shadow.bc;
		case Register::DDash:		return shadow.d;
		case Register::EDash:		return shadow.e;
		case Register::DEDash:		return shadow.de;
		case Register::HDash:		return shadow.h;
		case Register::LDash:		return shadow.l;
		case Register::HLDash:		return shadow.hl;

		case Register::IX:			return ix;
		case Register::IY:			return iy;
		case Register::I:			return i;
		case Register::R:			return r;
	}

	return 0;
}

void Registers::set_value_of(Register reg, uint16_t value) {
	const auto low = uint8_t(value);

	// Writes to a pair unpack into its halves; writes to a half or to the flags repack the pairs.
	const auto set_pair = [value] (RegisterBank &bank, uint16_t RegisterBank::*pair) {
		bank.*pair = value;
		sync_bank(bank, SyncDirection::PairsToHalves);
	};
	const auto set_half = [low] (RegisterBank &bank, uint8_t RegisterBank::*half) {
		bank.*half = low;
		sync_bank(bank, SyncDirection::HalvesToPairs);
	};
	const auto set_af = [value] (RegisterBank &bank) {
		bank.flags.unpack(uint8_t(value));
		bank.af = value;
		sync_bank(bank, SyncDirection::PairsToHalves);
	};
	const auto set_f = [low] (RegisterBank &bank) {
		bank.flags.unpack(low);
		sync_bank(bank, SyncDirection::HalvesToPairs);
	};

	switch(reg) {
		case Register::ProgramCounter:	pc = value;	break;
		case Register::StackPointer:	sp = value;	break;

		case Register::A:			set_half(main, &RegisterBank::a);		break;
		case Register::Flags:		set_f(main);							break;
		case Register::AF:			set_af(main);							break;
		case Register::B:			set_half(main, &RegisterBank::b);		break;
		case Register::C:			set_half(main, &RegisterBank::c);		break;
		case Register::BC:			set_pair(main, &RegisterBank::bc);		break;
		case Register::D:			set_half(main, &RegisterBank::d);		break;
		case Register::E:			set_half(main, &RegisterBank::e);		break;
		case Register::DE:			set_pair(main, &RegisterBank::de);		break;
		case Register::H:			set_half(main, &RegisterBank::h);		break;
		case Register::L:			set_half(main, &RegisterBank::l);		break;
		case Register::HL:			set_pair(main, &RegisterBank::hl);		break;

		case Register::ADash:		set_half(shadow, &RegisterBank::a);		break;
		case Register::FlagsDash:	set_f(shadow);							break;
		case Register::AFDash:		set_af(shadow);							break;
		case Register::BDash:		set_half(shadow, &RegisterBank::b);		break;
		case Register::CDash:		set_half(shadow, &RegisterBank::c);		break;
		case Register::BCDash:		set_pair(shadow, &RegisterBank::bc);	break;
		case Register::DDash:		set_half(shadow, &RegisterBank::d);		break;
		case Register::EDash:		set_half(shadow, &RegisterBank::e);		break;
		case Register::DEDash:		set_pair(shadow, &RegisterBank::de);	break;
		case Register::HDash:		set_half(shadow, &RegisterBank::h);		break;
		case Register::LDash:		set_half(shadow, &RegisterBank::l);		break;
		case Register::HLDash:		set_pair(shadow, &RegisterBank::hl);	break;

		case Register::IX:			ix = value;		break;
		case Register::IY:			iy = value;		break;
		case Register::I:			i = low;		break;
		case Register::R:			r = low;		break;
	}
}
