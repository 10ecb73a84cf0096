//
//  Registers.hpp
//  Z80Step
//
//  Created by Thomas Harte on 19/10/2026.
//  Copyright © 2026 Thomas Harte. All rights reserved.
//

#pragma once

#include <cstdint>

namespace Z80Step::CPU {

/*
	The list of registers that can be accessed via @c Registers::value_of and @c Registers::set_value_of.
*/
enum class Register {
	ProgramCounter,
	StackPointer,

	A,		Flags,	AF,
	B,		C,		BC,
	D,		E,		DE,
	H,		L,		HL,

	ADash,		FlagsDash,	AFDash,
	BDash,		CDash,		BCDash,
	DDash,		EDash,		DEDash,
	HDash,		LDash,		HLDash,

	IX,		IY,
	I,		R,
};

/*
	Flags as defined on the Z80; the bit positions of each within the F register.
*/
enum Flag: uint8_t {
	Sign		= 0x80,
	Zero		= 0x40,
	Bit5		= 0x20,
	HalfCarry	= 0x10,
	Bit3		= 0x08,
	Parity		= 0x04,
	Overflow	= 0x04,
	Subtract	= 0x02,
	Carry		= 0x01
};

/*!
	Holds one Z80 flag set, one field per flag. Each field is always either 0 or 1.
*/
struct Flags {
	uint8_t sign = 0;
	uint8_t zero = 0;
	uint8_t bit5 = 0;
	uint8_t half_carry = 0;
	uint8_t bit3 = 0;
	uint8_t parity_overflow = 0;
	uint8_t subtract = 0;
	uint8_t carry = 0;

	/// @returns These flags in F register form.
	uint8_t pack() const;

	/// Sets all flags from the F register value @c f.
	void unpack(uint8_t f);

	bool operator ==(const Flags &) const = default;
};

/*!
	One of the Z80's two general-purpose register banks. The 8-bit registers and the 16-bit pairs are
	stored separately; @c Registers::sync reconciles them.
*/
struct RegisterBank {
	uint8_t a = 0, b = 0, c = 0, d = 0, e = 0, h = 0, l = 0;
	uint16_t af = 0, bc = 0, de = 0, hl = 0;
	Flags flags;
};

enum class SyncDirection {
	/// Recomputes BC, DE and HL from their halves.
	HalvesToPairs,
	/// Recomputes B, C, D, E, H, L and A from the pairs.
	PairsToHalves,
};

/*!
	@returns @c true if @c opcode operates on 16-bit register pairs; the pairs are then the authoritative
		copy of register state once it has executed.
*/
bool is_pair_opcode(uint8_t opcode);

/*!
	The full Z80 register file: the main and shadow banks plus PC, SP, IX, IY, I and R.
*/
struct Registers {
	RegisterBank main, shadow;
	uint16_t pc = 0, sp = 0, ix = 0, iy = 0;
	uint8_t i = 0, r = 0;

	Registers();

	/// Sets all registers to 0xff or 0xffff other than PC and R, which become 0. Clears both sets of flags.
	void reset();

	/// Reconciles 8- and 16-bit views of both banks, treating the source indicated by @c direction as authoritative.
	/// AF is always reassembled from A and the flags.
	void sync(SyncDirection direction);

	/// Exchanges A, the flags and AF with their shadows.
	void exchange_af();

	uint16_t value_of(Register reg) const;

	/// Sets @c reg to @c value, masked to the width of @c reg, updating both its 8- and 16-bit views.
	void set_value_of(Register reg, uint16_t value);
};

}
