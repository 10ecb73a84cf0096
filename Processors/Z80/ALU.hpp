//
//  ALU.hpp
//  Z80Step
//
//  Created by Thomas Harte on 19/10/2026.
//  Copyright © 2026 Thomas Harte. All rights reserved.
//

#pragma once

#include <cstdint>

#include "Processors/Z80/Registers.hpp"

/*!
	Flag computation for the Z80's arithmetic and logical instructions.

	Each function sets exactly the flags documented for its instruction class, leaving all others
	untouched, and returns the result where there is one. None has any other side effect.
*/
namespace Z80Step::CPU::ALU {

/// @returns 1 if @c value has an even number of set bits; 0 otherwise.
uint8_t parity(uint8_t value);

/// Copies bits 3 and 5 of @c value to the two undocumented flags.
void set_undocumented(Flags &flags, uint8_t value);

/// Sets sign and zero from @c value, plus the undocumented flags.
void set_sign_zero(Flags &flags, uint8_t value);

// MARK: - 8-bit arithmetic.

/*!
	Adds @c rhs to @c lhs. @c rhs may be negative, in which case this is a subtraction and
	carry, half carry and overflow are computed as borrows.

	N is cleared.
*/
uint8_t add8(Flags &flags, uint8_t lhs, int rhs);

/*!
	Subtracts @c rhs from @c lhs as an addition of -rhs; N is set.
*/
uint8_t sub8(Flags &flags, uint8_t lhs, int rhs);

/*!
	Add and subtract with carry: the carry flag is added to @c rhs before the ADD or SUB.

	Because the carry is folded into the operand first, an operand of 0x7f with carry set is treated
	as -128 for the purposes of overflow, and an operand of 0xff with carry set is treated as
	having no low nibble for the purposes of half carry.
*/
uint8_t adc8(Flags &flags, uint8_t lhs, uint8_t rhs);
uint8_t sbc8(Flags &flags, uint8_t lhs, uint8_t rhs);

/// Compares @c rhs with @c lhs: sets flags as per SUB, discarding the result.
void cp8(Flags &flags, uint8_t lhs, uint8_t rhs);

// MARK: - 8-bit logic.

uint8_t and8(Flags &flags, uint8_t lhs, uint8_t rhs);
uint8_t xor8(Flags &flags, uint8_t lhs, uint8_t rhs);
uint8_t or8(Flags &flags, uint8_t lhs, uint8_t rhs);

// MARK: - Increment and decrement.

/// @returns @c value + 1; carry is unaffected.
uint8_t inc8(Flags &flags, uint8_t value);

/// @returns @c value - 1; carry is unaffected.
uint8_t dec8(Flags &flags, uint8_t value);

// MARK: - 16-bit arithmetic.

/*!
	ADD HL, rr. Carry is set from bit 16, half carry from bit 11 and the undocumented flags
	from bits 11 and 13 of the result. Sign, zero and parity are unaffected.
*/
uint16_t add16(Flags &flags, uint16_t lhs, uint16_t rhs);

// MARK: - Accumulator rotates.

constexpr uint8_t rotate_left(uint8_t value) {
	return uint8_t((value << 1) | (value >> 7));
}

constexpr uint8_t rotate_right(uint8_t value) {
	return uint8_t((value >> 1) | (value << 7));
}

uint8_t rlca(Flags &flags, uint8_t a);
uint8_t rrca(Flags &flags, uint8_t a);
uint8_t rla(Flags &flags, uint8_t a);
uint8_t rra(Flags &flags, uint8_t a);

// MARK: - Miscellaneous accumulator operations.

/*!
	@returns The BCD-corrected form of @c a given the current half carry and carry flags,
		having set flags per @c daa_flags.
*/
uint8_t daa(Flags &flags, uint8_t a);

/*!
	Sets the flags that follow a DAA of @c original to @c adjusted: carry if the correction
	was 0x60 or 0x66, half carry if a low-nibble correction produced a nibble carry, parity, sign,
	zero and the undocumented flags from @c adjusted. N is unaffected.
*/
void daa_flags(Flags &flags, uint8_t original, uint8_t adjusted);

/// @returns The ones' complement of @c a; sets half carry and N.
uint8_t cpl(Flags &flags, uint8_t a);

void scf(Flags &flags, uint8_t a);
void ccf(Flags &flags, uint8_t a);

}
