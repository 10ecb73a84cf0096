//
//  ALU.cpp
//  Z80Step
//
//  Created by Thomas Harte on 19/10/2026.
//  Copyright © 2026 Thomas Harte. All rights reserved.
//

#include "Processors/Z80/ALU.hpp"

using namespace Z80Step::CPU;

namespace {

/// Sign extends the 8-bit @c value to nine bits.
constexpr int sign_extend9(int value) {
	return value | ((value & 0x80) << 1);
}

uint8_t logical(Flags &flags, uint8_t result, uint8_t half_carry) {
	ALU::set_sign_zero(flags, result);
	flags.parity_overflow = ALU::parity(result);
	flags.half_carry = half_carry;
	flags.subtract = 0;
	flags.carry = 0;
	return result;
}

void set_rotate_flags(Flags &flags, uint8_t result, uint8_t carry) {
	flags.carry = carry;
	flags.half_carry = flags.subtract = 0;
	ALU::set_undocumented(flags, result);
}

}

uint8_t ALU::parity(uint8_t value) {
	value ^= value >> 4;
	value ^= value >> 2;
	value ^= value >> 1;
	return (value & 1) ^ 1;
}

void ALU::set_undocumented(Flags &flags, uint8_t value) {
	flags.bit3 = (value >> 3) & 1;
	flags.bit5 = (value >> 5) & 1;
}

void ALU::set_sign_zero(Flags &flags, uint8_t value) {
	flags.sign = value >> 7;
	flags.zero = value ? 0 : 1;
	set_undocumented(flags, value);
}

// MARK: - 8-bit arithmetic.

uint8_t ALU::add8(Flags &flags, uint8_t lhs, int rhs) {
	const int sum = lhs + rhs;
	const auto result = uint8_t(sum);

	const int sign = rhs < 0 ? -1 : 1;
	const int magnitude = rhs < 0 ? -rhs : rhs;

	flags.carry = (sum & 0x100) ? 1 : 0;
	flags.half_carry = (((lhs & 0xf) + sign * (magnitude & 0xf)) & 0x10) ? 1 : 0;

	// Overflow: bits 7 and 8 of the 9-bit signed sum differ.
	const int extended = (sign_extend9(lhs) + sign * sign_extend9(magnitude & 0xff)) & 0x1ff;
	flags.parity_overflow = ((extended >> 7) ^ (extended >> 8)) & 1;

	flags.subtract = 0;
	set_sign_zero(flags, result);
	return result;
}

uint8_t ALU::sub8(Flags &flags, uint8_t lhs, int rhs) {
	const uint8_t result = add8(flags, lhs, -rhs);
	flags.subtract = 1;
	return result;
}

uint8_t ALU::adc8(Flags &flags, uint8_t lhs, uint8_t rhs) {
	return add8(flags, lhs, rhs + flags.carry);
}

uint8_t ALU::sbc8(Flags &flags, uint8_t lhs, uint8_t rhs) {
	return sub8(flags, lhs, rhs + flags.carry);
}

void ALU::cp8(Flags &flags, uint8_t lhs, uint8_t rhs) {
	sub8(flags, lhs, rhs);
}

// MARK: - 8-bit logic.

uint8_t ALU::and8(Flags &flags, uint8_t lhs, uint8_t rhs) {
	return logical(flags, lhs & rhs, 1);
}

uint8_t ALU::xor8(Flags &flags, uint8_t lhs, uint8_t rhs) {
	return logical(flags, lhs ^ rhs, 0);
}

uint8_t ALU::or8(Flags &flags, uint8_t lhs, uint8_t rhs) {
	return logical(flags, lhs | rhs, 0);
}

// MARK: - Increment and decrement.

uint8_t ALU::inc8(Flags &flags, uint8_t value) {
	const auto result = uint8_t(value + 1);
	set_sign_zero(flags, result);
	flags.half_carry = (result & 0xf) == 0x0;
	flags.parity_overflow = result == 0x80;
	flags.subtract = 0;
	return result;
}

uint8_t ALU::dec8(Flags &flags, uint8_t value) {
	const auto result = uint8_t(value - 1);
	set_sign_zero(flags, result);
	flags.half_carry = (result & 0xf) == 0xf;
	flags.parity_overflow = result == 0x7f;
	flags.subtract = 1;
	return result;
}

// MARK: - 16-bit arithmetic.

uint16_t ALU::add16(Flags &flags, uint16_t lhs, uint16_t rhs) {
	const int sum = lhs + rhs;
	const auto result = uint16_t(sum);

	// Carry out of bit 11: the carry out of the low byte added to the sum of bits 8 to 11.
	const int low_carry = ((lhs & 0xff) + (rhs & 0xff)) >> 8;
	const int high_nibble = ((lhs & 0x0f00) + (rhs & 0x0f00)) >> 8;
	flags.half_carry = ((low_carry + high_nibble) & 0x10) ? 1 : 0;

	flags.carry = (sum >> 16) & 1;
	flags.subtract = 0;
	set_undocumented(flags, uint8_t(result >> 8));
	return result;
}

// MARK: - Accumulator rotates.

uint8_t ALU::rlca(Flags &flags, uint8_t a) {
	const uint8_t result = rotate_left(a);
	set_rotate_flags(flags, result, a >> 7);
	return result;
}

uint8_t ALU::rrca(Flags &flags, uint8_t a) {
	const uint8_t result = rotate_right(a);
	set_rotate_flags(flags, result, a & 1);
	return result;
}

uint8_t ALU::rla(Flags &flags, uint8_t a) {
	const auto result = uint8_t((a << 1) | flags.carry);
	set_rotate_flags(flags, result, a >> 7);
	return result;
}

uint8_t ALU::rra(Flags &flags, uint8_t a) {
	const auto result = uint8_t((a >> 1) | (flags.carry << 7));
	set_rotate_flags(flags, result, a & 1);
	return result;
}

// MARK: - Miscellaneous accumulator operations.

uint8_t ALU::daa(Flags &flags, uint8_t a) {
	const bool low_correction = (a & 0xf) > 9 || flags.half_carry;
	const int partial = a + (low_correction ? 0x06 : 0x00);
	const bool high_correction = (partial >> 4) > 9 || flags.carry;

	const auto adjusted = uint8_t(partial + (high_correction ? 0x60 : 0x00));
	daa_flags(flags, a, adjusted);
	return adjusted;
}

void ALU::daa_flags(Flags &flags, uint8_t original, uint8_t adjusted) {
	flags.carry = adjusted == uint8_t(original + 0x66) || adjusted == uint8_t(original + 0x60);

	if(adjusted == uint8_t(original + 0x06) || adjusted == uint8_t(original + 0x66)) {
		flags.half_carry = (((original & 0xf) + 0x06) & 0x10) ? 1 : 0;
	} else {
		flags.half_carry = 0;
	}

	flags.parity_overflow = parity(adjusted);
	set_sign_zero(flags, adjusted);
}

uint8_t ALU::cpl(Flags &flags, uint8_t a) {
	const auto result = uint8_t(~a);
	flags.half_carry = flags.subtract = 1;
	set_undocumented(flags, result);
	return result;
}

void ALU::scf(Flags &flags, uint8_t a) {
	flags.carry = 1;
	flags.half_carry = flags.subtract = 0;
	set_undocumented(flags, a);
}

void ALU::ccf(Flags &flags, uint8_t a) {
	flags.half_carry = flags.carry;
	flags.carry ^= 1;
	flags.subtract = 0;
	set_undocumented(flags, a);
}
