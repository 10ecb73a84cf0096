//
//  ClockReceiver.hpp
//  Z80Step
//
//  Created by Thomas Harte on 22/07/2017.
//  Copyright © 2017 Thomas Harte. All rights reserved.
//

#pragma once

#include <cstdint>

namespace Z80Step {

/*!
	Provides a class that wraps a plain int, providing most of the basic arithmetic and
	Boolean operators, but forcing callers and receivers to be explicit as to usage.
*/
template <class T> class WrappedInt {
public:
	using IntType = int64_t;

	constexpr WrappedInt(IntType l) noexcept : length_(l) {}
	constexpr WrappedInt() noexcept : length_(0) {}

	T &operator +=(const T &rhs) {
		length_ += rhs.length_;
		return *static_cast<T *>(this);
	}

	constexpr T operator +(const T &rhs) const			{	return T(length_ + rhs.length_);	}
	constexpr T operator -(const T &rhs) const			{	return T(length_ - rhs.length_);	}

	constexpr bool operator <(const T &rhs) const		{	return length_ < rhs.length_;		}
	constexpr bool operator >(const T &rhs) const		{	return length_ > rhs.length_;		}
	constexpr bool operator <=(const T &rhs) const		{	return length_ <= rhs.length_;		}
	constexpr bool operator >=(const T &rhs) const		{	return length_ >= rhs.length_;		}
	constexpr bool operator ==(const T &rhs) const		{	return length_ == rhs.length_;		}
	constexpr bool operator !=(const T &rhs) const		{	return length_ != rhs.length_;		}

	constexpr bool operator !() const					{	return !length_;					}
	// bool operator () is not supported because it offers an implicit cast to int, which is prone silently to permit misuse

	/// @returns The underlying int, in its native form.
	constexpr IntType as_integral() const { return length_; }

	// operator int() is deliberately not provided, to avoid accidental subtitution of
	// classes that use this template.

protected:
	IntType length_;
};

/// Describes an integer number of whole cycles; on the Z80 these are T-states.
class Cycles: public WrappedInt<Cycles> {
public:
	constexpr Cycles(IntType l) noexcept : WrappedInt<Cycles>(l) {}
	constexpr Cycles() noexcept : WrappedInt<Cycles>() {}
};

}
