//
//  Struct.cpp
//  Z80Step
//
//  Created by Thomas Harte on 13/03/2020.
//  Copyright © 2020 Thomas Harte. All rights reserved.
//

#include "Reflection/Struct.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <sstream>
#include <type_traits>

#define ForAllInts(x)	\
	x(uint8_t);			\
	x(int8_t);			\
	x(uint16_t);		\
	x(int16_t);			\
	x(uint32_t);		\
	x(int32_t);			\
	x(uint64_t);		\
	x(int64_t);

namespace {

bool is_integral(const std::type_info *type) {
	return
		*type == typeid(uint8_t) || *type == typeid(int8_t) ||
		*type == typeid(uint16_t) || *type == typeid(int16_t) ||
		*type == typeid(uint32_t) || *type == typeid(int32_t) ||
		*type == typeid(uint64_t) || *type == typeid(int64_t);
}

bool is_signed(const std::type_info *type) {
	return
		*type == typeid(int8_t) ||
		*type == typeid(int16_t) ||
		*type == typeid(int32_t) ||
		*type == typeid(int64_t);
}

size_t size_of(const std::type_info *type) {
#define TestType(x)	if(*type == typeid(x)) return sizeof(x);
	ForAllInts(TestType);
#undef TestType

	return 0;
}

std::string lowercase(std::string value) {
	std::transform(value.begin(), value.end(), value.begin(), [] (char c) {
		return char(tolower(c));
	});
	return value;
}

}

// MARK: - Setters

template <> bool Z80Step::Reflection::set(Struct &target, const std::string &name, int value) {
	return set<int64_t>(target, name, value);
}

template <> bool Z80Step::Reflection::set(Struct &target, const std::string &name, int64_t value) {
	const auto target_type = target.type_of(name);
	if(!target_type) return false;

	// A registered enum accepts only values that name one of its members.
	if(Enum::size(*target_type)) {
		if(value < 0 || size_t(value) >= Enum::size(*target_type)) {
			return false;
		}
		const int value32 = int(value);
		target.set(name, &value32);
		return true;
	}

	if(*target_type == typeid(int)) {
		const int value32 = int(value);
		target.set(name, &value32);
		return true;
	}

#define SetInt(x)	if(*target_type == typeid(x)) { x truncated_value = x(value); target.set(name, &truncated_value); return true; }
	ForAllInts(SetInt);
#undef SetInt

	return false;
}

template <> bool Z80Step::Reflection::set(Struct &target, const std::string &name, const std::string &value) {
	const auto target_type = target.type_of(name);
	if(!target_type) return false;

	// From here on, make an attempt to convert to a named enum.
	if(Enum::name(*target_type).empty()) {
		return false;
	}

	const int enum_value = Enum::from_string(*target_type, value);
	if(enum_value < 0) {
		return false;
	}
	target.set(name, &enum_value);

	return true;
}

template <> bool Z80Step::Reflection::set(Struct &target, const std::string &name, const char *value) {
	const std::string string(value);
	return set<const std::string &>(target, name, string);
}

template <> bool Z80Step::Reflection::set(Struct &target, const std::string &name, bool value) {
	const auto target_type = target.type_of(name);
	if(!target_type) return false;

	if(*target_type == typeid(bool)) {
		target.set(name, &value);
		return true;
	}

	return false;
}

// MARK: - Fuzzy setter

bool Z80Step::Reflection::fuzzy_set(Struct &target, const std::string &name, const std::string &value) {
	const auto target_type = target.type_of(name);
	if(!target_type) return false;

	// If the target is a registered enum, try to convert the value. Failing that,
	// try to match without case sensitivity.
	if(Enum::size(*target_type)) {
		int from_string = Enum::from_string(*target_type, value);
		if(from_string < 0) {
			from_string = Enum::from_string(*target_type, value, false);
		}
		if(from_string < 0) {
			return false;
		}

		target.set(name, &from_string);
		return true;
	}

	if(*target_type == typeid(bool)) {
		const auto lower = lowercase(value);
		if(lower == "yes" || lower == "true" || lower == "1") {
			return set(target, name, true);
		}
		if(lower == "no" || lower == "false" || lower == "0") {
			return set(target, name, false);
		}
		return false;
	}

	if(is_integral(target_type)) {
		if(value.empty()) return false;

		char *end = nullptr;
		errno = 0;
		const long long parsed = strtoll(value.c_str(), &end, 0);
		if(errno || *end) return false;
		return set(target, name, int64_t(parsed));
	}

	return false;
}

// MARK: - Getters

template <typename Type> bool Z80Step::Reflection::get(const Struct &target, const std::string &name, Type &value) {
	const auto target_type = target.type_of(name);
	if(!target_type) return false;

	// If type is a direct match, copy.
	if(*target_type == typeid(Type)) {
		memcpy(&value, target.get(name), sizeof(Type));
		return true;
	}

	// If the type is a registered enum and the value type is int, copy.
	if constexpr (std::is_integral<Type>::value && sizeof(Type) == sizeof(int)) {
		if(!Enum::name(*target_type).empty()) {
			memcpy(&value, target.get(name), sizeof(int));
			return true;
		}
	}

	// If the type is an int that is larger than the stored type and matches the signedness, cast upward.
	if constexpr (std::is_integral<Type>::value && !std::is_same<Type, bool>::value) {
		if(is_integral(target_type)) {
			const bool target_is_signed = is_signed(target_type);
			const size_t target_size = size_of(target_type);

			// An unsigned type can map to any larger type, signed or unsigned;
			// a signed type can map to a larger type only if it also is signed.
			if(sizeof(Type) > target_size && (!target_is_signed || std::is_signed<Type>::value)) {
				const auto address = target.get(name);

#define Map(x)	if(*target_type == typeid(x)) { value = static_cast<Type>(*reinterpret_cast<const x *>(address)); }
				ForAllInts(Map);
#undef Map
				return true;
			}
		}
	}

	return false;
}

template <typename Type> Type Z80Step::Reflection::get(const Struct &target, const std::string &name) {
	Type value{};
	get(target, name, value);
	return value;
}

template bool Z80Step::Reflection::get<bool>(const Struct &, const std::string &, bool &);
template bool Z80Step::Reflection::get<int>(const Struct &, const std::string &, int &);
template bool Z80Step::Reflection::get<int64_t>(const Struct &, const std::string &, int64_t &);
template bool Z80Step::Reflection::get<bool>(const Struct &, const std::string &);
template int Z80Step::Reflection::get<int>(const Struct &, const std::string &);
template int64_t Z80Step::Reflection::get<int64_t>(const Struct &, const std::string &);

// MARK: - Description

std::string Z80Step::Reflection::Struct::description() const {
	std::ostringstream stream;

	stream << "{";

	bool is_first = true;
	for(const auto &key: all_keys()) {
		if(!is_first) stream << ", ";
		is_first = false;
		stream << key << ": ";

		const auto type = type_of(key);

		// Output bools as yes/no.
		if(*type == typeid(bool)) {
			stream << (::Z80Step::Reflection::get<bool>(*this, key) ? "yes" : "no");
			continue;
		}

		// Output the current value of any enums.
		if(!Enum::name(*type).empty()) {
			stream << Enum::to_string(*type, ::Z80Step::Reflection::get<int>(*this, key));
			continue;
		}

		// Output ints of all sizes in decimal.
		if(is_integral(type)) {
			stream << ::Z80Step::Reflection::get<int64_t>(*this, key);
		}
	}

	stream << "}";

	return stream.str();
}
