//
//  Enum.hpp
//  Z80Step
//
//  Created by Thomas Harte on 17/02/2020.
//  Copyright © 2020 Thomas Harte. All rights reserved.
//

#pragma once

#include <algorithm>
#include <cctype>
#include <string>
#include <typeindex>
#include <typeinfo>
#include <vector>
#include <unordered_map>

namespace Z80Step::Reflection {

#define ReflectableEnum(Name, ...)	\
	enum class Name { __VA_ARGS__ };	\
	constexpr static const char *__declaration##Name = #__VA_ARGS__

#define EnumDeclaration(Name) #Name, __declaration##Name

#define AnnounceEnum(Name) ::Z80Step::Reflection::Enum::declare<Name>(EnumDeclaration(Name))

/*!
	Provides a very slight version of enum reflection; it is possible to introspect only enums that
	have been registered, along with the text of their declarations, and only if those enums do not
	declare specific values for their members.

	Typical use:

		ReflectableEnum(MyEnum, A, B, C);

		...

		AnnounceEnum(MyEnum);
*/
class Enum {
public:
	/*!
		Registers @c name and the entries within @c declaration for the enum type @c Type.
		Repeated registrations of the same type are ignored.
	*/
	template <typename Type> static void declare(const char *name, const char *declaration) {
		const char *d_ptr = declaration;

		std::vector<std::string> result;
		while(true) {
			// Skip non-alphas, and exit if the terminator is found.
			while(*d_ptr && !isalpha(*d_ptr)) ++d_ptr;
			if(!*d_ptr) break;

			const auto start = d_ptr;
			while(isalpha(*d_ptr) || isdigit(*d_ptr)) ++d_ptr;
			result.emplace_back(start, size_t(d_ptr - start));
		}

		members_by_type_.emplace(std::type_index(typeid(Type)), result);
		names_by_type_.emplace(std::type_index(typeid(Type)), std::string(name));
	}

	/*!
		@returns the declared name of the enum @c Type if it has been registered; the empty string otherwise.
	*/
	template <typename Type> static const std::string &name() {
		return name(typeid(Type));
	}

	static const std::string &name(std::type_index type) {
		const auto entry = names_by_type_.find(type);
		if(entry == names_by_type_.end()) return empty_string_;
		return entry->second;
	}

	/*!
		@returns the number of members of the enum with type_info @c type if it has been registered; 0 otherwise.
	*/
	static size_t size(std::type_index type) {
		const auto entry = members_by_type_.find(type);
		if(entry == members_by_type_.end()) return 0;
		return entry->second.size();
	}

	template <typename Type> static const std::string &to_string(Type e) {
		return to_string(typeid(Type), int(e));
	}

	/// @returns The name of member @c e of the enum with type_info @c type, or the empty string if there is no such member.
	static const std::string &to_string(std::type_index type, int e) {
		const auto entry = members_by_type_.find(type);
		if(entry == members_by_type_.end() || e < 0 || size_t(e) >= entry->second.size()) return empty_string_;
		return entry->second[size_t(e)];
	}

	static const std::vector<std::string> &all_values(std::type_index type) {
		const auto entry = members_by_type_.find(type);
		if(entry == members_by_type_.end()) return empty_vector_;
		return entry->second;
	}

	template <typename Type> static const std::vector<std::string> &all_values() {
		return all_values(typeid(Type));
	}

	/*!
		@returns A value for the name @c str in the enum with type_info @c type, or @c -1 if
			the name is not found. If @c case_sensitive is @c false then names are compared
			without regard to case.
	*/
	static int from_string(std::type_index type, const std::string &str, bool case_sensitive = true) {
		const auto entry = members_by_type_.find(type);
		if(entry == members_by_type_.end()) return -1;

		const auto iterator = std::find_if(entry->second.begin(), entry->second.end(),
			[&str, case_sensitive] (const std::string &member) {
				if(case_sensitive) return member == str;
				return
					member.size() == str.size() &&
					std::equal(member.begin(), member.end(), str.begin(), [] (char lhs, char rhs) {
						return tolower(lhs) == tolower(rhs);
					});
			});
		if(iterator == entry->second.end()) return -1;
		return int(iterator - entry->second.begin());
	}

	template <typename Type> static Type from_string(const std::string &str) {
		return Type(from_string(typeid(Type), str));
	}

private:
	static inline std::unordered_map<std::type_index, std::vector<std::string>> members_by_type_;
	static inline std::unordered_map<std::type_index, std::string> names_by_type_;
	static inline const std::string empty_string_;
	static inline const std::vector<std::string> empty_vector_;
};

}
