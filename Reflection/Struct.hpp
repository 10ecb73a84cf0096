//
//  Struct.hpp
//  Z80Step
//
//  Created by Thomas Harte on 06/03/2020.
//  Copyright © 2020 Thomas Harte. All rights reserved.
//

#pragma once

#include <cstring>
#include <string>
#include <sys/types.h>
#include <typeindex>
#include <typeinfo>
#include <type_traits>
#include <unordered_map>
#include <vector>

#include "Reflection/Enum.hpp"

namespace Z80Step::Reflection {

#define DeclareField(Name) declare(&Name, #Name)

struct Struct {
	virtual std::vector<std::string> all_keys() const = 0;
	virtual const std::type_info *type_of(const std::string &name) const = 0;
	virtual void set(const std::string &name, const void *value) = 0;
	virtual void *get(const std::string &name) = 0;
	virtual const void *get(const std::string &name) const {
		return const_cast<Struct *>(this)->get(name);
	}
	virtual std::vector<std::string> values_for(const std::string &name) const = 0;
	virtual ~Struct() {}

	/*!
		@returns A string describing this struct. This string has no guaranteed layout, may not be
			sufficiently formed for a formal language parser, etc.
	*/
	std::string description() const;
};

/*!
	Attempts to set the property @c name to @c value ; will perform limited type conversions.

	@returns @c true if the property was successfully set; @c false otherwise.
*/
template <typename Type> bool set(Struct &target, const std::string &name, Type value);

/*!
	Setting an int:

		* to an int copies the int;
		* to another integral type, truncates or promotes the int; and
		* to a registered enum, copies the int if it names a member of the enum.
*/
template <> bool set(Struct &target, const std::string &name, int64_t value);
template <> bool set(Struct &target, const std::string &name, int value);

/*!
	Setting a string:

		* to a string, copies the string;
		* to an enum, if the string names a member of the enum, sets the value.
*/
template <> bool set(Struct &target, const std::string &name, const std::string &value);
template <> bool set(Struct &target, const std::string &name, const char *value);

/*!
	Setting a bool:

		* to a bool, copies the value.
*/
template <> bool set(Struct &target, const std::string &name, bool value);

/*!
	Fuzzy-set attempts to set any property based on a string value. This is intended to allow input provided by the user.

	It will:
		* if the target is a bool, map true, false, yes, no, 1 and 0, without regard to case;
		* if the target is an integer, parse like strtoll, requiring that the whole of @c value be consumed; or
		* if the target is a reflective enum, match to enum members, falling back on a case-insensitive comparison.

	@returns @c true if the property was successfully set; @c false otherwise.
*/
bool fuzzy_set(Struct &target, const std::string &name, const std::string &value);

/*!
	Attempts to get the property @c name to @c value ; will perform limited type conversions.

	@returns @c true if the property was successfully read; @c false otherwise.
*/
template <typename Type> bool get(const Struct &target, const std::string &name, Type &value);

/*!
	@returns The value of property @c name if it was successfully read; a default-constructed instance of Type otherwise.
*/
template <typename Type> Type get(const Struct &target, const std::string &name);

template <typename Owner> class StructImpl: public Struct {
public:
	/*!
		@returns a pointer to the storage registered for the field @c name, or @c nullptr if there is no such field.
	*/
	void *get(const std::string &name) final {
		const auto iterator = contents_.find(name);
		if(iterator == contents_.end()) return nullptr;
		return reinterpret_cast<uint8_t *>(this) + iterator->second.offset;
	}

	/*!
		Stores @c value to the offset registered for the field @c name.

		It is the caller's responsibility to provide an appropriate type of data.
	*/
	void set(const std::string &name, const void *value) final {
		const auto iterator = contents_.find(name);
		if(iterator == contents_.end()) return;
		memcpy(reinterpret_cast<uint8_t *>(this) + iterator->second.offset, value, iterator->second.size);
	}

	/*!
		@returns @c type_info for the field @c name.
	*/
	const std::type_info *type_of(const std::string &name) const final {
		const auto iterator = contents_.find(name);
		if(iterator == contents_.end()) return nullptr;
		return iterator->second.type;
	}

	/*!
		@returns a list of the valid enum value names for field @c name if it is a declared enum field of this struct;
			the empty list otherwise.
	*/
	std::vector<std::string> values_for(const std::string &name) const final {
		const auto type = type_of(name);
		if(!type) return {};
		return Enum::all_values(*type);
	}

	/*!
		@returns A vector of all declared fields for this struct, in order of declaration.
	*/
	std::vector<std::string> all_keys() const final {
		return keys_;
	}

protected:
	/*
		Reflective structs should declare all fields; specifically they should call:

			declare(&field1, "field1");
			declare(&field2, "field2");

		or use the DeclareField macro. Fields are registered in class storage, so callers
		can use needs_declare() to determine whether a class of this type has already
		established its reflective fields.
	*/
	template <typename Type> void declare(Type *t, const std::string &name) {
		static_assert(std::is_trivially_copyable<Type>::value, "Only trivially-copyable fields may be declared");
		contents_.emplace(
			name,
			Field(typeid(Type), reinterpret_cast<uint8_t *>(t) - reinterpret_cast<uint8_t *>(this), sizeof(Type)));
		keys_.push_back(name);
	}

	/*!
		@returns @c true if this subclass of @c Struct has not yet declared any fields.
	*/
	bool needs_declare() {
		return contents_.empty();
	}

private:
	struct Field {
		const std::type_info *type;
		ssize_t offset;
		size_t size;
		Field(const std::type_info &type, ssize_t offset, size_t size) :
			type(&type), offset(offset), size(size) {}
	};
	static inline std::unordered_map<std::string, Field> contents_;
	static inline std::vector<std::string> keys_;
};

}
