#pragma once

#include "lib_utils/small_map.hpp"
#include <string>
#include <vector>

// Configuration-file reader. Records use RapidJSON (see lib_teletext/serializer).
namespace json {

struct Value {
		enum class Type {
			Null,
			String,
			Object,
			Array,
			Integer,
			Boolean,
		};

		Type type = Type::Null;

		////////////////////////////////////////
		// type == Type::String
		std::string stringValue;

		operator std::string() const {
			enforceType(Type::String);
			return stringValue;
		}

		////////////////////////////////////////
		// type == Type::Object
		SmallMap<std::string, Value> objectValue;

		Value const& operator[] (const char* name) const;

		bool has(const char* name) const {
			return type == Type::Object && objectValue.contains(name);
		}

		////////////////////////////////////////
		// type == Type::Array
		std::vector<Value> arrayValue;

		Value const& operator[] (int i) const {
			enforceType(Type::Array);
			return arrayValue.at(i);
		}

		////////////////////////////////////////
		// type == Type::Boolean
		bool boolValue {};

		////////////////////////////////////////
		// type == Type::Integer
		int intValue {};

		operator int() const {
			enforceType(Type::Integer);
			return intValue;
		}

		const char* typeName() const;
		void enforceType(Type expected) const;
};

Value parse(const std::string &s);
}
