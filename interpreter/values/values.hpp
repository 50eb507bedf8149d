#pragma once
#include "types.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <unordered_map>

struct StructInstance;

// A runtime value. The alternative held always determines the shape of the payload; turning an
// int into a bool is a separate step that builds a new value.
struct Value {
    struct VInt { int64_t v; };
    struct VString { std::string v; };
    struct VBool { bool v; };
    // [struct_type] is set when the nil occupies a struct-typed slot (a variable, parameter,
    // field or function result declared with that struct type). The nil literal leaves it empty.
    struct VNil { std::optional<std::string> struct_type; };
    // Result of calling a void function
    struct VVoid {};
    // Instances have reference semantics: copying the value shares the instance
    struct VStruct { std::shared_ptr<StructInstance> instance; };
    std::variant<VInt, VString, VBool, VNil, VVoid, VStruct> t;
};

struct StructInstance {
    std::string struct_name;
    std::unordered_map<std::string, Value> fields;
};

Value make_int(int64_t v);
Value make_string(std::string v);
Value make_bool(bool v);
Value make_nil();
Value make_void();

Type value_type(const Value& value);
// The declared type of the slot currently holding [value]. Differs from [value_type] only for a
// nil sitting in a struct-typed slot.
Type slot_type(const Value& value);

// int -> 0, string -> "", bool -> false, struct -> nil of that struct, void -> void
Value default_value(const Type& type);
// Precondition: [value] holds an int. 0 is false, anything else is true.
Value coerce_int_to_bool(const Value& value);

// Converts [value] for storage in a slot declared with [declared]. Applies the int -> bool
// coercion when [declared] is bool, and stamps nils stored in struct-typed slots with the struct
// name. Returns nullopt if the value cannot be stored there.
std::optional<Value> value_for_slot(const Type& declared, const Value& value);

// Text written by print. Void and struct instances have no textual form.
std::optional<std::string> printable_value(const Value& value);
