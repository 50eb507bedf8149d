#include "values.hpp"
#include "pattern_matching_boilerplate.hpp"
#include <cassert>

Value make_int(int64_t v) {
    return Value{Value::VInt{v}};
}

Value make_string(std::string v) {
    return Value{Value::VString{std::move(v)}};
}

Value make_bool(bool v) {
    return Value{Value::VBool{v}};
}

Value make_nil() {
    return Value{Value::VNil{std::nullopt}};
}

Value make_void() {
    return Value{Value::VVoid{}};
}

Type value_type(const Value& value) {
    return std::visit(Overload{
        [](const Value::VInt&) { return Type{Type::TInt{}}; },
        [](const Value::VString&) { return Type{Type::TString{}}; },
        [](const Value::VBool&) { return Type{Type::TBool{}}; },
        [](const Value::VNil&) { return Type{Type::TNil{}}; },
        [](const Value::VVoid&) { return Type{Type::TVoid{}}; },
        [](const Value::VStruct& s) {
            assert(s.instance != nullptr);
            return Type{Type::TStruct{s.instance->struct_name}};
        }
    }, value.t);
}

Type slot_type(const Value& value) {
    if(auto* nil = std::get_if<Value::VNil>(&value.t)) {
        if(nil->struct_type) {
            return Type{Type::TStruct{*nil->struct_type}};
        }
    }
    return value_type(value);
}

Value default_value(const Type& type) {
    return std::visit(Overload{
        [](const Type::TInt&) { return make_int(0); },
        [](const Type::TString&) { return make_string(""); },
        [](const Type::TBool&) { return make_bool(false); },
        [](const Type::TNil&) { return make_nil(); },
        [](const Type::TVoid&) { return make_void(); },
        [](const Type::TStruct& s) { return Value{Value::VNil{s.name}}; }
    }, type.t);
}

Value coerce_int_to_bool(const Value& value) {
    const auto* int_val = std::get_if<Value::VInt>(&value.t);
    assert(int_val != nullptr);
    return make_bool(int_val->v != 0);
}

std::optional<Value> value_for_slot(const Type& declared, const Value& value) {
    return std::visit(Overload{
        [&](const Type::TInt&) -> std::optional<Value> {
            if(std::holds_alternative<Value::VInt>(value.t)) {
                return value;
            }
            return std::nullopt;
        },
        [&](const Type::TString&) -> std::optional<Value> {
            if(std::holds_alternative<Value::VString>(value.t)) {
                return value;
            }
            return std::nullopt;
        },
        [&](const Type::TBool&) -> std::optional<Value> {
            if(std::holds_alternative<Value::VBool>(value.t)) {
                return value;
            }
            if(std::holds_alternative<Value::VInt>(value.t)) {
                return coerce_int_to_bool(value);
            }
            return std::nullopt;
        },
        [&](const Type::TStruct& s) -> std::optional<Value> {
            if(std::holds_alternative<Value::VNil>(value.t)) {
                return Value{Value::VNil{s.name}};
            }
            if(auto* struct_val = std::get_if<Value::VStruct>(&value.t)) {
                if(struct_val->instance->struct_name == s.name) {
                    return value;
                }
            }
            return std::nullopt;
        },
        // Only reachable through an untyped nil slot
        [&](const Type::TNil&) -> std::optional<Value> {
            if(std::holds_alternative<Value::VNil>(value.t)) {
                return make_nil();
            }
            if(std::holds_alternative<Value::VStruct>(value.t)) {
                return value;
            }
            return std::nullopt;
        },
        [&](const Type::TVoid&) -> std::optional<Value> {
            return std::nullopt;
        }
    }, declared.t);
}

std::optional<std::string> printable_value(const Value& value) {
    return std::visit(Overload{
        [](const Value::VInt& x) -> std::optional<std::string> { return std::to_string(x.v); },
        [](const Value::VString& x) -> std::optional<std::string> { return x.v; },
        [](const Value::VBool& x) -> std::optional<std::string> {
            return std::string(x.v ? "true" : "false");
        },
        // CR: nil has no agreed printed form; "nil" matches the literal
        [](const Value::VNil&) -> std::optional<std::string> { return std::string("nil"); },
        [](const Value::VVoid&) -> std::optional<std::string> { return std::nullopt; },
        [](const Value::VStruct&) -> std::optional<std::string> { return std::nullopt; }
    }, value.t);
}
