#include "types.hpp"
#include "pattern_matching_boilerplate.hpp"

Type type_from_name(const std::string& name) {
    if(name == "int") {
        return Type{Type::TInt{}};
    }
    if(name == "string") {
        return Type{Type::TString{}};
    }
    if(name == "bool") {
        return Type{Type::TBool{}};
    }
    if(name == "void") {
        return Type{Type::TVoid{}};
    }
    return Type{Type::TStruct{name}};
}

std::string type_name(const Type& type) {
    return std::visit(Overload{
        [](const Type::TInt&) -> std::string { return "int"; },
        [](const Type::TString&) -> std::string { return "string"; },
        [](const Type::TBool&) -> std::string { return "bool"; },
        [](const Type::TNil&) -> std::string { return "nil"; },
        [](const Type::TVoid&) -> std::string { return "void"; },
        [](const Type::TStruct& s) -> std::string { return s.name; }
    }, type.t);
}

bool type_is_int(const Type& type) {
    return std::holds_alternative<Type::TInt>(type.t);
}

bool type_is_bool(const Type& type) {
    return std::holds_alternative<Type::TBool>(type.t);
}

bool type_is_string(const Type& type) {
    return std::holds_alternative<Type::TString>(type.t);
}

bool type_is_nil(const Type& type) {
    return std::holds_alternative<Type::TNil>(type.t);
}

bool type_is_void(const Type& type) {
    return std::holds_alternative<Type::TVoid>(type.t);
}

bool type_is_struct(const Type& type) {
    return std::holds_alternative<Type::TStruct>(type.t);
}

bool type_is_scalar(const Type& type) {
    return type_is_int(type) || type_is_bool(type) || type_is_string(type);
}
