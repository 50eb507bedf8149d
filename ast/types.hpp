#pragma once
#include <string>
#include <variant>

// Types as they are written in declarations, and as they are carried by runtime values.
// [TNil] is never written by the user; it is the type of the nil literal.
struct Type {
    struct TInt {};
    struct TString {};
    struct TBool {};
    struct TNil {};
    struct TVoid {};
    struct TStruct { std::string name; };
    std::variant<TInt, TString, TBool, TNil, TVoid, TStruct> t;
};

// "int", "string", "bool" and "void" name the builtin types; anything else names a struct
Type type_from_name(const std::string& name);
std::string type_name(const Type& type);

bool type_is_int(const Type& type);
bool type_is_bool(const Type& type);
bool type_is_string(const Type& type);
bool type_is_nil(const Type& type);
bool type_is_void(const Type& type);
bool type_is_struct(const Type& type);
bool type_is_scalar(const Type& type);
