#pragma once
#include "top_level.hpp"
#include "values.hpp"
#include "interpreter_host.hpp"
#include <unordered_map>

struct StructField {
    std::string name;
    Type type;
    Value default_val;
};

struct StructDefinition {
    std::string name;
    // In declaration order
    std::vector<StructField> fields;
};

class StructRegistry {
private:
    std::unordered_map<std::string, StructDefinition> struct_defs;
    void add_struct(const TopLevelItem::StructDef& struct_def, const SourceSpan& span, InterpreterHost& host);
    void check_field_types(const StructDefinition& def, const SourceSpan& span, InterpreterHost& host) const;
public:
    // Registers every struct declared in [program]. Field types may name structs declared later
    // in the file. Duplicate structs or fields are NAME_ERRORs, unknown field types TYPE_ERRORs.
    void load(const Program& program, InterpreterHost& host);
    bool contains(const std::string& struct_name) const;
    const StructDefinition* get(const std::string& struct_name) const;
    const StructField* get_field(const std::string& struct_name, const std::string& field_name) const;
    // A fresh instance whose fields hold their defaults. Never shares field storage with another
    // instance. Precondition: contains(struct_name)
    std::shared_ptr<StructInstance> instantiate(const std::string& struct_name) const;
};

// Whether variables, parameters and fields may be declared with [type]:
// int, string, bool or a registered struct
bool type_declarable(const StructRegistry& registry, const Type& type);
