#include "struct_registry.hpp"
#include "pattern_matching_boilerplate.hpp"
#include <cassert>
#include <unordered_set>

bool type_declarable(const StructRegistry& registry, const Type& type) {
    return std::visit(Overload{
        [&](const Type::TStruct& s) { return registry.contains(s.name); },
        [&](const auto&) { return type_is_scalar(type); }
    }, type.t);
}

void StructRegistry::add_struct(
    const TopLevelItem::StructDef& struct_def,
    const SourceSpan& span,
    InterpreterHost& host) {
    if(struct_defs.contains(struct_def.name)) {
        host.error(ErrorType::NAME_ERROR, "Duplicate struct definition: " + struct_def.name, span);
    }
    StructDefinition def;
    def.name = struct_def.name;
    std::unordered_set<std::string> field_names;
    for(const TopLevelItem::VarDecl& field: struct_def.fields) {
        if(!field_names.insert(field.name).second) {
            host.error(ErrorType::NAME_ERROR,
                "Duplicate field name " + field.name + " in struct " + struct_def.name, span);
        }
        def.fields.push_back(StructField{field.name, field.type, default_value(field.type)});
    }
    struct_defs.emplace(def.name, std::move(def));
}

void StructRegistry::check_field_types(
    const StructDefinition& def,
    const SourceSpan& span,
    InterpreterHost& host) const {
    for(const StructField& field: def.fields) {
        if(!type_declarable(*this, field.type)) {
            host.error(ErrorType::TYPE_ERROR,
                "Field " + field.name + " of struct " + def.name + " has unknown type " + type_name(field.type),
                span);
        }
    }
}

void StructRegistry::load(const Program& program, InterpreterHost& host) {
    std::vector<std::pair<std::string, SourceSpan>> loaded;
    for(const TopLevelItem& item: program.top_level_items) {
        if(auto* struct_def = std::get_if<std::shared_ptr<TopLevelItem::StructDef>>(&item.t)) {
            add_struct(**struct_def, item.source_span, host);
            loaded.emplace_back((*struct_def)->name, item.source_span);
        }
    }
    // Field types are only checked once every struct name is known
    for(const auto& [struct_name, span]: loaded) {
        check_field_types(struct_defs.at(struct_name), span, host);
    }
}

bool StructRegistry::contains(const std::string& struct_name) const {
    return struct_defs.contains(struct_name);
}

const StructDefinition* StructRegistry::get(const std::string& struct_name) const {
    auto it = struct_defs.find(struct_name);
    if(it == struct_defs.end()) {
        return nullptr;
    }
    return &it->second;
}

const StructField* StructRegistry::get_field(const std::string& struct_name, const std::string& field_name) const {
    const StructDefinition* def = get(struct_name);
    if(!def) {
        return nullptr;
    }
    for(const StructField& field: def->fields) {
        if(field.name == field_name) {
            return &field;
        }
    }
    return nullptr;
}

std::shared_ptr<StructInstance> StructRegistry::instantiate(const std::string& struct_name) const {
    const StructDefinition* def = get(struct_name);
    assert(def != nullptr);
    auto instance = std::make_shared<StructInstance>();
    instance->struct_name = def->name;
    for(const StructField& field: def->fields) {
        instance->fields.emplace(field.name, field.default_val);
    }
    return instance;
}
