#include "function_table.hpp"
#include <unordered_set>

void FunctionTable::check_signature(
    const TopLevelItem::Func& func,
    const SourceSpan& span,
    const StructRegistry& struct_registry,
    InterpreterHost& host) const {
    if(!func.return_type) {
        host.error(ErrorType::TYPE_ERROR, "No return type for function " + func.name, span);
    }
    if(!type_is_void(*func.return_type) && !type_declarable(struct_registry, *func.return_type)) {
        host.error(ErrorType::TYPE_ERROR,
            "Function " + func.name + " has unknown return type " + type_name(*func.return_type), span);
    }
    std::unordered_set<std::string> param_names;
    for(const TopLevelItem::VarDecl& param: func.params) {
        if(!type_declarable(struct_registry, param.type)) {
            host.error(ErrorType::TYPE_ERROR,
                "Parameter " + param.name + " can not be of type " + type_name(param.type), span);
        }
        if(!param_names.insert(param.name).second) {
            host.error(ErrorType::NAME_ERROR,
                "Duplicate parameter " + param.name + " in function " + func.name, span);
        }
    }
}

void FunctionTable::load(const Program& program, const StructRegistry& struct_registry, InterpreterHost& host) {
    for(const TopLevelItem& item: program.top_level_items) {
        auto* func = std::get_if<std::shared_ptr<TopLevelItem::Func>>(&item.t);
        if(!func) {
            continue;
        }
        check_signature(**func, item.source_span, struct_registry, host);
        size_t arity = (*func)->params.size();
        auto& overloads = funcs[(*func)->name];
        if(overloads.contains(arity)) {
            host.error(ErrorType::NAME_ERROR,
                "Duplicate definition of function " + (*func)->name + " taking "
                    + std::to_string(arity) + " params",
                item.source_span);
        }
        overloads.emplace(arity, FuncDef{*func, item.source_span});
    }
}

const FuncDef* FunctionTable::resolve(const std::string& name, size_t arity) const {
    auto it = funcs.find(name);
    if(it == funcs.end()) {
        return nullptr;
    }
    auto overload_it = it->second.find(arity);
    if(overload_it == it->second.end()) {
        return nullptr;
    }
    return &overload_it->second;
}

bool FunctionTable::has_name(const std::string& name) const {
    return funcs.contains(name);
}
