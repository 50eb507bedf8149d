#pragma once
#include "top_level.hpp"
#include "struct_registry.hpp"
#include "interpreter_host.hpp"
#include <unordered_map>

struct FuncDef {
    std::shared_ptr<TopLevelItem::Func> func;
    SourceSpan source_span;
};

// User functions keyed by (name, parameter count). The same name may be declared several times
// with different parameter counts. Built-ins never live here.
class FunctionTable {
private:
    std::unordered_map<std::string, std::unordered_map<size_t, FuncDef>> funcs;
    void check_signature(const TopLevelItem::Func& func, const SourceSpan& span,
        const StructRegistry& struct_registry, InterpreterHost& host) const;
public:
    // Precondition: [struct_registry] has already loaded [program]
    void load(const Program& program, const StructRegistry& struct_registry, InterpreterHost& host);
    // nullptr if no function [name] takes [arity] parameters
    const FuncDef* resolve(const std::string& name, size_t arity) const;
    bool has_name(const std::string& name) const;
};
