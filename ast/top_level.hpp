#pragma once
#include "stmts.hpp"

struct TopLevelItem {
    struct VarDecl {
        std::string name;
        Type type;
    };
    struct StructDef {
        std::string name;
        std::vector<VarDecl> fields;
    };
    struct Func {
        std::string name;
        // Absent when the source omits it; the function table rejects such functions
        std::optional<Type> return_type;
        std::vector<VarDecl> params;
        std::vector<std::shared_ptr<Stmt>> body;
    };
    SourceSpan source_span;
    std::variant<std::shared_ptr<StructDef>, std::shared_ptr<Func>> t;
};

struct Program {
    std::vector<TopLevelItem> top_level_items;
};
