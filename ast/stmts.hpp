#pragma once
#include "expr.hpp"
#include <optional>

// Everything that can appear in a function body. Unlike [Expr], a statement produces no value;
// the only thing that leaves a statement is a return signal.

struct Stmt {
    // [type] is absent when the declaration was written without one, which is rejected when
    // the definition runs
    struct VarDef {
        std::string name;
        std::optional<Type> type;
    };
    struct Assign {
        VarPath target;
        std::shared_ptr<Expr> value;
    };
    // The expression is always an [Expr::FuncCall]
    struct Call { std::shared_ptr<Expr> call; };
    struct If {
        std::shared_ptr<Expr> cond;
        std::vector<std::shared_ptr<Stmt>> then_body;
        std::optional<std::vector<std::shared_ptr<Stmt>>> else_body;
    };
    struct For {
        std::shared_ptr<Stmt> init;
        std::shared_ptr<Expr> cond;
        std::shared_ptr<Stmt> update;
        std::vector<std::shared_ptr<Stmt>> body;
    };
    // [expr] is null for a bare "return;"
    struct Return { std::shared_ptr<Expr> expr; };
    SourceSpan source_span;
    std::variant<VarDef, Assign, Call, If, For, Return> t;
};
