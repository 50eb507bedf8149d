#pragma once
#include "eval_env.hpp"

enum class ExecStatus { CONTINUE, RETURN };

// [value] only means something when [status] is RETURN
struct ExecResult {
    ExecStatus status;
    Value value;
};

// Runs [stmts] in a fresh block. Stops at the first statement that returns.
ExecResult run_statements(EvalEnv& env, const std::vector<std::shared_ptr<Stmt>>& stmts);
ExecResult run_statement(EvalEnv& env, const Stmt& stmt);
Value eval_expr(EvalEnv& env, const Expr& expr);
