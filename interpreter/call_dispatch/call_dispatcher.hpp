#pragma once
#include "eval_env.hpp"

// Calls a built-in or user function. Arguments are evaluated in the caller's frame.
Value call_function(
    EvalEnv& env,
    const std::string& func_name,
    const std::vector<std::shared_ptr<Expr>>& args,
    const SourceSpan& span);

bool is_builtin(const std::string& func_name);
// print, inputi and inputs
Value call_builtin(
    EvalEnv& env,
    const std::string& func_name,
    const std::vector<std::shared_ptr<Expr>>& args,
    const SourceSpan& span);
