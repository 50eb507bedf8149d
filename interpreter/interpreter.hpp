#pragma once
#include "top_level.hpp"
#include "values.hpp"
#include "interpreter_host.hpp"

struct InterpreterOptions {
    bool trace = false;
};

// Loads the structs and functions of [program], then calls main(). Returns whatever main
// returns. Errors are raised as [InterpreterError] through [host].
Value run_program(const Program& program, InterpreterHost& host, const InterpreterOptions& options = {});
