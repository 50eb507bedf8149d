#pragma once
#include "interpreter_host.hpp"
#include "struct_registry.hpp"
#include "function_table.hpp"
#include "environment.hpp"

// State shared by every statement and expression of one program run
struct EvalEnv {
    InterpreterHost& host;
    const StructRegistry& struct_registry;
    const FunctionTable& function_table;
    Environment environment;
    // Echo each statement to stderr before running it
    bool trace = false;
};
