#include "interpreter.hpp"
#include "eval_env.hpp"
#include "call_dispatcher.hpp"

Value run_program(const Program& program, InterpreterHost& host, const InterpreterOptions& options) {
    StructRegistry struct_registry;
    struct_registry.load(program, host);
    FunctionTable function_table;
    function_table.load(program, struct_registry, host);

    const FuncDef* main_def = function_table.resolve("main", 0);
    if(!main_def) {
        host.error(ErrorType::NAME_ERROR, "No main() function was found");
    }

    EvalEnv env{host, struct_registry, function_table, Environment(), options.trace};
    FrameGuard outer_frame(env.environment);
    return call_function(env, "main", {}, main_def->source_span);
}
