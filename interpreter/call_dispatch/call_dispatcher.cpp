#include "call_dispatcher.hpp"
#include "evaluator.hpp"
#include <cassert>

static std::vector<Value> eval_args(
    EvalEnv& env,
    const TopLevelItem::Func& func,
    const std::vector<std::shared_ptr<Expr>>& args,
    const SourceSpan& span) {
    std::vector<Value> arg_vals;
    for(size_t i = 0; i < args.size(); i++) {
        const TopLevelItem::VarDecl& param = func.params[i];
        Value arg_val = eval_expr(env, *args[i]);
        std::optional<Value> bound = value_for_slot(param.type, arg_val);
        if(!bound) {
            env.host.error(ErrorType::TYPE_ERROR,
                "Can not pass a value of type " + type_name(slot_type(arg_val)) + " to parameter "
                    + param.name + " of type " + type_name(param.type),
                span);
        }
        arg_vals.push_back(*bound);
    }
    return arg_vals;
}

static Value returned_value(EvalEnv& env, const TopLevelItem::Func& func, const ExecResult& result, const SourceSpan& span) {
    const Type& return_type = *func.return_type;
    if(type_is_void(return_type)) {
        return make_void();
    }
    if(result.status == ExecStatus::CONTINUE) {
        return default_value(return_type);
    }
    // A nil leaving a struct function stays nil; any other function hands back its default
    if(std::holds_alternative<Value::VNil>(result.value.t) && !type_is_struct(return_type)) {
        return default_value(return_type);
    }
    std::optional<Value> ret_val = value_for_slot(return_type, result.value);
    if(!ret_val) {
        env.host.error(ErrorType::TYPE_ERROR,
            "Can not return a value of type " + type_name(slot_type(result.value))
                + " from function " + func.name + " of return type " + type_name(return_type),
            span);
    }
    return *ret_val;
}

Value call_function(
    EvalEnv& env,
    const std::string& func_name,
    const std::vector<std::shared_ptr<Expr>>& args,
    const SourceSpan& span) {
    if(is_builtin(func_name)) {
        return call_builtin(env, func_name, args, span);
    }
    const FuncDef* func_def = env.function_table.resolve(func_name, args.size());
    if(!func_def) {
        if(env.function_table.has_name(func_name)) {
            env.host.error(ErrorType::NAME_ERROR,
                "Function " + func_name + " taking " + std::to_string(args.size()) + " params not found",
                span);
        }
        env.host.error(ErrorType::NAME_ERROR, "Function " + func_name + " not found", span);
    }
    const TopLevelItem::Func& func = *func_def->func;
    std::vector<Value> arg_vals = eval_args(env, func, args, span);

    ExecResult result{ExecStatus::CONTINUE, make_nil()};
    {
        FrameGuard frame_guard(env.environment);
        for(size_t i = 0; i < func.params.size(); i++) {
            // Parameter names were checked for uniqueness when the table was loaded
            bool defined = env.environment.define(func.params[i].name, arg_vals[i]);
            assert(defined);
            (void)defined;
        }
        result = run_statements(env, func.body);
    }
    return returned_value(env, func, result, span);
}
