#include "evaluator.hpp"
#include "call_dispatcher.hpp"
#include "operators.hpp"
#include "debug_printer.hpp"
#include "pattern_matching_boilerplate.hpp"
#include <cassert>
#include <cstdint>
#include <iostream>

// The instance owning the last field of a dotted path, and that field's name
struct FieldRef {
    std::shared_ptr<StructInstance> owner;
    std::string field;
};

static Value lookup_var(EvalEnv& env, const std::string& name, const SourceSpan& span) {
    std::optional<Value> value = env.environment.lookup(name);
    if(!value) {
        env.host.error(ErrorType::NAME_ERROR, "Variable " + name + " not found", span);
    }
    return *value;
}

// Precondition: !path.fields.empty()
static FieldRef resolve_field(EvalEnv& env, const VarPath& path, const SourceSpan& span) {
    assert(!path.fields.empty());
    Value curr = lookup_var(env, path.base, span);
    std::string curr_name = path.base;
    for(size_t i = 0; i < path.fields.size(); i++) {
        const std::string& field = path.fields[i];
        if(std::holds_alternative<Value::VNil>(curr.t)) {
            env.host.error(ErrorType::FAULT_ERROR,
                "Variable " + curr_name + " to the left of the dot operator is nil", span);
        }
        auto* struct_val = std::get_if<Value::VStruct>(&curr.t);
        if(!struct_val) {
            env.host.error(ErrorType::TYPE_ERROR,
                "Variable " + curr_name + " to the left of the dot operator is not type struct", span);
        }
        std::shared_ptr<StructInstance> owner = struct_val->instance;
        auto it = owner->fields.find(field);
        if(it == owner->fields.end()) {
            env.host.error(ErrorType::NAME_ERROR,
                field + " is not a field of struct " + owner->struct_name, span);
        }
        if(i + 1 == path.fields.size()) {
            return FieldRef{owner, field};
        }
        curr = it->second;
        curr_name += "." + field;
    }
    assert(false);
    return FieldRef{};
}

static Value read_var_path(EvalEnv& env, const VarPath& path, const SourceSpan& span) {
    if(path.fields.empty()) {
        return lookup_var(env, path.base, span);
    }
    FieldRef field_ref = resolve_field(env, path, span);
    return field_ref.owner->fields.at(field_ref.field);
}

// Coercion point for if and for conditions
static bool eval_condition(EvalEnv& env, const Expr& cond, const std::string& stmt_kind, const SourceSpan& span) {
    Value value = eval_expr(env, cond);
    if(std::holds_alternative<Value::VInt>(value.t)) {
        value = coerce_int_to_bool(value);
    }
    auto* bool_val = std::get_if<Value::VBool>(&value.t);
    if(!bool_val) {
        env.host.error(ErrorType::TYPE_ERROR, "Incompatible type for " + stmt_kind + " condition", span);
    }
    return bool_val->v;
}

static void run_var_def(EvalEnv& env, const Stmt::VarDef& var_def, const SourceSpan& span) {
    if(!var_def.type) {
        env.host.error(ErrorType::TYPE_ERROR, "No type provided for variable " + var_def.name, span);
    }
    if(!type_declarable(env.struct_registry, *var_def.type)) {
        env.host.error(ErrorType::TYPE_ERROR, "No type " + type_name(*var_def.type) + " exists", span);
    }
    if(!env.environment.define(var_def.name, default_value(*var_def.type))) {
        env.host.error(ErrorType::NAME_ERROR, "Duplicate definition for variable " + var_def.name, span);
    }
}

static void assign_field(EvalEnv& env, const VarPath& target, const Value& value, const SourceSpan& span) {
    FieldRef field_ref = resolve_field(env, target, span);
    const StructField* field = env.struct_registry.get_field(field_ref.owner->struct_name, field_ref.field);
    assert(field != nullptr);
    std::optional<Value> stored = value_for_slot(field->type, value);
    if(!stored) {
        env.host.error(ErrorType::TYPE_ERROR,
            "Can not assign a value of type " + type_name(slot_type(value)) + " to field "
                + var_path_name(target) + " of type " + type_name(field->type),
            span);
    }
    field_ref.owner->fields.at(field_ref.field) = *stored;
}

static void run_assign(EvalEnv& env, const Stmt::Assign& assign, const SourceSpan& span) {
    Value value = eval_expr(env, *assign.value);
    if(!assign.target.fields.empty()) {
        assign_field(env, assign.target, value, span);
        return;
    }
    const std::string& name = assign.target.base;
    std::optional<Value> curr = env.environment.lookup(name);
    if(!curr) {
        env.host.error(ErrorType::NAME_ERROR, "Undefined variable " + name + " in assignment", span);
    }
    Type declared = slot_type(*curr);
    std::optional<Value> stored = value_for_slot(declared, value);
    if(!stored) {
        env.host.error(ErrorType::TYPE_ERROR,
            "Types " + type_name(declared) + " and " + type_name(slot_type(value))
                + " are incompatible for assignment",
            span);
    }
    bool assigned = env.environment.assign(name, *stored);
    assert(assigned);
    (void)assigned;
}

static ExecResult run_if(EvalEnv& env, const Stmt::If& if_stmt, const SourceSpan& span) {
    if(eval_condition(env, *if_stmt.cond, "if", span)) {
        return run_statements(env, if_stmt.then_body);
    }
    if(if_stmt.else_body) {
        return run_statements(env, *if_stmt.else_body);
    }
    return ExecResult{ExecStatus::CONTINUE, make_nil()};
}

static ExecResult run_for(EvalEnv& env, const Stmt::For& for_stmt, const SourceSpan& span) {
    // The counter lives in the enclosing block so it survives every iteration
    run_statement(env, *for_stmt.init);
    while(eval_condition(env, *for_stmt.cond, "for", span)) {
        ExecResult result = run_statements(env, for_stmt.body);
        if(result.status == ExecStatus::RETURN) {
            return result;
        }
        run_statement(env, *for_stmt.update);
    }
    return ExecResult{ExecStatus::CONTINUE, make_nil()};
}

ExecResult run_statement(EvalEnv& env, const Stmt& stmt) {
    if(env.trace) {
        std::cerr << "[trace] line " << stmt.source_span.start.line << ": ";
        print_stmt(std::cerr, stmt, false);
    }
    return std::visit(Overload{
        [&](const Stmt::VarDef& var_def) {
            run_var_def(env, var_def, stmt.source_span);
            return ExecResult{ExecStatus::CONTINUE, make_nil()};
        },
        [&](const Stmt::Assign& assign) {
            run_assign(env, assign, stmt.source_span);
            return ExecResult{ExecStatus::CONTINUE, make_nil()};
        },
        [&](const Stmt::Call& call) {
            eval_expr(env, *call.call);
            return ExecResult{ExecStatus::CONTINUE, make_nil()};
        },
        [&](const Stmt::If& if_stmt) {
            return run_if(env, if_stmt, stmt.source_span);
        },
        [&](const Stmt::For& for_stmt) {
            return run_for(env, for_stmt, stmt.source_span);
        },
        [&](const Stmt::Return& ret) {
            if(!ret.expr) {
                return ExecResult{ExecStatus::RETURN, make_nil()};
            }
            Value value = eval_expr(env, *ret.expr);
            return ExecResult{ExecStatus::RETURN, value};
        }
    }, stmt.t);
}

ExecResult run_statements(EvalEnv& env, const std::vector<std::shared_ptr<Stmt>>& stmts) {
    BlockGuard block_guard(env.environment);
    for(const auto& stmt: stmts) {
        ExecResult result = run_statement(env, *stmt);
        if(result.status == ExecStatus::RETURN) {
            return result;
        }
    }
    return ExecResult{ExecStatus::CONTINUE, make_nil()};
}

static Value eval_unop(EvalEnv& env, const Expr::UnOpExpr& unop, const SourceSpan& span) {
    Value operand = eval_expr(env, *unop.operand);
    if(unop.op == UnOp::Neg) {
        auto* int_val = std::get_if<Value::VInt>(&operand.t);
        if(!int_val) {
            env.host.error(ErrorType::TYPE_ERROR, "Incompatible type for neg operation", span);
        }
        if(int_val->v == INT64_MIN) {
            env.host.error(ErrorType::FAULT_ERROR, "Integer overflow", span);
        }
        return make_int(-int_val->v);
    }
    if(std::holds_alternative<Value::VInt>(operand.t)) {
        operand = coerce_int_to_bool(operand);
    }
    auto* bool_val = std::get_if<Value::VBool>(&operand.t);
    if(!bool_val) {
        env.host.error(ErrorType::TYPE_ERROR, "Incompatible type for ! operation", span);
    }
    return make_bool(!bool_val->v);
}

static Value eval_binop(EvalEnv& env, const Expr::BinOpExpr& binop, const SourceSpan& span) {
    Value lhs = eval_expr(env, *binop.lhs);
    Value rhs = eval_expr(env, *binop.rhs);
    bool both_nil = std::holds_alternative<Value::VNil>(lhs.t) && std::holds_alternative<Value::VNil>(rhs.t);
    if(both_nil && (binop.op == BinOp::Eq || binop.op == BinOp::Neq)) {
        return make_bool(binop.op == BinOp::Eq);
    }
    auto [coerced_lhs, coerced_rhs] = coerce_operands(binop.op, lhs, rhs);
    if(!types_compatible(binop.op, coerced_lhs, coerced_rhs)) {
        env.host.error(ErrorType::TYPE_ERROR,
            "Incompatible types for " + binop_symbol(binop.op) + " operation", span);
    }
    if(binop.op == BinOp::Div && std::get<Value::VInt>(coerced_rhs.t).v == 0) {
        env.host.error(ErrorType::FAULT_ERROR, "Division by zero", span);
    }
    auto* lhs_int = std::get_if<Value::VInt>(&coerced_lhs.t);
    auto* rhs_int = std::get_if<Value::VInt>(&coerced_rhs.t);
    if(lhs_int && rhs_int && int_binop_overflows(binop.op, lhs_int->v, rhs_int->v)) {
        env.host.error(ErrorType::FAULT_ERROR, "Integer overflow", span);
    }
    return apply_binop(binop.op, coerced_lhs, coerced_rhs);
}

Value eval_expr(EvalEnv& env, const Expr& expr) {
    return std::visit(Overload{
        [&](const Expr::VInt& x) { return make_int(x.v); },
        [&](const Expr::VString& x) { return make_string(x.v); },
        [&](const Expr::VBool& x) { return make_bool(x.v); },
        [&](const Expr::VNil&) { return make_nil(); },
        [&](const Expr::VVar& x) {
            return read_var_path(env, x.path, expr.source_span);
        },
        [&](const Expr::NewInstance& x) {
            if(!env.struct_registry.contains(x.struct_name)) {
                env.host.error(ErrorType::TYPE_ERROR, "Struct " + x.struct_name + " not found", expr.source_span);
            }
            return Value{Value::VStruct{env.struct_registry.instantiate(x.struct_name)}};
        },
        [&](const Expr::FuncCall& x) {
            return call_function(env, x.func, x.args, expr.source_span);
        },
        [&](const Expr::UnOpExpr& x) {
            return eval_unop(env, x, expr.source_span);
        },
        [&](const Expr::BinOpExpr& x) {
            return eval_binop(env, x, expr.source_span);
        }
    }, expr.t);
}
