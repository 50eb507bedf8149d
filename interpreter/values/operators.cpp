#include "operators.hpp"
#include "pattern_matching_boilerplate.hpp"
#include <cassert>
#include <cstdint>

static bool holds_int(const Value& v) {
    return std::holds_alternative<Value::VInt>(v.t);
}

static bool holds_bool(const Value& v) {
    return std::holds_alternative<Value::VBool>(v.t);
}

std::pair<Value, Value> coerce_operands(BinOp op, const Value& lhs, const Value& rhs) {
    Value coerced_lhs = lhs;
    Value coerced_rhs = rhs;
    switch(op) {
        case BinOp::Eq:
        case BinOp::Neq:
            if(holds_bool(lhs) && holds_int(rhs)) {
                coerced_rhs = coerce_int_to_bool(rhs);
            } else if(holds_int(lhs) && holds_bool(rhs)) {
                coerced_lhs = coerce_int_to_bool(lhs);
            }
            break;
        case BinOp::And:
        case BinOp::Or:
            if(holds_int(lhs)) {
                coerced_lhs = coerce_int_to_bool(lhs);
            }
            if(holds_int(rhs)) {
                coerced_rhs = coerce_int_to_bool(rhs);
            }
            break;
        default:
            break;
    }
    return {coerced_lhs, coerced_rhs};
}

bool types_compatible(BinOp op, const Value& lhs, const Value& rhs) {
    Type lhs_t = value_type(lhs);
    Type rhs_t = value_type(rhs);
    switch(op) {
        case BinOp::Add:
            return (type_is_int(lhs_t) && type_is_int(rhs_t)) ||
                (type_is_string(lhs_t) && type_is_string(rhs_t));
        case BinOp::Sub:
        case BinOp::Mul:
        case BinOp::Div:
        case BinOp::Gt:
        case BinOp::Geq:
        case BinOp::Lt:
        case BinOp::Leq:
            return type_is_int(lhs_t) && type_is_int(rhs_t);
        case BinOp::And:
        case BinOp::Or:
            return type_is_bool(lhs_t) && type_is_bool(rhs_t);
        case BinOp::Eq:
        case BinOp::Neq:
            if(type_is_void(lhs_t) || type_is_void(rhs_t)) {
                return false;
            }
            if(type_is_nil(lhs_t)) {
                return !type_is_scalar(rhs_t);
            }
            if(type_is_nil(rhs_t)) {
                return !type_is_scalar(lhs_t);
            }
            return true;
    }
    assert(false);
    return false;
}

bool int_binop_overflows(BinOp op, int64_t a, int64_t b) {
    int64_t result;
    switch(op) {
        case BinOp::Add: return __builtin_add_overflow(a, b, &result);
        case BinOp::Sub: return __builtin_sub_overflow(a, b, &result);
        case BinOp::Mul: return __builtin_mul_overflow(a, b, &result);
        case BinOp::Div: return a == INT64_MIN && b == -1;
        default: return false;
    }
}

int64_t floor_div(int64_t a, int64_t b) {
    assert(b != 0);
    assert(!(a == INT64_MIN && b == -1));
    int64_t q = a / b;
    if((a % b != 0) && ((a < 0) != (b < 0))) {
        q--;
    }
    return q;
}

static Value equality_result(BinOp op, bool equal) {
    assert(op == BinOp::Eq || op == BinOp::Neq);
    return make_bool(op == BinOp::Eq ? equal : !equal);
}

static Value int_binop(BinOp op, int64_t a, int64_t b) {
    assert(!int_binop_overflows(op, a, b));
    switch(op) {
        case BinOp::Add: return make_int(a + b);
        case BinOp::Sub: return make_int(a - b);
        case BinOp::Mul: return make_int(a * b);
        case BinOp::Div: return make_int(floor_div(a, b));
        case BinOp::Gt:  return make_bool(a > b);
        case BinOp::Geq: return make_bool(a >= b);
        case BinOp::Lt:  return make_bool(a < b);
        case BinOp::Leq: return make_bool(a <= b);
        case BinOp::Eq:
        case BinOp::Neq:
            return equality_result(op, a == b);
        case BinOp::And:
        case BinOp::Or:
            break;
    }
    assert(false);
    return make_void();
}

static Value string_binop(BinOp op, const std::string& a, const std::string& b) {
    switch(op) {
        case BinOp::Add:
            return make_string(a + b);
        case BinOp::Eq:
        case BinOp::Neq:
            return equality_result(op, a == b);
        default:
            break;
    }
    assert(false);
    return make_void();
}

static Value bool_binop(BinOp op, bool a, bool b) {
    switch(op) {
        case BinOp::And: return make_bool(a && b);
        case BinOp::Or:  return make_bool(a || b);
        case BinOp::Eq:
        case BinOp::Neq:
            return equality_result(op, a == b);
        default:
            break;
    }
    assert(false);
    return make_void();
}

Value apply_binop(BinOp op, const Value& lhs, const Value& rhs) {
    return std::visit(Overload{
        [&](const Value::VInt& a, const Value::VInt& b) {
            return int_binop(op, a.v, b.v);
        },
        [&](const Value::VString& a, const Value::VString& b) {
            return string_binop(op, a.v, b.v);
        },
        [&](const Value::VBool& a, const Value::VBool& b) {
            return bool_binop(op, a.v, b.v);
        },
        // Reference identity, never field contents
        [&](const Value::VStruct& a, const Value::VStruct& b) {
            return equality_result(op, a.instance == b.instance);
        },
        [&](const Value::VNil&, const Value::VNil&) {
            return equality_result(op, true);
        },
        [&](const Value::VNil&, const Value::VStruct&) {
            return equality_result(op, false);
        },
        [&](const Value::VStruct&, const Value::VNil&) {
            return equality_result(op, false);
        },
        // Mismatched types only get this far for == and !=
        [&](const auto&, const auto&) {
            return equality_result(op, false);
        }
    }, lhs.t, rhs.t);
}
