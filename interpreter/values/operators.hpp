#pragma once
#include "values.hpp"
#include "expr.hpp"
#include <utility>

// Applies the int -> bool coercion point for ==, != (when exactly one side is a bool) and for
// && and || (every int operand). Other operators get their operands back untouched.
std::pair<Value, Value> coerce_operands(BinOp op, const Value& lhs, const Value& rhs);

// Whether [op] is defined on the (already coerced) operands. == and != accept mismatched types
// and simply compare unequal, except that nil never compares against a scalar and void never
// compares against anything.
bool types_compatible(BinOp op, const Value& lhs, const Value& rhs);

// Whether [op] on ints [a] and [b] leaves the int64_t range. INT64_MIN / -1 counts.
bool int_binop_overflows(BinOp op, int64_t a, int64_t b);

// Precondition: types_compatible(op, lhs, rhs), rhs is nonzero for division, and int operands
// do not overflow
Value apply_binop(BinOp op, const Value& lhs, const Value& rhs);

// Rounds toward negative infinity. Precondition: b != 0 and !(a == INT64_MIN && b == -1)
int64_t floor_div(int64_t a, int64_t b);
