#pragma once
#include "types.hpp"
#include <cstdint>
#include <memory>
#include <vector>


// Struct for storing additional information for error messages
struct SourceLoc {
    int line;
    int char_no;
};

struct SourceSpan {
    SourceLoc start;
    SourceLoc end;
};

enum class BinOp { Add, Sub, Mul, Div, Eq, Neq, Gt, Geq, Lt, Leq, And, Or };
enum class UnOp { Neg, Not };

// A variable, or a chain of field accesses rooted at a variable ("n.next.val").
// The dotted source name is split once by the parser.
struct VarPath {
    std::string base;
    std::vector<std::string> fields;
};

struct Expr {
    // Literals
    struct VInt { int64_t v; };
    struct VString { std::string v; };
    struct VBool { bool v; };
    struct VNil {};

    // Variables and field accesses
    struct VVar { VarPath path; };

    // Allocations
    struct NewInstance { std::string struct_name; };

    // Callable calls
    struct FuncCall {
        std::string func;
        std::vector<std::shared_ptr<Expr>> args;
    };

    // Operations
    struct UnOpExpr { UnOp op; std::shared_ptr<Expr> operand; };
    struct BinOpExpr { std::shared_ptr<Expr> lhs; BinOp op; std::shared_ptr<Expr> rhs; };

    SourceSpan source_span;
    std::variant<VInt, VString, VBool, VNil, VVar, NewInstance, FuncCall, UnOpExpr, BinOpExpr> t;
};
