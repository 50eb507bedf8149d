#include "debug_printer.hpp"
#include "pattern_matching_boilerplate.hpp"

std::string binop_symbol(BinOp op) {
    switch (op) {
        case BinOp::Add: return "+";
        case BinOp::Sub: return "-";
        case BinOp::Mul: return "*";
        case BinOp::Div: return "/";
        case BinOp::Eq:  return "==";
        case BinOp::Neq: return "!=";
        case BinOp::Gt:  return ">";
        case BinOp::Geq: return ">=";
        case BinOp::Lt:  return "<";
        case BinOp::Leq: return "<=";
        case BinOp::And: return "&&";
        case BinOp::Or:  return "||";
    }
    return "?";
}

std::string var_path_name(const VarPath& path) {
    std::string name = path.base;
    for(const std::string& field: path.fields) {
        name += "." + field;
    }
    return name;
}

// Types
void print_type(std::ostream& out, const Type& type) {
    std::visit(Overload{
        [&](const Type::TInt&) {
            out << "TInt";
        },
        [&](const Type::TString&) {
            out << "TString";
        },
        [&](const Type::TBool&) {
            out << "TBool";
        },
        [&](const Type::TNil&) {
            out << "TNil";
        },
        [&](const Type::TVoid&) {
            out << "TVoid";
        },
        [&](const Type::TStruct& x) {
            out << "TStruct{" << x.name << "}";
        }
    }, type.t);
}

void print_binop(std::ostream& out, BinOp op) {
    switch (op) {
        case BinOp::Add: out << "Add"; break;
        case BinOp::Sub: out << "Sub"; break;
        case BinOp::Mul: out << "Mul"; break;
        case BinOp::Div: out << "Div"; break;
        case BinOp::Eq:  out << "Eq"; break;
        case BinOp::Neq: out << "Neq"; break;
        case BinOp::Gt:  out << "Gt"; break;
        case BinOp::Geq: out << "Geq"; break;
        case BinOp::Lt:  out << "Lt"; break;
        case BinOp::Leq: out << "Leq"; break;
        case BinOp::And: out << "And"; break;
        case BinOp::Or:  out << "Or"; break;
    }
}

static void print_optional_type(std::ostream& out, const std::optional<Type>& type) {
    if(type) {
        print_type(out, *type);
    } else {
        out << "<missing>";
    }
}

void print_expr(std::ostream& out, const Expr& e) {
    std::visit(Overload{

        // --- Literals ---
        [&](const Expr::VInt& x) {
            out << "VInt{v=" << x.v << "}";
        },
        [&](const Expr::VString& x) {
            out << "VString{v=\"" << x.v << "\"}";
        },
        [&](const Expr::VBool& x) {
            out << "VBool{v=" << (x.v ? "true" : "false") << "}";
        },
        [&](const Expr::VNil&) {
            out << "VNil{}";
        },

        // --- Variable ---
        [&](const Expr::VVar& x) {
            out << "VVar{name=" << var_path_name(x.path) << "}";
        },

        // --- Allocation ---
        [&](const Expr::NewInstance& n) {
            out << "NewInstance{struct=" << n.struct_name << "}";
        },

        // --- Function call ---
        [&](const Expr::FuncCall& c) {
            out << "FuncCall{func=" << c.func << ", args=[";
            for (size_t i = 0; i < c.args.size(); i++) {
                if (i > 0) out << ", ";
                print_expr(out, *c.args[i]);
            }
            out << "]}";
        },

        // --- Unary op ---
        [&](const Expr::UnOpExpr& u) {
            out << (u.op == UnOp::Neg ? "Neg{" : "Not{");
            print_expr(out, *u.operand);
            out << "}";
        },

        // --- Binary op ---
        [&](const Expr::BinOpExpr& b) {
            out << "BinOpExpr{lhs=";
            print_expr(out, *b.lhs);
            out << ", op=";
            print_binop(out, b.op);
            out << ", rhs=";
            print_expr(out, *b.rhs);
            out << "}";
        }
    }, e.t);
}

static void print_body(std::ostream& out, const char* label, const std::vector<std::shared_ptr<Stmt>>& body) {
    out << label << ":\n";
    for (const auto& stmt : body) {
        print_stmt(out, *stmt);
    }
}

void print_stmt(std::ostream& out, const Stmt& s, bool print_bodies) {
    std::visit(Overload{

        [&](const Stmt::VarDef& v) {
            out << "VarDef{name=" << v.name << ", type=";
            print_optional_type(out, v.type);
            out << "}\n";
        },

        [&](const Stmt::Assign& a) {
            out << "Assign{target=" << var_path_name(a.target) << ", value=";
            print_expr(out, *a.value);
            out << "}\n";
        },

        [&](const Stmt::Call& c) {
            out << "Call{";
            print_expr(out, *c.call);
            out << "}\n";
        },

        [&](const Stmt::If& i) {
            out << "If{cond=";
            print_expr(out, *i.cond);
            out << "}\n";
            if (!print_bodies) {
                return;
            }
            print_body(out, "Then", i.then_body);
            if (i.else_body) {
                print_body(out, "Else", *i.else_body);
            }
        },

        [&](const Stmt::For& f) {
            out << "For{cond=";
            print_expr(out, *f.cond);
            out << "}\n";
            if (!print_bodies) {
                return;
            }
            out << "Init:\n";
            print_stmt(out, *f.init);
            out << "Update:\n";
            print_stmt(out, *f.update);
            print_body(out, "Body", f.body);
        },

        [&](const Stmt::Return& r) {
            out << "Return{expr=";
            if (r.expr) {
                print_expr(out, *r.expr);
            }
            out << "}\n";
        }

    }, s.t);
}

void print_struct_def(std::ostream& out, const TopLevelItem::StructDef& s) {
    out << "StructDef{name=" << s.name << "}\n";
    out << "Fields:\n";
    for(const TopLevelItem::VarDecl& field: s.fields) {
        out << "VarDecl{name=" << field.name << ", type=";
        print_type(out, field.type);
        out << "}\n";
    }
}

void print_func(std::ostream& out, const TopLevelItem::Func& f) {
    out << "Func{name=" << f.name << ", return_type=";
    print_optional_type(out, f.return_type);
    out << "}\n";

    out << "Params:\n";
    for(const TopLevelItem::VarDecl& var_decl: f.params) {
        out << "VarDecl{name=" << var_decl.name << ", type=";
        print_type(out, var_decl.type);
        out << "}\n";
    }

    print_body(out, "Body", f.body);
}

void print_top_level_item(std::ostream& out, const TopLevelItem& item) {
    std::visit(Overload{
        [&](const std::shared_ptr<TopLevelItem::StructDef>& s) {
            print_struct_def(out, *s);
        },
        [&](const std::shared_ptr<TopLevelItem::Func>& f) {
            print_func(out, *f);
        }
    }, item.t);
}

void print_program(std::ostream& out, const Program& program) {
    out << "Program\n";
    for (const auto& item : program.top_level_items) {
        print_top_level_item(out, item);
    }
}
