#pragma once
#include "top_level.hpp"
#include <ostream>

std::string binop_symbol(BinOp op);
std::string var_path_name(const VarPath& path);

void print_type(std::ostream& out, const Type& type);
void print_binop(std::ostream& out, BinOp op);
void print_expr(std::ostream& out, const Expr& e);
// With [print_bodies] false, compound statements print only their header line
void print_stmt(std::ostream& out, const Stmt& s, bool print_bodies = true);
void print_struct_def(std::ostream& out, const TopLevelItem::StructDef& s);
void print_func(std::ostream& out, const TopLevelItem::Func& f);
void print_top_level_item(std::ostream& out, const TopLevelItem& item);
void print_program(std::ostream& out, const Program& program);
