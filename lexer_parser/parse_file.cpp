#include <iostream>
#include "parse_file.hpp"
#include "parser.tab.hpp"
#include "lex.yy.h"

extern Program* program_root;

std::unique_ptr<Program> parse_file(FILE* input) {
    yyscan_t scanner;
    if (yylex_init(&scanner)) {
        std::cerr << "Error: Could not initialize scanner.\n";
        return nullptr;
    }
    yyset_in(input, scanner);

    program_root = nullptr;
    if (yyparse(scanner) != 0) {
        std::cerr << "Parse failed.\n";
        yylex_destroy(scanner);
        return nullptr;
    }
    yylex_destroy(scanner);
    std::unique_ptr<Program> program(program_root);
    program_root = nullptr;
    return program;
}
