#pragma once
#include <cstdio>
#include <memory>
#include "top_level.hpp"

// Parses a whole Brewin program. Returns nullptr (after reporting on stderr) if the program
// does not parse. The caller keeps ownership of [input].
std::unique_ptr<Program> parse_file(FILE* input);
