#include <cassert>
#include <cstdio>
#include <fstream>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <vector>
#include <ranges>

#include "parse_file.hpp"
#include "interpreter.hpp"
#include "capturing_host.hpp"
#include "nlohmann/json.hpp"

namespace fs = std::filesystem;
using nlohmann::json;

struct Expectation {
    std::vector<std::string> output;
    std::vector<std::string> input;
    std::optional<std::string> error; // null => the program runs to completion
};

// Error kind recorded for a program the front end rejects
static const std::string PARSE_ERROR = "ParseError";

static void print_vec(const std::vector<std::string>& vec) {
    if(vec.size() == 0) {
        std::cerr << "[]" << std::endl;
        return;
    }
    std::cerr << "[" << vec[0];
    for(const std::string& ele: std::views::drop(vec, 1)) {
        std::cerr << ", " << ele;
    }
    std::cerr << "]" << std::endl;
}

static std::string slurp(const fs::path& p) {
    std::ifstream in(p);
    return std::string((std::istreambuf_iterator<char>(in)),
                       std::istreambuf_iterator<char>());
}

static Expectation load_expectation(const fs::path& p) {
    json o = json::parse(slurp(p));
    Expectation e;
    e.output = o.at("output").get<std::vector<std::string>>();
    if (o.contains("input"))
        e.input = o.at("input").get<std::vector<std::string>>();
    if (o.contains("error") && !o.at("error").is_null())
        e.error = o.at("error").get<std::string>();
    return e;
}

int main(int argc, char** argv) {
    assert(argc == 2);

    fs::path case_dir = argv[1];
    fs::path prog = case_dir / "prog.br";
    fs::path exp  = case_dir / "expected.json";

    Expectation e = load_expectation(exp);

    FILE* f = std::fopen(prog.string().c_str(), "rb");
    if (!f) {
        std::cerr << "Could not open " << prog.string() << std::endl;
        return 1;
    }
    std::unique_ptr<Program> program = parse_file(f);
    std::fclose(f);

    CapturingHost host(e.input);
    std::optional<std::string> got_error;
    if (!program) {
        got_error = PARSE_ERROR;
    } else {
        try {
            run_program(*program, host);
        } catch(const InterpreterError& err) {
            got_error = error_type_name(err.type());
            std::cerr << "Program raised " << err.what() << std::endl;
        }
    }

    int ret_code = 0;
    if (host.output_so_far() != e.output) {
        std::cerr << "------Test case-------" << std::endl;
        std::cerr << "Filename: " << case_dir.string() << std::endl;
        std::cerr << "Expected output: ";
        print_vec(e.output);
        std::cerr << "Actual output: ";
        print_vec(host.output_so_far());
        ret_code = 1;
    }
    if (got_error != e.error) {
        std::cerr << "------Test case-------" << std::endl;
        std::cerr << "Filename: " << case_dir.string() << std::endl;
        std::cerr << "Expected error: " << e.error.value_or("#NONE#") << std::endl;
        std::cerr << "Actual error: " << got_error.value_or("#NONE#") << std::endl;
        ret_code = 1;
    }
    return ret_code;
}
