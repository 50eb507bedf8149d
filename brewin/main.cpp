#include <iostream>
#include <string>
#include <filesystem>
#include <cstdio>
#include "top_level.hpp"
#include "parse_file.hpp"
#include "debug_printer.hpp"
#include "interpreter.hpp"

#include <boost/program_options.hpp>
namespace po = boost::program_options;

int main(int argc, char* argv[]) {
    po::options_description desc("Allowed options");
    desc.add_options()
        ("help", "produce help message")
        ("input-file", po::value<std::string>()->required(), "brewin program to run")
        ("trace", po::bool_switch()->default_value(false), "print each statement to stderr before running it")
        ("dump-ast", po::bool_switch()->default_value(false), "print the parsed program and exit");
    po::positional_options_description positional;
    positional.add("input-file", 1);

    po::variables_map vm;
    try {
        po::store(po::command_line_parser(argc, argv).options(desc).positional(positional).run(), vm);
        if(vm.count("help")) {
            std::cout << desc << std::endl;
            return 0;
        }
        po::notify(vm);
    } catch(const po::error& e) {
        std::cerr << "Error: " << e.what() << "\n" << desc << std::endl;
        return 1;
    }

    std::filesystem::path input_file(vm["input-file"].as<std::string>());
    if (!std::filesystem::exists(input_file)) {
        std::cerr << "Error: Input file not found: " << input_file << "\n";
        return 1;
    }

    FILE* input = fopen(input_file.c_str(), "r");
    if (!input) {
        std::cerr << "Error: Cannot open input file " << input_file << "\n";
        return 1;
    }
    std::unique_ptr<Program> program = parse_file(input);
    fclose(input);
    if (!program) {
        return 1;
    }

    if (vm["dump-ast"].as<bool>()) {
        print_program(std::cout, *program);
        return 0;
    }

    InterpreterOptions options;
    options.trace = vm["trace"].as<bool>();
    ConsoleHost host;
    try {
        run_program(*program, host, options);
    } catch(const InterpreterError& e) {
        if(e.span()) {
            report_error_location(*e.span());
        }
        std::cerr << e.what() << std::endl;
        return 1;
    }
    return 0;
}
