#pragma once
#include "expr.hpp"
#include <optional>
#include <stdexcept>
#include <string>

enum class ErrorType { NAME_ERROR, TYPE_ERROR, FAULT_ERROR };

std::string error_type_name(ErrorType type);
void report_error_location(const SourceSpan& span);

// Raised by [InterpreterHost::error]. Nothing inside the interpreter catches it; it unwinds the
// whole run back to whoever called [run_program].
class InterpreterError : public std::runtime_error {
private:
    ErrorType error_type;
    std::string error_description;
    std::optional<SourceSpan> error_span;
public:
    InterpreterError(ErrorType type, const std::string& description, std::optional<SourceSpan> span);
    ErrorType type() const { return error_type; }
    const std::string& description() const { return error_description; }
    const std::optional<SourceSpan>& span() const { return error_span; }
};

// Everything the interpreter needs from the outside world: a place to write program output, a
// source of input lines, and a way to abort the run.
class InterpreterHost {
public:
    virtual ~InterpreterHost() = default;
    // Writes one line of program output
    virtual void output(const std::string& line) = 0;
    // Reads one line of input. Returns an empty line once input is exhausted.
    virtual std::string get_input() = 0;

    [[noreturn]] void error(ErrorType type, const std::string& description);
    [[noreturn]] void error(ErrorType type, const std::string& description, const SourceSpan& span);
};

// Writes to stdout and reads from stdin
class ConsoleHost : public InterpreterHost {
public:
    void output(const std::string& line) override;
    std::string get_input() override;
};
