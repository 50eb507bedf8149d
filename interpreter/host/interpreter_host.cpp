#include "interpreter_host.hpp"
#include <iostream>

std::string error_type_name(ErrorType type) {
    switch(type) {
        case ErrorType::NAME_ERROR: return "ErrorType.NAME_ERROR";
        case ErrorType::TYPE_ERROR: return "ErrorType.TYPE_ERROR";
        case ErrorType::FAULT_ERROR: return "ErrorType.FAULT_ERROR";
    }
    return "ErrorType.UNKNOWN";
}

void report_error_location(const SourceSpan& span) {
    std::cerr << "Error between line " << span.start.line << ", column " << span.start.char_no
    << " and line " << span.end.line << ", column " << span.end.char_no << std::endl;
}

static std::string error_message(
    ErrorType type,
    const std::string& description,
    const std::optional<SourceSpan>& span) {
    std::string message = error_type_name(type) + ": ";
    if(span) {
        message += "line " + std::to_string(span->start.line) + ": ";
    }
    return message + description;
}

InterpreterError::InterpreterError(
    ErrorType type,
    const std::string& description,
    std::optional<SourceSpan> span)
    : std::runtime_error(error_message(type, description, span)),
      error_type(type),
      error_description(description),
      error_span(span) {}

void InterpreterHost::error(ErrorType type, const std::string& description) {
    throw InterpreterError(type, description, std::nullopt);
}

void InterpreterHost::error(ErrorType type, const std::string& description, const SourceSpan& span) {
    throw InterpreterError(type, description, span);
}

void ConsoleHost::output(const std::string& line) {
    std::cout << line << std::endl;
}

std::string ConsoleHost::get_input() {
    std::string line;
    if(!std::getline(std::cin, line)) {
        return "";
    }
    return line;
}
