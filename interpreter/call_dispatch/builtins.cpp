#include "call_dispatcher.hpp"
#include "evaluator.hpp"
#include <cctype>
#include <charconv>

bool is_builtin(const std::string& func_name) {
    return func_name == "print" || func_name == "inputi" || func_name == "inputs";
}

static std::string printable_or_error(EvalEnv& env, const Value& value, const SourceSpan& span) {
    std::optional<std::string> text = printable_value(value);
    if(!text) {
        env.host.error(ErrorType::TYPE_ERROR,
            "Can not print a value of type " + type_name(value_type(value)), span);
    }
    return *text;
}

static Value call_print(EvalEnv& env, const std::vector<std::shared_ptr<Expr>>& args, const SourceSpan& span) {
    std::string line;
    for(const auto& arg: args) {
        line += printable_or_error(env, eval_expr(env, *arg), span);
    }
    env.host.output(line);
    return make_void();
}

static std::optional<int64_t> parse_int(const std::string& line) {
    size_t start = line.find_first_not_of(" \t\r");
    if(start == std::string::npos) {
        return std::nullopt;
    }
    size_t end = line.find_last_not_of(" \t\r") + 1;
    // A sign is only allowed directly before the digits
    if(line[start] == '+' && start + 1 < end && std::isdigit(static_cast<unsigned char>(line[start + 1]))) {
        start++;
    }
    int64_t result = 0;
    const char* first = line.data() + start;
    const char* last = line.data() + end;
    auto [ptr, ec] = std::from_chars(first, last, result);
    if(ec != std::errc() || ptr != last) {
        return std::nullopt;
    }
    return result;
}

static Value call_input(
    EvalEnv& env,
    const std::string& func_name,
    const std::vector<std::shared_ptr<Expr>>& args,
    const SourceSpan& span) {
    if(args.size() > 1) {
        env.host.error(ErrorType::NAME_ERROR,
            "No " + func_name + "() function that takes > 1 parameter", span);
    }
    if(args.size() == 1) {
        env.host.output(printable_or_error(env, eval_expr(env, *args[0]), span));
    }
    std::string line = env.host.get_input();
    if(func_name == "inputs") {
        return make_string(line);
    }
    std::optional<int64_t> int_val = parse_int(line);
    if(!int_val) {
        env.host.error(ErrorType::TYPE_ERROR, "inputi() read a value that is not an integer: " + line, span);
    }
    return make_int(*int_val);
}

Value call_builtin(
    EvalEnv& env,
    const std::string& func_name,
    const std::vector<std::shared_ptr<Expr>>& args,
    const SourceSpan& span) {
    if(func_name == "print") {
        return call_print(env, args, span);
    }
    return call_input(env, func_name, args, span);
}
