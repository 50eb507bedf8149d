#include "capturing_host.hpp"

CapturingHost::CapturingHost(const std::vector<std::string>& input)
    : input_lines(input.begin(), input.end()) {}

void CapturingHost::output(const std::string& line) {
    output_lines.push_back(line);
}

std::string CapturingHost::get_input() {
    if(input_lines.empty()) {
        return "";
    }
    std::string line = input_lines.front();
    input_lines.pop_front();
    return line;
}
