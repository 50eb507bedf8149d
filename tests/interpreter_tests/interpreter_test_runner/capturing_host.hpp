#pragma once
#include <deque>
#include <string>
#include <vector>
#include "interpreter_host.hpp"

// Feeds canned input lines and records every output line
class CapturingHost : public InterpreterHost {
private:
    std::deque<std::string> input_lines;
    std::vector<std::string> output_lines;
public:
    explicit CapturingHost(const std::vector<std::string>& input);
    void output(const std::string& line) override;
    std::string get_input() override;
    const std::vector<std::string>& output_so_far() const { return output_lines; }
};
