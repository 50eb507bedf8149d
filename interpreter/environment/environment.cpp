#include "environment.hpp"
#include <cassert>

ScopedStore<std::string, Value>& Environment::curr_frame() {
    assert(frames.size() > 0);
    return frames.back();
}

const ScopedStore<std::string, Value>& Environment::curr_frame() const {
    assert(frames.size() > 0);
    return frames.back();
}

void Environment::push_frame() {
    frames.emplace_back();
    frames.back().create_new_scope();
}

void Environment::pop_frame() {
    assert(frames.size() > 0);
    frames.pop_back();
}

void Environment::push_block() {
    curr_frame().create_new_scope();
}

void Environment::pop_block() {
    curr_frame().pop_scope();
}

bool Environment::define(const std::string& name, const Value& value) {
    return curr_frame().insert(name, value);
}

std::optional<Value> Environment::lookup(const std::string& name) const {
    return curr_frame().get_value(name);
}

bool Environment::assign(const std::string& name, const Value& value) {
    return curr_frame().set_value(name, value);
}
