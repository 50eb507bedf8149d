#pragma once
#include "scoped_store.hpp"
#include "values.hpp"
#include <optional>
#include <string>
#include <vector>

// A stack of frames, one per active call. Each frame is a stack of blocks. Every operation
// works on the current (innermost) frame only; a function never sees its caller's locals.
class Environment {
private:
    std::vector<ScopedStore<std::string, Value>> frames;
    ScopedStore<std::string, Value>& curr_frame();
    const ScopedStore<std::string, Value>& curr_frame() const;
public:
    // The new frame starts with one block, which holds the parameters
    void push_frame();
    void pop_frame();
    void push_block();
    void pop_block();

    // Fails if [name] is already defined in the innermost block
    bool define(const std::string& name, const Value& value);
    std::optional<Value> lookup(const std::string& name) const;
    // Overwrites the innermost visible definition. Fails if there is none in the current frame.
    bool assign(const std::string& name, const Value& value);
};

// Opens a block in the current frame and closes it when the guard goes out of scope, including
// when an [InterpreterError] unwinds through it
struct BlockGuard {
private:
    Environment& environment;
public:
    explicit BlockGuard(Environment& environment)
    : environment(environment) {
        environment.push_block();
    }
    BlockGuard(const BlockGuard&) = delete;
    BlockGuard& operator=(const BlockGuard&) = delete;
    ~BlockGuard() {
        environment.pop_block();
    }
};

// Same as [BlockGuard], for a whole call frame
struct FrameGuard {
private:
    Environment& environment;
public:
    explicit FrameGuard(Environment& environment)
    : environment(environment) {
        environment.push_frame();
    }
    FrameGuard(const FrameGuard&) = delete;
    FrameGuard& operator=(const FrameGuard&) = delete;
    ~FrameGuard() {
        environment.pop_frame();
    }
};
