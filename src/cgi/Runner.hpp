#pragma once
#include <istream>
#include <ostream>
#include <string>
#include <vector>

#include "HandlerRegistry.hpp"

class Environment;

// Multi-call entry point: picks a handler from the invoked name or the first
// argument, renders its response into memory and writes it out in one piece.
class Runner {
public:
    Runner(std::istream& in, std::ostream& out, std::ostream& err, const Environment& env);
    Runner(const Runner&) = delete;
    Runner& operator=(const Runner&) = delete;

    int run(const std::vector<std::string>& argv);
    HandlerRegistry& registry() { return registry_; }
private:
    std::istream& in_;
    std::ostream& out_;
    std::ostream& err_;
    const Environment& env_;
    HandlerRegistry registry_;

    void register_builtin_handlers();
    int execute_handler(IHandler& handler, const std::vector<std::string>& args, bool force_header);
    static std::string invoked_name(const std::string& argv0);
};
