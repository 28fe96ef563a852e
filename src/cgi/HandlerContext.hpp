#pragma once
#include <istream>
#include <ostream>
#include <string>
#include <vector>

class Environment;

class HandlerContext {
public:
    HandlerContext(const std::vector<std::string>& args,
                   std::istream& in,
                   std::ostream& out,
                   std::ostream& err,
                   const Environment& env)
        : args(args), in(in), out(out), err(err), env(env) {}

    const std::vector<std::string>& args; // args[0] is the handler name
    std::istream& in;   // request body
    std::ostream& out;  // response body
    std::ostream& err;  // diagnostics, ends up in the server's error log
    const Environment& env;
};
