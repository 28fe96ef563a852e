#include <iostream>
#include <string>
#include <vector>

#include "core/Environment.hpp"
#include "core/Interrupt.hpp"
#include "cgi/Runner.hpp"

extern char** environ;

int main(int argc, char** argv) {
    std::ios::sync_with_stdio(false);
    Interrupt::install();

    std::vector<std::string> args(argv, argv + argc);
    Environment env = Environment::capture(environ);

    Runner runner(std::cin, std::cout, std::cerr, env);
    return runner.run(args);
}
