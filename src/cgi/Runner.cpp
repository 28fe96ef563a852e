#include "Runner.hpp"

#include <exception>
#include <filesystem>
#include <sstream>

#include "IHandler.hpp"
#include "HandlerContext.hpp"
#include "../core/Environment.hpp"

namespace Handlers { void register_all(HandlerRegistry& reg); }

Runner::Runner(std::istream& in, std::ostream& out, std::ostream& err, const Environment& env)
    : in_(in), out_(out), err_(err), env_(env) {
    register_builtin_handlers();
}

void Runner::register_builtin_handlers() {
    Handlers::register_all(registry_);
}

std::string Runner::invoked_name(const std::string& argv0) {
    // /var/www/cgi-bin/large_output.cgi -> large_output
    return std::filesystem::path(argv0).stem().string();
}

int Runner::run(const std::vector<std::string>& argv) {
    // Invoked as a handler (CGI server exec): every argument belongs to the
    // handler, including query words that look like options.
    if (!argv.empty()) {
        auto self = invoked_name(argv[0]);
        if (IHandler* handler = registry_.find(self)) {
            std::vector<std::string> args{self};
            args.insert(args.end(), argv.begin() + 1, argv.end());
            return execute_handler(*handler, args, false);
        }
    }

    bool force_header = false;
    bool list_only = false;
    std::vector<std::string> positional;
    for (size_t i = 1; i < argv.size(); ++i) {
        const std::string& a = argv[i];
        if (a == "--header") { force_header = true; continue; }
        if (a == "--list") { list_only = true; continue; }
        if (a.size() > 2 && a.compare(0, 2, "--") == 0) {
            err_ << "cgiprobe: unknown option: " << a << std::endl;
            return 2;
        }
        positional.push_back(a);
    }

    if (list_only) {
        for (auto& n : registry_.list()) out_ << n << '\n';
        out_.flush();
        return out_ ? 0 : 1;
    }

    if (positional.empty()) {
        err_ << "cgiprobe: no handler given (try --list)" << std::endl;
        return 127;
    }
    IHandler* handler = registry_.find(positional[0]);
    if (!handler) {
        err_ << positional[0] << ": handler not found" << std::endl;
        return 127;
    }
    return execute_handler(*handler, positional, force_header);
}

int Runner::execute_handler(IHandler& handler, const std::vector<std::string>& args, bool force_header) {
    std::ostringstream body;
    HandlerContext ctx(args, in_, body, err_, env_);
    int rc = 0;
    try {
        rc = handler.execute(ctx);
    } catch (const std::exception& e) {
        err_ << handler.name() << ": " << e.what() << std::endl;
        return 1;
    }
    if (rc != 0) return rc; // nothing reaches the client

    std::string content_type = handler.content_type();
    if (content_type.empty() && force_header) content_type = "text/html";

    std::string response;
    if (!content_type.empty()) response = "Content-Type: " + content_type + "\r\n\r\n";
    response += body.str();

    out_.write(response.data(), static_cast<std::streamsize>(response.size()));
    out_.flush();
    if (!out_) {
        err_ << handler.name() << ": failed to write response" << std::endl;
        return 1;
    }
    return 0;
}
