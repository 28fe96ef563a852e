#include "../cgi/IHandler.hpp"
#include "../cgi/HandlerContext.hpp"

#include <iterator>

class EchoBody : public IHandler {
public:
    std::string name() const override { return "echo_body"; }
    std::string content_type() const override { return "text/plain"; }
    int execute(HandlerContext& ctx) override {
        std::string data{std::istreambuf_iterator<char>(ctx.in), std::istreambuf_iterator<char>()};
        if (ctx.in.bad()) {
            ctx.err << "echo_body: failed to read request body" << std::endl;
            return 1;
        }
        ctx.out << "Received Body Length: " << data.size() << '\n';
        ctx.out << "--- Body Content ---\n";
        ctx.out << data << '\n';
        return 0;
    }
};

namespace Handlers { std::unique_ptr<IHandler> make_echo_body(){ return std::make_unique<EchoBody>(); } }
