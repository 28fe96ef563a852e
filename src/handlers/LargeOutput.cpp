#include "../cgi/IHandler.hpp"
#include "../cgi/HandlerContext.hpp"

namespace {
    constexpr int kLineCount = 1000;
}

class LargeOutput : public IHandler {
public:
    std::string name() const override { return "large_output"; }
    int execute(HandlerContext& ctx) override {
        ctx.out << "<!DOCTYPE html>\n";
        ctx.out << "<html><body>\n";
        ctx.out << "<h1>Huge CGI Response</h1>\n";
        for (int i = 0; i < kLineCount; ++i) {
            ctx.out << "<p>Line " << i << ": This is a large CGI response test.</p>\n";
        }
        ctx.out << "</body></html>\n";
        return 0;
    }
};

namespace Handlers { std::unique_ptr<IHandler> make_large_output(){ return std::make_unique<LargeOutput>(); } }
