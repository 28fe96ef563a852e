#include "../cgi/IHandler.hpp"
#include "../cgi/HandlerContext.hpp"

namespace {
    constexpr std::size_t kPayloadBytes = 1024 * 1024;
}

class Payload : public IHandler {
public:
    std::string name() const override { return "payload"; }
    std::string content_type() const override { return "text/plain"; }
    int execute(HandlerContext& ctx) override {
        ctx.out << std::string(kPayloadBytes, 'A') << '\n';
        return 0;
    }
};

namespace Handlers { std::unique_ptr<IHandler> make_payload(){ return std::make_unique<Payload>(); } }
