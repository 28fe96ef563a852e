#include "../cgi/IHandler.hpp"
#include "../cgi/HandlerContext.hpp"
#include "../core/Interrupt.hpp"

#include <cctype>
#include <chrono>
#include <thread>

namespace {
    constexpr long kDefaultSeconds = 3;
    constexpr long kMaxSeconds = 600;
    constexpr auto kSlice = std::chrono::milliseconds(50);

    bool parse_seconds(const std::string& s, long& out) {
        if (s.empty() || s.size() > 4) return false;
        for (char c : s) if (!std::isdigit(static_cast<unsigned char>(c))) return false;
        out = std::stol(s);
        return out <= kMaxSeconds;
    }
}

class Sleep : public IHandler {
public:
    std::string name() const override { return "sleep"; }
    std::string content_type() const override { return "text/plain"; }
    int execute(HandlerContext& ctx) override {
        long seconds = kDefaultSeconds;
        if (ctx.args.size() > 1 && !parse_seconds(ctx.args[1], seconds)) {
            ctx.err << "sleep: invalid duration: " << ctx.args[1] << std::endl;
            return 2;
        }
        ctx.out << "Start Sleeping...\n";
        auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(seconds);
        while (std::chrono::steady_clock::now() < deadline) {
            if (Interrupt::check()) {
                ctx.err << "sleep: interrupted" << std::endl;
                return 130;
            }
            std::this_thread::sleep_for(kSlice);
        }
        ctx.out << "Done Sleeping!\n";
        return 0;
    }
};

namespace Handlers { std::unique_ptr<IHandler> make_sleep(){ return std::make_unique<Sleep>(); } }
