#include "../cgi/IHandler.hpp"
#include "../cgi/HandlerContext.hpp"
#include "../core/Environment.hpp"

class EnvCheck : public IHandler {
public:
    std::string name() const override { return "env_check"; }
    std::string content_type() const override { return "text/plain"; }
    int execute(HandlerContext& ctx) override {
        ctx.out << "--- CGI Environment Variables ---\n";
        for (auto& kv : ctx.env.list()) {
            ctx.out << kv.first << "=" << kv.second << '\n';
        }
        return 0;
    }
};

namespace Handlers { std::unique_ptr<IHandler> make_env_check(){ return std::make_unique<EnvCheck>(); } }
