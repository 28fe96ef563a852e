#include "../cgi/HandlerRegistry.hpp"

namespace Handlers {
    std::unique_ptr<IHandler> make_env_dump();
    std::unique_ptr<IHandler> make_large_output();
    std::unique_ptr<IHandler> make_env_check();
    std::unique_ptr<IHandler> make_echo_body();
    std::unique_ptr<IHandler> make_sleep();
    std::unique_ptr<IHandler> make_payload();
}

namespace Handlers {
    void register_all(HandlerRegistry& reg) {
        reg.add(make_env_dump());
        reg.add(make_large_output());
        reg.add(make_env_check());
        reg.add(make_echo_body());
        reg.add(make_sleep());
        reg.add(make_payload());
    }
}
