#include "Interrupt.hpp"

#include <csignal>

namespace {
    std::atomic<bool> g_interrupted{false};
}

static void on_signal(int) { Interrupt::set(); }

namespace Interrupt {
    bool check() { return g_interrupted.load(std::memory_order_relaxed); }
    void set() { g_interrupted.store(true, std::memory_order_relaxed); }
    void clear() { g_interrupted.store(false, std::memory_order_relaxed); }

    void install() {
        std::signal(SIGINT, on_signal);
        std::signal(SIGTERM, on_signal);
    }
}
