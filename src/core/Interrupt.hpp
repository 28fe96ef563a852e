#pragma once
#include <atomic>

namespace Interrupt {
    // Returns true once SIGINT or SIGTERM has been delivered
    bool check();
    // Set interrupt flag (called from the signal handler)
    void set();
    // Clear interrupt flag
    void clear();
    // Route SIGINT and SIGTERM to set()
    void install();
}
