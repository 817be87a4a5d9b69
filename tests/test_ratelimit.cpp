#include "rp/internal/ratelimit.hpp"

#include <cassert>
#include <chrono>
#include <thread>

namespace {

using rp::internal::TokenBucketMap;

void burst_then_refill() {
    TokenBucketMap rl;
    assert(rl.allow("a", 20.0, 3.0));
    assert(rl.allow("a", 20.0, 3.0));
    assert(rl.allow("a", 20.0, 3.0));
    assert(!rl.allow("a", 20.0, 3.0));
    // Buckets are independent.
    assert(rl.allow("b", 20.0, 3.0));

    std::this_thread::sleep_for(std::chrono::milliseconds(120));
    assert(rl.allow("a", 20.0, 3.0));
}

void disabled_limits_always_allow() {
    TokenBucketMap rl;
    for (int i = 0; i < 1000; ++i) {
        assert(rl.allow("x", 0.0, 5.0));
        assert(rl.allow("x", 5.0, 0.0));
    }
    assert(rl.size() == 0);
}

void sweep_drops_idle_buckets() {
    TokenBucketMap rl;
    assert(rl.allow("a", 1.0, 1.0));
    assert(rl.allow("b", 1.0, 1.0));
    assert(rl.size() == 2);
    assert(rl.sweep(3600) == 0);

    std::this_thread::sleep_for(std::chrono::milliseconds(1100));
    assert(rl.allow("b", 1.0, 1.0));
    assert(rl.sweep(1) == 1);
    assert(rl.size() == 1);
}

} // namespace

int main() {
    burst_then_refill();
    disabled_limits_always_allow();
    sweep_drops_idle_buckets();
    return 0;
}
