#pragma once
#include <cstdint>

// Small deterministic RNG (xorshift32) for level construction.
// Board building never touches a process-wide generator: callers own the
// RNG and pass it in, so the same seed always yields the same boards.
struct RNG {
    uint32_t state;

    explicit RNG(uint32_t seed = 0x12345678u) : state(seed ? seed : 0x12345678u) {}

    uint32_t nextU32() {
        uint32_t x = state;
        x ^= x << 13;
        x ^= x >> 17;
        x ^= x << 5;
        state = x;
        return x;
    }

    // Uniform-ish integer in [lo, hiInclusive].
    int range(int lo, int hiInclusive) {
        if (hiInclusive <= lo) return lo;
        uint32_t span = static_cast<uint32_t>(hiInclusive - lo + 1);
        return lo + static_cast<int>(nextU32() % span);
    }
};
