#pragma once

#include <cstdint>

namespace ringsim {

// Seedable xorshift32 source shared by the orchestrator and every policy.
// All engine randomness flows through one of these (do not use std::rand()),
// so a seed plus the same collaborators replays the same fight.
class Rng {
public:
    explicit Rng(std::uint32_t seed = 0x5EEDu) { reseed(seed); }

    void reseed(std::uint32_t seed) {
        // xorshift has a fixed point at zero.
        s_ = (seed == 0u) ? 0x9E3779B9u : seed;
    }

    std::uint32_t nextU32() {
        s_ ^= (s_ << 13);
        s_ ^= (s_ >> 17);
        s_ ^= (s_ << 5);
        return s_;
    }

    // [0,1)
    double u01() { return (double)nextU32() / 4294967296.0; }

    double uniform(double lo, double hi) { return lo + (hi - lo) * u01(); }

    bool chance(double p) { return u01() < p; }

    // [0,n); returns 0 for n <= 0.
    int pickIndex(int n) {
        if (n <= 0) return 0;
        return static_cast<int>(nextU32() % static_cast<std::uint32_t>(n));
    }

    std::uint32_t state() const noexcept { return s_; }

private:
    std::uint32_t s_ = 0x5EEDu;
};

} // namespace ringsim
