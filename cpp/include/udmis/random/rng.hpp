#pragma once

#include <cstdint>
#include <utility>

namespace udmis {

// PCG32 random number generator (permuted congruential generator)
// Fast, small state, splittable. Each engine owns one.
class RNG {
public:
    RNG() : state_(0x853c49e6748fea9bULL), inc_(0xda3e39cb94b95bdbULL) {}
    explicit RNG(uint64_t seed) : state_(0), inc_((seed << 1u) | 1u) {
        (void)next();  // Discard for seeding
        state_ += seed;
        (void)next();  // Discard for seeding
    }

    // Next 32 random bits
    [[nodiscard]] uint32_t next() {
        uint64_t oldstate = state_;
        state_ = oldstate * 6364136223846793005ULL + inc_;
        uint32_t xorshifted = static_cast<uint32_t>(((oldstate >> 18u) ^ oldstate) >> 27u);
        uint32_t rot = static_cast<uint32_t>(oldstate >> 59u);
        return (xorshifted >> rot) | (xorshifted << ((-rot) & 31u));
    }

    // 64 random bits from two draws
    [[nodiscard]] uint64_t next64() {
        uint64_t hi = next();
        return (hi << 32u) | next();
    }

    // Uniform double in [0, 1) with 53 bits of precision
    [[nodiscard]] double uniform() {
        return static_cast<double>(next64() >> 11u) * 0x1.0p-53;
    }

    // Uniform double in [min, max)
    [[nodiscard]] double uniform(double min, double max) {
        return min + uniform() * (max - min);
    }

    // Uniform integer in [min, max] (inclusive), unbiased
    [[nodiscard]] int randint(int min, int max) {
        if (min > max) std::swap(min, max);
        uint32_t range = static_cast<uint32_t>(static_cast<int64_t>(max) - min) + 1u;
        if (range == 0u) return static_cast<int>(next());  // full 32-bit span
        // Lemire's rejection on the low product bits
        uint64_t m = static_cast<uint64_t>(next()) * range;
        uint32_t low = static_cast<uint32_t>(m);
        if (low < range) {
            uint32_t threshold = (0u - range) % range;
            while (low < threshold) {
                m = static_cast<uint64_t>(next()) * range;
                low = static_cast<uint32_t>(m);
            }
        }
        return min + static_cast<int>(m >> 32u);
    }

    // True with probability p
    [[nodiscard]] bool bernoulli(double p = 0.5) {
        return uniform() < p;
    }

    // Split the RNG (return a new independent RNG seeded from current state)
    [[nodiscard]] RNG split() {
        return RNG(next64());
    }

private:
    uint64_t state_;
    uint64_t inc_;
};

}  // namespace udmis
