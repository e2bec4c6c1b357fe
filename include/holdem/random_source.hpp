#pragma once

#include <cstddef>
#include <cstdint>
#include <limits>
#include <random>
#include <string>

namespace holdem {

/**
 * Source of randomness for shuffling.
 *
 * Satisfies UniformRandomBitGenerator so it plugs into <random> distributions.
 * Callers own the instance; a verifiable generator can replace the default one
 * without touching the engine.
 */
class RandomSource {
public:
    using result_type = std::uint32_t;

    virtual ~RandomSource() = default;

    static constexpr result_type min() { return 0; }
    static constexpr result_type max() { return std::numeric_limits<result_type>::max(); }

    virtual result_type operator()() = 0;

    /**
     * Uniform integer in [0, bound). `bound` must be positive.
     */
    std::size_t below(std::size_t bound);
};

/// std::mt19937 seeded from std::random_device, or from an explicit seed for replay.
class MersenneRandomSource final : public RandomSource {
public:
    MersenneRandomSource();
    explicit MersenneRandomSource(std::uint64_t seed);

    result_type operator()() override {
        return static_cast<result_type>(engine_());
    }

private:
    std::mt19937 engine_;
};

/// Thread-local MersenneRandomSource used when the caller does not supply one.
RandomSource& default_random_source();

/// Fold up to the first eight bytes of `seed_bytes` into a 64-bit seed.
std::uint64_t seed_from_bytes(const std::string& seed_bytes);

} // namespace holdem
