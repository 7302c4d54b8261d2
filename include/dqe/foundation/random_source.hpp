#pragma once

/// @file random_source.hpp
/// @brief Injectable randomness for attack variance and flee rolls.

#include <cstdint>
#include <random>

namespace dqe::foundation {

/// Source of uniform random numbers consumed by the combat engine.
///
/// The engine never owns a generator; callers pass one in so that tests
/// can script exact rolls and production can seed as it likes.
class RandomSource {
public:
    virtual ~RandomSource() = default;

    /// Uniform real in [lo, hi].
    virtual double uniform(double lo, double hi) = 0;

    /// Uniform real in [0, 1), used for probability checks.
    virtual double chance() = 0;
};

/// Mersenne Twister backed RandomSource.
class MersenneRandomSource final : public RandomSource {
public:
    explicit MersenneRandomSource(uint64_t seed) : engine_(seed) {}

    /// Seed from std::random_device.
    static MersenneRandomSource fromEntropy();

    double uniform(double lo, double hi) override;
    double chance() override;

    void reseed(uint64_t seed) { engine_.seed(seed); }

private:
    std::mt19937_64 engine_;
};

} // namespace dqe::foundation
