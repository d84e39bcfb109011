/**
 * @file RandomSource.hpp
 * @brief Injectable pseudo-random source for the stochastic layout steps.
 */

#pragma once
#include <random>
#include <cstdint>

namespace regionwalker::domain {

/**
 * @class RandomSource
 * @brief Uniform [0, 1) generator threaded through every stochastic step.
 */
class RandomSource {
public:
    virtual ~RandomSource() = default;

    /** @brief Returns a uniformly distributed value in [0, 1). */
    virtual double nextUniform() = 0;

    /** @brief Returns an index in [0, count). count must be positive. */
    int nextIndex(int count) {
        int idx = static_cast<int>(nextUniform() * count);
        return idx >= count ? count - 1 : idx;
    }
};

/**
 * @class MersenneRandomSource
 * @brief Default generator. A fixed seed makes layouts reproducible.
 */
class MersenneRandomSource : public RandomSource {
public:
    MersenneRandomSource() : m_engine(std::random_device{}()) {}
    explicit MersenneRandomSource(std::uint64_t seed) : m_engine(seed) {}

    double nextUniform() override {
        return m_distribution(m_engine);
    }

private:
    std::mt19937_64 m_engine;
    std::uniform_real_distribution<double> m_distribution{0.0, 1.0};
};

} // namespace regionwalker::domain
