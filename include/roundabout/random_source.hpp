#pragma once

#include <cstdint>
#include <mutex>
#include <random>

namespace roundabout {

// Source of uniform draws in [0, 1) for the local EMERGE heuristics
class RandomSource {
public:
    virtual ~RandomSource() = default;
    virtual double next_unit() = 0;
};

class SeededRandomSource : public RandomSource {
public:
    explicit SeededRandomSource(std::uint64_t seed = 0x5eed);

    double next_unit() override;

private:
    std::mutex mutex_;
    std::mt19937_64 engine_;
    std::uniform_real_distribution<double> dist_{0.0, 1.0};
};

} // namespace roundabout
