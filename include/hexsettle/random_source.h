// random_source.h
// Injectable uniform randomness for dice, deck shuffles and steals.

#pragma once

#include <cstdint>
#include <iterator>
#include <random>
#include <utility>
#include <vector>

namespace hexsettle {

class RandomSource {
public:
    virtual ~RandomSource() = default;

    // Uniform integer in [lo, hi] (inclusive).
    virtual int uniform_int(int lo, int hi) = 0;

    // Fisher-Yates shuffle driven by uniform_int.
    template <typename RandomIt>
    void shuffle(RandomIt first, RandomIt last) {
        const auto n = static_cast<int>(std::distance(first, last));
        for (int i = n - 1; i > 0; --i) {
            const int j = uniform_int(0, i);
            using std::swap;
            swap(first[i], first[j]);
        }
    }
};

// Seeded Mersenne twister. Seed 0 draws a seed from std::random_device.
class Mt19937Source : public RandomSource {
public:
    explicit Mt19937Source(std::uint32_t seed = 0)
        : rng_(seed == 0 ? std::random_device{}() : seed)
    {}

    int uniform_int(int lo, int hi) override {
        std::uniform_int_distribution<int> dist(lo, hi);
        return dist(rng_);
    }

private:
    std::mt19937 rng_;
};

// Replays a fixed script of values, then falls back to a seeded twister.
// A scripted value outside the requested range throws std::out_of_range.
class ScriptedSource : public RandomSource {
public:
    explicit ScriptedSource(std::vector<int> script, std::uint32_t fallback_seed = 1)
        : script_(std::move(script))
        , fallback_(fallback_seed)
    {}

    int uniform_int(int lo, int hi) override;

    std::size_t remaining() const { return script_.size() - next_; }

private:
    std::vector<int> script_;
    std::size_t next_{0};
    Mt19937Source fallback_;
};

} // namespace hexsettle
