#pragma once
#include <cstddef>
#include <cstdint>
#include <random>

namespace mz2d::sim {

// Source of the ghosts' direction choices. Tests inject scripted sequences.
class RandomSource {
public:
    virtual ~RandomSource() = default;

    // Uniform index in [0, count). `count` is at least 1.
    virtual std::size_t pick(std::size_t count) = 0;
};

class DefaultRandomSource final : public RandomSource {
public:
    // A zero seed draws one from std::random_device.
    explicit DefaultRandomSource(std::uint64_t seed = 0);

    std::size_t pick(std::size_t count) override;

    std::uint64_t seed() const { return seed_; }

private:
    std::uint64_t seed_;
    std::mt19937_64 engine_;
};

} // namespace mz2d::sim
