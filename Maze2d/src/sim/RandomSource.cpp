#include "sim/RandomSource.h"

namespace mz2d::sim {

namespace {
std::uint64_t resolveSeed(std::uint64_t seed) {
    if (seed != 0) return seed;
    std::random_device rd;
    return (static_cast<std::uint64_t>(rd()) << 32) ^ rd();
}
}

DefaultRandomSource::DefaultRandomSource(std::uint64_t seed)
    : seed_(resolveSeed(seed)), engine_(seed_) {}

std::size_t DefaultRandomSource::pick(std::size_t count) {
    if (count <= 1) return 0;
    std::uniform_int_distribution<std::size_t> dist(0, count - 1);
    return dist(engine_);
}

} // namespace mz2d::sim
