#include "extract/shuffle.hpp"

#include <limits>
#include <random>
#include <utility>

namespace arcnav {

namespace {

// Uniform value in [0, bound). std::uniform_int_distribution is not used
// because its algorithm differs between standard libraries.
std::uint64_t BoundedDraw(std::mt19937_64& gen, std::uint64_t bound) {
    constexpr std::uint64_t kMax = std::numeric_limits<std::uint64_t>::max();
    const std::uint64_t limit = kMax - (kMax % bound);
    std::uint64_t v = 0;
    do {
        v = gen();
    } while (v >= limit);
    return v % bound;
}

} // namespace

std::uint64_t DrawSeed() {
    std::random_device rd;
    std::uint64_t seed = 0;
    do {
        seed = (static_cast<std::uint64_t>(rd()) << 32) ^ static_cast<std::uint64_t>(rd());
        seed &= (std::uint64_t{1} << 63) - 1;
    } while (seed == 0);
    return seed;
}

void DeterministicShuffle(std::vector<std::string>& items, std::uint64_t seed) {
    if (items.size() < 2) return;

    std::mt19937_64 gen(seed);
    for (std::size_t i = items.size() - 1; i > 0; --i) {
        const auto j = static_cast<std::size_t>(BoundedDraw(gen, i + 1));
        std::swap(items[i], items[j]);
    }
}

} // namespace arcnav
