#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace arcnav {

// Fresh seed in [1, 2^63) from the system entropy source.
std::uint64_t DrawSeed();

// Fisher-Yates driven by std::mt19937_64. The same seed and input always
// produce the same permutation, on every platform and standard library.
void DeterministicShuffle(std::vector<std::string>& items, std::uint64_t seed);

} // namespace arcnav
