#include <gtest/gtest.h>

#include "extract/shuffle.hpp"

#include <algorithm>
#include <string>
#include <vector>

namespace arcnav {

using Names = std::vector<std::string>;

TEST(ShuffleTest, KnownPermutationForSeed) {
    Names items{"a.csv", "b.csv", "c.csv"};
    DeterministicShuffle(items, 123);
    EXPECT_EQ(items, (Names{"c.csv", "b.csv", "a.csv"}));

    Names ten;
    for (int i = 0; i < 10; ++i) ten.push_back("f0" + std::to_string(i));
    DeterministicShuffle(ten, 42);
    EXPECT_EQ(ten, (Names{"f01", "f07", "f09", "f00", "f03", "f08", "f04", "f02", "f05", "f06"}));
}

TEST(ShuffleTest, SameSeedSameOrder) {
    Names base;
    for (int i = 0; i < 200; ++i) base.push_back("m" + std::to_string(i));

    Names a = base;
    Names b = base;
    DeterministicShuffle(a, 987654321);
    DeterministicShuffle(b, 987654321);
    EXPECT_EQ(a, b);

    std::sort(a.begin(), a.end());
    Names sorted = base;
    std::sort(sorted.begin(), sorted.end());
    EXPECT_EQ(a, sorted);
}

TEST(ShuffleTest, DifferentSeedsUsuallyDiffer) {
    Names base;
    for (int i = 0; i < 50; ++i) base.push_back("m" + std::to_string(i));

    Names a = base;
    Names b = base;
    DeterministicShuffle(a, 1);
    DeterministicShuffle(b, 2);
    EXPECT_NE(a, b);
}

TEST(ShuffleTest, TinyInputsUnchanged) {
    Names empty;
    DeterministicShuffle(empty, 5);
    EXPECT_TRUE(empty.empty());

    Names one{"only"};
    DeterministicShuffle(one, 5);
    EXPECT_EQ(one, Names{"only"});
}

TEST(ShuffleTest, DrawSeedIsPositive63Bit) {
    for (int i = 0; i < 16; ++i) {
        const auto s = DrawSeed();
        EXPECT_GT(s, 0u);
        EXPECT_LT(s, std::uint64_t{1} << 63);
    }
}

} // namespace arcnav
