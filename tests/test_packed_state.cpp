// Google Test for the packed state codec
#include <gtest/gtest.h>
#include <algorithm>
#include <vector>

#include "packed_state.hpp"
#include "puzzle_errors.hpp"

TEST(PackedStateTest, CanonicalGoalLayout) {
    std::vector<int> codes = {0, 1, 2, 3, 4, 5, 6, 7, BLANK_CODE};
    PackedState packed = encode(codes);

    EXPECT_EQ(packed, CANONICAL_GOAL);
    EXPECT_EQ(packed, 0x40fac688u);
    EXPECT_EQ(decode_blank_pos(packed), 8);
    for (int slot = 0; slot < 8; ++slot) {
        EXPECT_EQ(decode_tile(packed, slot), slot);
    }
}

TEST(PackedStateTest, BlankBitsAreZero) {
    // blank in the middle, tile 7 in the top-left corner
    std::vector<int> codes = {7, 0, 1, 2, BLANK_CODE, 3, 4, 5, 6};
    PackedState packed = encode(codes);

    EXPECT_EQ(decode_blank_pos(packed), 4);
    EXPECT_EQ(packed & tile_mask(4), 0u);
    EXPECT_EQ(decode_tile(packed, 0), 7);
    EXPECT_EQ(decode_tile(packed, 8), 6);
}

TEST(PackedStateTest, RoundTripAllPermutations) {
    std::vector<int> codes = {BLANK_CODE, 0, 1, 2, 3, 4, 5, 6, 7};
    size_t count = 0;
    do {
        ASSERT_EQ(decode(encode(codes)), codes);
        ++count;
    } while (std::next_permutation(codes.begin(), codes.end()));
    EXPECT_EQ(count, MAX_STATES);
}

TEST(PackedStateTest, DistinctBoardsPackDistinctly) {
    std::vector<int> a = {0, 1, 2, 3, 4, 5, 6, 7, BLANK_CODE};
    std::vector<int> b = {0, 1, 2, 3, 4, 5, 6, BLANK_CODE, 7};
    EXPECT_NE(encode(a), encode(b));
}

TEST(PackedStateTest, WrongSizeThrows) {
    std::vector<int> codes = {0, 1, 2, 3, 4, 5, 6, BLANK_CODE};
    EXPECT_THROW(encode(codes), SizeMismatchError);
}

TEST(PackedStateTest, DuplicateCodeThrows) {
    std::vector<int> codes = {0, 1, 2, 3, 4, 5, 6, 6, BLANK_CODE};
    EXPECT_THROW(encode(codes), AlphabetMismatchError);
}

TEST(PackedStateTest, OutOfRangeCodeThrows) {
    std::vector<int> codes = {0, 1, 2, 3, 4, 5, 6, 8, BLANK_CODE};
    EXPECT_THROW(encode(codes), AlphabetMismatchError);
}

TEST(PackedStateTest, MissingBlankThrows) {
    std::vector<int> codes = {0, 1, 2, 3, 4, 5, 6, 7, 0};
    EXPECT_THROW(encode(codes), AlphabetMismatchError);
}

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
