// Google Test for slide moves on packed states
#include <gtest/gtest.h>
#include <algorithm>
#include <set>
#include <vector>

#include "moves.hpp"
#include "packed_state.hpp"

static PackedState with_blank_at(int blank) {
    std::vector<int> codes;
    int next = 0;
    for (int slot = 0; slot < BOARD_CELLS; ++slot) {
        codes.push_back(slot == blank ? BLANK_CODE : next++);
    }
    return encode(codes);
}

static std::set<int> reachable_blank_positions(PackedState s) {
    std::set<int> result;
    for (const auto& direction : DIRECTIONS) {
        PackedState next = make_move(s, direction);
        if (next != s) result.insert(decode_blank_pos(next));
    }
    return result;
}

TEST(MovesTest, UpFromGoalSlidesTileDown) {
    // 1 2 3 / 4 5 _ / 7 8 6 in codes
    std::vector<int> expected = {0, 1, 2, 3, 4, BLANK_CODE, 6, 7, 5};
    EXPECT_EQ(up(CANONICAL_GOAL), encode(expected));
    EXPECT_EQ(up(CANONICAL_GOAL), 0x2df84688u);
}

TEST(MovesTest, LeftFromGoalSlidesTileRight) {
    std::vector<int> expected = {0, 1, 2, 3, 4, 5, 6, BLANK_CODE, 7};
    EXPECT_EQ(left(CANONICAL_GOAL), encode(expected));
    EXPECT_EQ(left(CANONICAL_GOAL), 0x3f1ac688u);
}

TEST(MovesTest, DownAndRightFromTopLeft) {
    PackedState s = with_blank_at(0);
    std::vector<int> after_down = {2, 0, 1, BLANK_CODE, 3, 4, 5, 6, 7};
    std::vector<int> after_right = {0, BLANK_CODE, 1, 2, 3, 4, 5, 6, 7};
    EXPECT_EQ(decode(down(s)), after_down);
    EXPECT_EQ(decode(right(s)), after_right);
}

TEST(MovesTest, BlockedMovesAreNoOps) {
    PackedState corner = with_blank_at(8);
    EXPECT_EQ(down(corner), corner);
    EXPECT_EQ(right(corner), corner);

    PackedState top_left = with_blank_at(0);
    EXPECT_EQ(up(top_left), top_left);
    EXPECT_EQ(left(top_left), top_left);
}

TEST(MovesTest, LegalDestinationsPerSlot) {
    EXPECT_EQ(reachable_blank_positions(with_blank_at(0)), (std::set<int>{1, 3}));
    EXPECT_EQ(reachable_blank_positions(with_blank_at(1)), (std::set<int>{0, 2, 4}));
    EXPECT_EQ(reachable_blank_positions(with_blank_at(4)), (std::set<int>{1, 3, 5, 7}));
    EXPECT_EQ(reachable_blank_positions(with_blank_at(5)), (std::set<int>{2, 4, 8}));
    EXPECT_EQ(reachable_blank_positions(with_blank_at(8)), (std::set<int>{5, 7}));
}

TEST(MovesTest, IllegalMoveNeverChangesAnyState) {
    std::vector<int> codes = {BLANK_CODE, 0, 1, 2, 3, 4, 5, 6, 7};
    do {
        PackedState s = encode(codes);
        for (const auto& direction : DIRECTIONS) {
            if (!is_legal(s, direction.move)) {
                ASSERT_EQ(make_move(s, direction), s);
            }
        }
    } while (std::next_permutation(codes.begin(), codes.end()));
}

TEST(MovesTest, InverseRestoresEveryState) {
    std::vector<int> codes = {BLANK_CODE, 0, 1, 2, 3, 4, 5, 6, 7};
    do {
        PackedState s = encode(codes);
        for (const auto& direction : DIRECTIONS) {
            if (!is_legal(s, direction.move)) continue;
            PackedState moved = make_move(s, direction);
            ASSERT_NE(moved, s);
            ASSERT_EQ(apply_move(moved, inverse(direction.move)), s);
        }
    } while (std::next_permutation(codes.begin(), codes.end()));
}

TEST(MovesTest, MovePreservesBlankInvariant) {
    PackedState s = with_blank_at(4);
    for (const auto& direction : DIRECTIONS) {
        PackedState next = make_move(s, direction);
        EXPECT_EQ(next & tile_mask(decode_blank_pos(next)), 0u);
        EXPECT_NO_THROW(encode(decode(next)));
        EXPECT_EQ(encode(decode(next)), next);
    }
}

TEST(MovesTest, MoveBetweenFindsConnectingMove) {
    Move m;
    EXPECT_TRUE(move_between(CANONICAL_GOAL, up(CANONICAL_GOAL), &m));
    EXPECT_EQ(m, Move::Up);
    EXPECT_FALSE(move_between(CANONICAL_GOAL, CANONICAL_GOAL, &m));
    EXPECT_FALSE(move_between(CANONICAL_GOAL, up(up(CANONICAL_GOAL)), &m));
}

TEST(MovesTest, InverseAndNames) {
    EXPECT_EQ(inverse(Move::Up), Move::Down);
    EXPECT_EQ(inverse(Move::Left), Move::Right);
    EXPECT_EQ(to_string(Move::Right), "right");
}
