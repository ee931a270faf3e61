// Google Test for symbol translation and the inversion parity check
#include <gtest/gtest.h>
#include <vector>

#include "alphabet.hpp"
#include "packed_state.hpp"
#include "puzzle_errors.hpp"

static const std::vector<int> GOAL = {1, 2, 3, 4, 5, 6, 7, 8, 0};

TEST(AlphabetTest, CodesFollowStartOrder) {
    std::vector<int> start = {8, 7, 6, 5, 4, 3, 2, 1, 0};
    Alphabet alphabet = Alphabet::from_boards(start, GOAL, 0);

    EXPECT_EQ(alphabet.code_of(8), 0);
    EXPECT_EQ(alphabet.code_of(1), 7);
    EXPECT_EQ(alphabet.code_of(0), BLANK_CODE);
    EXPECT_EQ(alphabet.symbol_of(BLANK_CODE), 0);
    EXPECT_EQ(alphabet.to_codes(start), (std::vector<int>{0, 1, 2, 3, 4, 5, 6, 7, BLANK_CODE}));
    EXPECT_EQ(alphabet.to_symbols(alphabet.to_codes(GOAL)), GOAL);
}

TEST(AlphabetTest, CharacterSymbols) {
    std::vector<int> start = {'a', 'b', 'c', 'd', 'e', ' ', 'f', 'g', 'h'};
    std::vector<int> goal = {'h', 'g', 'f', 'e', 'd', 'c', 'b', 'a', ' '};
    Alphabet alphabet = Alphabet::from_boards(start, goal, ' ');

    EXPECT_EQ(alphabet.get_blank(), ' ');
    EXPECT_EQ(alphabet.code_of('f'), 5);
    EXPECT_EQ(alphabet.symbol_of(7), 'h');
}

TEST(AlphabetTest, WrongSizeThrows) {
    std::vector<int> start = {1, 2, 3, 4, 5, 6, 7, 0};
    EXPECT_THROW(Alphabet::from_boards(start, GOAL, 0), SizeMismatchError);
    EXPECT_THROW(Alphabet::from_boards(GOAL, start, 0), SizeMismatchError);
}

TEST(AlphabetTest, ForeignGoalSymbolThrows) {
    std::vector<int> start = {'a', 'b', 'c', 'd', 'e', 'f', 'g', 'h', 'i'};
    std::vector<int> goal = {'a', 'b', 'c', 'd', 'e', 'f', 'g', 'h', 'x'};
    // blank present in start only
    EXPECT_THROW(Alphabet::from_boards(start, goal, 'i'), AlphabetMismatchError);
    // blank present in both, 'x' unknown to start
    std::vector<int> goal2 = {'a', 'b', 'c', 'd', 'e', 'f', 'x', 'i', 'h'};
    EXPECT_THROW(Alphabet::from_boards(start, goal2, 'i'), AlphabetMismatchError);
}

TEST(AlphabetTest, RepeatedSymbolThrows) {
    std::vector<int> start = {1, 1, 3, 4, 5, 6, 7, 8, 0};
    EXPECT_THROW(Alphabet::from_boards(start, GOAL, 0), AlphabetMismatchError);
}

TEST(AlphabetTest, MissingOrDoubleBlankThrows) {
    std::vector<int> no_blank = {1, 2, 3, 4, 5, 6, 7, 8, 9};
    std::vector<int> two_blanks = {1, 2, 3, 4, 5, 6, 7, 0, 0};
    EXPECT_THROW(Alphabet::from_boards(no_blank, GOAL, 0), AlphabetMismatchError);
    EXPECT_THROW(Alphabet::from_boards(two_blanks, GOAL, 0), AlphabetMismatchError);
}

TEST(AlphabetTest, UnknownSymbolLookupThrows) {
    Alphabet alphabet = Alphabet::from_boards(GOAL, GOAL, 0);
    EXPECT_THROW(alphabet.code_of(42), AlphabetMismatchError);
    EXPECT_THROW(alphabet.symbol_of(8), AlphabetMismatchError);
}

TEST(SolvabilityTest, EvenParityIsSolvable) {
    std::vector<int> start = {1, 2, 3, 4, 5, 0, 6, 7, 8};
    Alphabet alphabet = Alphabet::from_boards(start, GOAL, 0);
    std::vector<int> s = alphabet.to_codes(start);
    std::vector<int> g = alphabet.to_codes(GOAL);

    EXPECT_EQ(count_inversions(s, g), 0);
    EXPECT_TRUE(is_solvable(s, g));
}

TEST(SolvabilityTest, OddParityIsUnsolvable) {
    std::vector<int> start = {2, 1, 3, 4, 5, 6, 7, 8, 0};
    Alphabet alphabet = Alphabet::from_boards(start, GOAL, 0);
    std::vector<int> s = alphabet.to_codes(start);
    std::vector<int> g = alphabet.to_codes(GOAL);

    EXPECT_EQ(count_inversions(s, g), 1);
    EXPECT_FALSE(is_solvable(s, g));
}

TEST(SolvabilityTest, ParityIsRelativeToGoal) {
    // swapping the same two tiles in both boards keeps them mutually solvable
    std::vector<int> start = {2, 1, 3, 4, 5, 6, 7, 8, 0};
    std::vector<int> goal = {2, 1, 3, 4, 5, 6, 7, 0, 8};
    Alphabet alphabet = Alphabet::from_boards(start, goal, 0);
    EXPECT_TRUE(is_solvable(alphabet.to_codes(start), alphabet.to_codes(goal)));
}

TEST(SolvabilityTest, ReversedBoardHasTwentyEightInversions) {
    std::vector<int> start = {8, 7, 6, 5, 4, 3, 2, 1, 0};
    Alphabet alphabet = Alphabet::from_boards(start, GOAL, 0);
    EXPECT_EQ(count_inversions(alphabet.to_codes(start), alphabet.to_codes(GOAL)), 28);
}
