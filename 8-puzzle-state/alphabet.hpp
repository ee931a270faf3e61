/**
 * @file alphabet.hpp
 * @brief Translation between caller symbols and tile codes, and the solvability check.
 */

#ifndef __ALPHABET_HPP___
#define __ALPHABET_HPP___

#include <vector>

/**
 * @brief Bijection between the 8 tile symbols of an instance and codes 0..7.
 *
 * Codes are assigned in order of first appearance in the start board. The
 * blank symbol maps to `BLANK_CODE`.
 */
class Alphabet {

private:
    std::vector<int> symbols;
    int blank;
    Alphabet(const std::vector<int>& symbols, int blank);
public:
    /**
     * @brief Build the alphabet shared by a start and a goal board.
     *
     * @param start Start board symbols in row-major order.
     * @param goal Goal board symbols in row-major order.
     * @param blank Symbol designating the blank slot.
     * @throws SizeMismatchError if either board does not hold 9 symbols.
     * @throws AlphabetMismatchError if a board repeats a symbol, does not hold
     *         exactly one blank, or the goal uses a symbol the start lacks.
     */
    static Alphabet from_boards(const std::vector<int>& start, const std::vector<int>& goal, int blank);

    int get_blank() const;

    /**
     * @brief Code of `symbol`, or `BLANK_CODE` for the blank.
     * @throws AlphabetMismatchError for a symbol outside the alphabet.
     */
    int code_of(int symbol) const;
    int symbol_of(int code) const;

    std::vector<int> to_codes(const std::vector<int>& board) const;
    std::vector<int> to_symbols(const std::vector<int>& codes) const;
};

/**
 * @brief Count inversions of the start tiles, ranked by their order in the goal.
 *
 * Both arguments are code vectors (`BLANK_CODE` marks the blank).
 */
int count_inversions(const std::vector<int>& start_codes, const std::vector<int>& goal_codes);

/**
 * @brief Whether `goal_codes` is reachable from `start_codes`.
 *
 * On a board of odd width a horizontal slide never changes the inversion
 * count and a vertical slide moves a tile past two others, so the parity of
 * the inversion count is invariant. Even parity is solvable.
 */
bool is_solvable(const std::vector<int>& start_codes, const std::vector<int>& goal_codes);

#endif // __ALPHABET_HPP___
