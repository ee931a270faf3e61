#ifndef __8_PUZZLE_SOLVER_HPP___
#define __8_PUZZLE_SOLVER_HPP___

#include <vector>

#include "8-puzzle-bfs-solver.hpp"

/**
 * @file 8-puzzle-solver.hpp
 * @brief Validated entry point: symbol boards in, symbol boards out.
 */

/**
 * @brief Solve an 8-puzzle instance given in arbitrary symbols.
 *
 * Checks sizes and alphabets, rejects unsolvable instances by inversion
 * parity, then runs `BFSPuzzleSolver`.
 *
 * @param start Start board, 9 symbols in row-major order.
 * @param goal Goal board over the same symbols.
 * @param blank Symbol designating the blank slot.
 * @param visited_nodes Optional out-parameter to receive number of expanded nodes.
 * @param options Search direction and termination check.
 * @throws SizeMismatchError, AlphabetMismatchError, UnsolvableError.
 * @return Boards from start to goal, in the caller's symbols.
 */
std::vector<std::vector<int>> Solve8Puzzle(const std::vector<int>& start, const std::vector<int>& goal, int blank,
                                           int* visited_nodes = nullptr,
                                           const SearchOptions& options = SearchOptions());

#endif // __8_PUZZLE_SOLVER_HPP___
