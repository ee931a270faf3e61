#ifndef __8_PUZZLE_BFS_SOLVER_HPP___
#define __8_PUZZLE_BFS_SOLVER_HPP___

#include <cstddef>
#include <vector>

#include "packed_state.hpp"

/**
 * @file 8-puzzle-bfs-solver.hpp
 * @brief Breadth-first search over packed 8-puzzle states.
 */

/**
 * @brief Which endpoint seeds the frontier.
 */
enum class SearchDirection {
    Backward, ///< root is the goal; the walk from the start yields start->goal directly
    Forward   ///< root is the start; the walk is reversed afterwards
};

/**
 * @brief When the target test happens.
 */
enum class TerminationCheck {
    OnDiscovery, ///< stop as soon as the target enters the predecessor map
    OnDequeue    ///< stop when the target leaves the frontier
};

struct SearchOptions {
    SearchDirection direction = SearchDirection::Backward;
    TerminationCheck termination = TerminationCheck::OnDiscovery;
};

struct SearchStats {
    size_t expanded_nodes = 0;
    size_t discovered_states = 0;
};

/**
 * @brief Solve the puzzle using BFS over the implicit move graph.
 *
 * The predecessor map and frontier are sized for 9! states up front.
 *
 * @param start Packed start state.
 * @param goal Packed goal state.
 * @param options Search direction and termination check.
 * @param stats Optional out-parameter receiving node counts.
 * @throws UnsolvableError if the frontier empties before the target is found.
 * @return Sequence of states from start to goal; a single state when start == goal.
 */
std::vector<PackedState> BFSPuzzleSolver(PackedState start, PackedState goal,
                                         const SearchOptions& options = SearchOptions(),
                                         SearchStats* stats = nullptr);

#endif // __8_PUZZLE_BFS_SOLVER_HPP___
