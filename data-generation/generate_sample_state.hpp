#ifndef __GENERATE_SAMPLE_STATE_HPP___
#define __GENERATE_SAMPLE_STATE_HPP___

#include <random>

#include "packed_state.hpp"

/**
 * @file generate_sample_state.hpp
 * @brief Utilities to create random puzzle states for benchmarks and testing.
 *
 * Three sampling strategies are provided:
 * - random walk: perform `target_depth` random legal moves from a goal state
 * - BFS sampling: collect all states at exact depth and pick one uniformly
 * - uniform: pick any of the 9! boards, solvable or not
 */

/**
 * @brief Generate a random state by performing a random walk from `goal`.
 *
 * Only legal moves are drawn, so every step changes the state. The walk may
 * double back, so the result can be closer to `goal` than `target_depth`.
 *
 * @param goal Packed state the walk starts from.
 * @param target_depth Number of random moves to perform.
 * @param rng Random number generator to use (std::mt19937).
 * @return A state reachable from `goal`.
 */
PackedState random_state_random_walk(PackedState goal, int target_depth, std::mt19937 &rng);

/**
 * @brief Generate a random state by uniform sampling among states at exact BFS depth.
 *
 * @param goal Packed state the search starts from.
 * @param target_depth Depth to sample at (distance from `goal`).
 * @param rng Random number generator to use (std::mt19937).
 * @return A sampled state. Returns `goal` if no state exists at that depth.
 */
PackedState random_state_bfs(PackedState goal, int target_depth, std::mt19937 &rng);

/**
 * @brief Uniformly random board over codes 0..7 plus the blank.
 */
PackedState random_state_uniform(std::mt19937 &rng);

#endif // __GENERATE_SAMPLE_STATE_HPP___
