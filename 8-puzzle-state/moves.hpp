/**
 * @file moves.hpp
 * @brief Slide moves applied directly to a `PackedState`.
 *
 * A move is named after the direction the blank travels. Moving into a wall
 * is not an error: the state comes back unchanged.
 */

#ifndef __MOVES_HPP___
#define __MOVES_HPP___

#include <array>
#include <string>

#include "packed_state.hpp"

enum class Move { Up, Down, Left, Right };

/**
 * @brief Data describing one direction: where the blank may move from and by how much.
 */
struct Direction {
    Move move;
    bool (*in_bounds)(int blank_pos);
    int delta_pos;
};

/// The four directions, in the order the search expands them.
extern const std::array<Direction, 4> DIRECTIONS;

/**
 * @brief Apply a direction to a state.
 *
 * @return The successor state, or `state` itself when the move is blocked.
 */
PackedState make_move(PackedState state, const Direction& direction);

/**
 * @brief Descriptor of `move` from `DIRECTIONS`.
 */
const Direction& direction_of(Move move);

/**
 * @brief Whether `move` changes `state`.
 */
bool is_legal(PackedState state, Move move);

PackedState up(PackedState state);
PackedState down(PackedState state);
PackedState left(PackedState state);
PackedState right(PackedState state);

/**
 * @brief Apply `move` to `state`.
 */
PackedState apply_move(PackedState state, Move move);

/**
 * @brief The move that undoes `move` (Up <-> Down, Left <-> Right).
 */
Move inverse(Move move);

/**
 * @brief Move that turns `from` into `to`, if they are one slide apart.
 *
 * @param[out] move Set to the connecting move on success.
 * @return false if no single legal move connects the two states.
 */
bool move_between(PackedState from, PackedState to, Move* move);

std::string to_string(Move move);

#endif // __MOVES_HPP___
