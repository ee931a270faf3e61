#include <stdexcept>
#include <string>

#include "moves.hpp"

using namespace std;

namespace {

bool not_top_row(int pos) { return pos >= BOARD_SIDE; }
bool not_bottom_row(int pos) { return pos < BOARD_CELLS - BOARD_SIDE; }
bool not_left_column(int pos) { return pos % BOARD_SIDE != 0; }
bool not_right_column(int pos) { return pos % BOARD_SIDE != BOARD_SIDE - 1; }

// Rotation amount equivalent to shifting left by `shift` on a 32-bit word.
// Negative shifts wrap around to a right rotation, so `x << -3` becomes a
// rotation right by 3. Only valid because PackedState is exactly 32 bits.
constexpr unsigned wrap_around(int shift) {
    return static_cast<unsigned>((32 + shift) % 32);
}

constexpr uint32_t rotate_right(uint32_t x, unsigned n) {
    return n == 0 ? x : (x >> n) | (x << (32 - n));
}

static_assert(sizeof(PackedState) * 8 == 32, "wrap_around relies on a 32-bit packed state");

} // namespace

const array<Direction, 4> DIRECTIONS = {{
    {Move::Up, not_top_row, -BOARD_SIDE},
    {Move::Down, not_bottom_row, BOARD_SIDE},
    {Move::Left, not_left_column, -1},
    {Move::Right, not_right_column, 1},
}};

PackedState make_move(PackedState state, const Direction& direction) {
    int blank_pos = decode_blank_pos(state);
    if (!direction.in_bounds(blank_pos)) {
        return state;
    }

    int target_pos = blank_pos + direction.delta_pos;
    uint32_t mask = tile_mask(target_pos);
    uint32_t masked = state & mask;

    // moving the tile delta_pos cells towards the old blank slot is a rotation
    // by delta_pos * 3 bits
    uint32_t moved = rotate_right(masked, wrap_around(direction.delta_pos * TILE_BITS));

    state &= ~mask;
    state |= moved;
    // unsigned wraparound turns a negative delta into a subtraction
    state += static_cast<uint32_t>(direction.delta_pos) << BLANK_POS_SHIFT;
    return state;
}

const Direction& direction_of(Move move) {
    return DIRECTIONS[static_cast<size_t>(move)];
}

bool is_legal(PackedState state, Move move) {
    return direction_of(move).in_bounds(decode_blank_pos(state));
}

PackedState up(PackedState state) { return make_move(state, direction_of(Move::Up)); }
PackedState down(PackedState state) { return make_move(state, direction_of(Move::Down)); }
PackedState left(PackedState state) { return make_move(state, direction_of(Move::Left)); }
PackedState right(PackedState state) { return make_move(state, direction_of(Move::Right)); }

PackedState apply_move(PackedState state, Move move) {
    return make_move(state, direction_of(move));
}

Move inverse(Move move) {
    switch (move) {
    case Move::Up: return Move::Down;
    case Move::Down: return Move::Up;
    case Move::Left: return Move::Right;
    case Move::Right: return Move::Left;
    }
    throw invalid_argument("Unknown move");
}

bool move_between(PackedState from, PackedState to, Move* move) {
    if (from == to) return false;
    for (const auto& direction : DIRECTIONS) {
        if (make_move(from, direction) == to) {
            if (move) *move = direction.move;
            return true;
        }
    }
    return false;
}

string to_string(Move move) {
    switch (move) {
    case Move::Up: return "up";
    case Move::Down: return "down";
    case Move::Left: return "left";
    case Move::Right: return "right";
    }
    throw invalid_argument("Unknown move");
}
