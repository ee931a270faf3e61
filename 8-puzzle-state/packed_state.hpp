/**
 * @file packed_state.hpp
 * @brief 32-bit packed representation of a 3x3 sliding puzzle board.
 *
 * Layout, most significant bit first:
 *
 *     PPPPPIII HHHGGGFF FEEEDDDC CCBBBAAA
 *
 * where A..I are the 3-bit tile codes of slots 0..8 (row-major, slot 8 is the
 * bottom-right corner) and P is the 5-bit position of the blank slot. The
 * blank slot's own 3 bits are always zero, so every board has exactly one
 * packed value.
 */

#ifndef __PACKED_STATE_HPP___
#define __PACKED_STATE_HPP___

#include <cstddef>
#include <cstdint>
#include <vector>

typedef uint32_t PackedState;

/// Number of slots on the board.
constexpr int BOARD_CELLS = 9;
/// Board side length.
constexpr int BOARD_SIDE = 3;
/// Code used for the blank slot in decoded code vectors.
constexpr int BLANK_CODE = -1;
/// First bit of the blank position field.
constexpr int BLANK_POS_SHIFT = 27;
/// Bits per tile code.
constexpr int TILE_BITS = 3;

/// Number of distinct boards (9!); used as a capacity hint by the search.
constexpr size_t MAX_STATES = 362880;

/**
 * @brief Mask covering the 3 bits of `slot`.
 */
constexpr uint32_t tile_mask(int slot) {
    return 0b111u << (slot * TILE_BITS);
}

/**
 * @brief Blank position field holding `slot`.
 */
constexpr uint32_t to_blank_field(int slot) {
    return static_cast<uint32_t>(slot) << BLANK_POS_SHIFT;
}

/**
 * @brief Read the blank position (0..8) from a packed state.
 */
constexpr int decode_blank_pos(PackedState state) {
    return static_cast<int>(state >> BLANK_POS_SHIFT);
}

/**
 * @brief Read the 3-bit tile code stored at `slot`.
 *
 * The blank slot reads as 0; check `decode_blank_pos` to tell it apart.
 */
constexpr int decode_tile(PackedState state, int slot) {
    return static_cast<int>((state & tile_mask(slot)) >> (slot * TILE_BITS));
}

/**
 * @brief Pack a board of tile codes.
 *
 * @param codes 9 values in row-major order: tile codes in [0,7] and exactly
 *              one `BLANK_CODE`.
 * @throws SizeMismatchError if `codes` does not hold 9 values.
 * @throws AlphabetMismatchError if the values are not eight distinct codes in
 *         [0,7] plus one blank.
 * @return Packed state.
 */
PackedState encode(const std::vector<int>& codes);

/**
 * @brief Unpack a state into 9 codes, `BLANK_CODE` at the blank slot.
 */
std::vector<int> decode(PackedState state);

/**
 * @brief Packed state of the canonical goal: codes 0..7 in order, blank last.
 */
constexpr PackedState CANONICAL_GOAL = 0b01000000111110101100011010001000u;

#endif // __PACKED_STATE_HPP___
