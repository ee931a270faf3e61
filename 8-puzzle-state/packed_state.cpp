#include <string>
#include <vector>

#include "packed_state.hpp"
#include "puzzle_errors.hpp"

using namespace std;

PackedState encode(const vector<int>& codes) {
    if (codes.size() != static_cast<size_t>(BOARD_CELLS)) {
        throw SizeMismatchError("Board must have 9 cells, got " + to_string(codes.size()));
    }
    PackedState packed = 0;
    int blanks = 0;
    unsigned seen = 0;
    for (int slot = 0; slot < BOARD_CELLS; ++slot) {
        int code = codes[slot];
        if (code == BLANK_CODE) {
            ++blanks;
            packed |= to_blank_field(slot);
            continue;
        }
        if (code < 0 || code >= BOARD_CELLS - 1) {
            throw AlphabetMismatchError("Tile code out of range [0,7]: " + to_string(code));
        }
        if (seen & (1u << code)) {
            throw AlphabetMismatchError("Duplicate tile code: " + to_string(code));
        }
        seen |= 1u << code;
        packed |= static_cast<uint32_t>(code) << (slot * TILE_BITS);
    }
    if (blanks != 1) {
        throw AlphabetMismatchError("Board must contain exactly one blank, got " + to_string(blanks));
    }
    return packed;
}

vector<int> decode(PackedState state) {
    vector<int> codes(BOARD_CELLS);
    int blank = decode_blank_pos(state);
    for (int slot = 0; slot < BOARD_CELLS; ++slot) {
        codes[slot] = slot == blank ? BLANK_CODE : decode_tile(state, slot);
    }
    return codes;
}
