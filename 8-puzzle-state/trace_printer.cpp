#include <bitset>
#include <ostream>
#include <string>
#include <vector>

#include "trace_printer.hpp"

using namespace std;

namespace {

void print_symbol(ostream& out, int symbol) {
    if (symbol > ' ' && symbol < 127) {
        out << static_cast<char>(symbol);
    } else {
        out << symbol;
    }
}

} // namespace

void print_board(ostream& out, const vector<int>& board, int blank) {
    for (size_t i = 0; i < board.size(); ++i) {
        if (board[i] == blank) {
            out << ' ';
        } else {
            print_symbol(out, board[i]);
        }
        out << ((i % BOARD_SIDE == BOARD_SIDE - 1) ? '\n' : ' ');
    }
}

void print_trace(ostream& out, const vector<vector<int>>& boards, int blank) {
    for (const auto& board : boards) {
        print_board(out, board, blank);
        out << '\n';
    }
}

void print_packed_trace(ostream& out, const vector<PackedState>& trace) {
    for (PackedState state : trace) {
        int blank = decode_blank_pos(state);
        for (int i = 0; i < BOARD_CELLS; ++i) {
            if (i != blank) {
                out << decode_tile(state, i) << ' ';
            } else {
                out << "  ";
            }
            if (i % BOARD_SIDE == BOARD_SIDE - 1) out << '\n';
        }
        out << '\n';
    }
}

string format_packed_state(PackedState state) {
    return "0b" + bitset<32>(state).to_string();
}
