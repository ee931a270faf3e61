#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "packed_state.hpp"
#include "puzzle_errors.hpp"
#include "state_file_operations.hpp"

using namespace std;

BoardFile read_board_from_file(const string& filename) {
    ifstream infile(filename);
    if (!infile.is_open()) {
        throw runtime_error("Could not open file: " + filename);
    }
    int side_length, blank;
    if (!(infile >> side_length >> blank)) {
        throw runtime_error("Missing header in file: " + filename);
    }
    if (side_length != BOARD_SIDE) {
        throw runtime_error("Only 3x3 boards are supported, got side " + to_string(side_length));
    }
    BoardFile result;
    result.blank = blank;
    result.board.resize(BOARD_CELLS);
    for (int i = 0; i < BOARD_CELLS; ++i) {
        if (!(infile >> result.board[i])) {
            throw runtime_error("Expected 9 symbols in file: " + filename);
        }
    }
    return result;
}

void write_board_to_file(const vector<int>& board, int blank, const string& filename) {
    ofstream outfile(filename);
    if (!outfile.is_open()) {
        throw runtime_error("Could not open file for writing: " + filename);
    }
    outfile << BOARD_SIDE << " " << blank << "\n";
    for (size_t i = 0; i < board.size(); ++i) {
        outfile << board[i] << ((i % BOARD_SIDE == BOARD_SIDE - 1) ? "\n" : " ");
    }
}

vector<int> parse_board(const string& text) {
    if (text.size() != static_cast<size_t>(BOARD_CELLS)) {
        throw SizeMismatchError("Board must have 9 symbols, got \"" + text + "\"");
    }
    return vector<int>(text.begin(), text.end());
}
