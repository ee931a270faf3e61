#include <algorithm>
#include <string>
#include <vector>

#include "alphabet.hpp"
#include "packed_state.hpp"
#include "puzzle_errors.hpp"

using namespace std;

namespace {

void check_board(const vector<int>& board, int blank, const char* name) {
    if (board.size() != static_cast<size_t>(BOARD_CELLS)) {
        throw SizeMismatchError(string(name) + " board must have 9 cells, got " + to_string(board.size()));
    }
    if (count(board.begin(), board.end(), blank) != 1) {
        throw AlphabetMismatchError(string(name) + " board must contain exactly one blank");
    }
    for (size_t i = 0; i < board.size(); ++i) {
        for (size_t j = 0; j < i; ++j) {
            if (board[i] == board[j]) {
                throw AlphabetMismatchError(string(name) + " board repeats symbol " + to_string(board[i]));
            }
        }
    }
}

} // namespace

Alphabet::Alphabet(const vector<int>& symbols, int blank) : symbols(symbols), blank(blank) {}

Alphabet Alphabet::from_boards(const vector<int>& start, const vector<int>& goal, int blank) {
    check_board(start, blank, "Start");
    check_board(goal, blank, "Goal");

    vector<int> symbols;
    for (int s : start) {
        if (s != blank) symbols.push_back(s);
    }
    for (int s : goal) {
        if (s != blank && find(symbols.begin(), symbols.end(), s) == symbols.end()) {
            throw AlphabetMismatchError("Goal symbol " + to_string(s) + " does not appear in start");
        }
    }
    return Alphabet(symbols, blank);
}

int Alphabet::get_blank() const {
    return blank;
}

int Alphabet::code_of(int symbol) const {
    if (symbol == blank) return BLANK_CODE;
    auto it = find(symbols.begin(), symbols.end(), symbol);
    if (it == symbols.end()) {
        throw AlphabetMismatchError("Symbol " + to_string(symbol) + " is not in the alphabet");
    }
    return static_cast<int>(it - symbols.begin());
}

int Alphabet::symbol_of(int code) const {
    if (code == BLANK_CODE) return blank;
    if (code < 0 || code >= static_cast<int>(symbols.size())) {
        throw AlphabetMismatchError("Tile code out of range: " + to_string(code));
    }
    return symbols[code];
}

vector<int> Alphabet::to_codes(const vector<int>& board) const {
    vector<int> codes;
    codes.reserve(board.size());
    for (int s : board) codes.push_back(code_of(s));
    return codes;
}

vector<int> Alphabet::to_symbols(const vector<int>& codes) const {
    vector<int> board;
    board.reserve(codes.size());
    for (int c : codes) board.push_back(symbol_of(c));
    return board;
}

int count_inversions(const vector<int>& start_codes, const vector<int>& goal_codes) {
    // rank of each code in the goal ordering, blank skipped
    vector<int> goal_rank(BOARD_CELLS, 0);
    int rank = 0;
    for (int code : goal_codes) {
        if (code == BLANK_CODE) continue;
        if (code < 0 || code >= BOARD_CELLS) {
            throw AlphabetMismatchError("Tile code out of range: " + to_string(code));
        }
        goal_rank[code] = rank++;
    }
    vector<int> ranks;
    for (int code : start_codes) {
        if (code == BLANK_CODE) continue;
        if (code < 0 || code >= BOARD_CELLS) {
            throw AlphabetMismatchError("Tile code out of range: " + to_string(code));
        }
        ranks.push_back(goal_rank[code]);
    }
    int inversions = 0;
    for (size_t i = 0; i < ranks.size(); ++i) {
        for (size_t k = i + 1; k < ranks.size(); ++k) {
            if (ranks[i] > ranks[k]) ++inversions;
        }
    }
    return inversions;
}

bool is_solvable(const vector<int>& start_codes, const vector<int>& goal_codes) {
    return count_inversions(start_codes, goal_codes) % 2 == 0;
}
