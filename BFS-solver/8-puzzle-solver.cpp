#include <vector>

#include "alphabet.hpp"
#include "packed_state.hpp"
#include "puzzle_errors.hpp"

#include "8-puzzle-solver.hpp"

using namespace std;

vector<vector<int>> Solve8Puzzle(const vector<int>& start, const vector<int>& goal, int blank,
                                 int* visited_nodes, const SearchOptions& options) {
    Alphabet alphabet = Alphabet::from_boards(start, goal, blank);
    vector<int> start_codes = alphabet.to_codes(start);
    vector<int> goal_codes = alphabet.to_codes(goal);

    if (!is_solvable(start_codes, goal_codes)) {
        throw UnsolvableError("Odd inversion count: goal is not reachable from start");
    }

    SearchStats stats;
    vector<PackedState> trace = BFSPuzzleSolver(encode(start_codes), encode(goal_codes), options, &stats);
    if (visited_nodes) {
        *visited_nodes = static_cast<int>(stats.expanded_nodes);
    }

    vector<vector<int>> boards;
    boards.reserve(trace.size());
    for (PackedState state : trace) {
        boards.push_back(alphabet.to_symbols(decode(state)));
    }
    return boards;
}
