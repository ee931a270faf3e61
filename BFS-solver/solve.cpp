#include <chrono>
#include <iostream>
#include <string>
#include <vector>

#include "alphabet.hpp"
#include "packed_state.hpp"
#include "puzzle_errors.hpp"
#include "state_file_operations.hpp"
#include "trace_printer.hpp"
#include "8-puzzle-solver.hpp"

using namespace std;

static void usage() {
    cout << "Usage: eight-puzzle-solve (--start BOARD | --start-file F) [--goal BOARD | --goal-file F]\n"
         << "                          [--blank C] [--forward] [--check-on-dequeue] [--quiet]\n"
         << "BOARD is 9 characters in row-major order, e.g. 123450678 (blank defaults to '0').\n";
}

int main(int argc, char** argv) {
    string start_raw;
    string goal_raw;
    string start_file;
    string goal_file;
    int blank = '0';
    bool quiet = false;
    SearchOptions options;

    // Simple argument parsing
    for (int i = 1; i < argc; ++i) {
        string a = argv[i];
        if (a == "--start" && i + 1 < argc) { start_raw = argv[++i]; }
        else if (a == "--goal" && i + 1 < argc) { goal_raw = argv[++i]; }
        else if (a == "--start-file" && i + 1 < argc) { start_file = argv[++i]; }
        else if (a == "--goal-file" && i + 1 < argc) { goal_file = argv[++i]; }
        else if (a == "--blank" && i + 1 < argc) { blank = argv[++i][0]; }
        else if (a == "--forward") { options.direction = SearchDirection::Forward; }
        else if (a == "--check-on-dequeue") { options.termination = TerminationCheck::OnDequeue; }
        else if (a == "--quiet") { quiet = true; }
        else if (a == "--help") {
            usage();
            return 0;
        }
        else {
            cerr << "Unknown argument: " << a << '\n';
            usage();
            return 1;
        }
    }
    if (start_raw.empty() && start_file.empty()) {
        usage();
        return 1;
    }

    vector<int> start;
    vector<int> goal;
    try {
        if (!start_file.empty()) {
            BoardFile f = read_board_from_file(start_file);
            start = f.board;
            blank = f.blank;
        } else {
            start = parse_board(start_raw);
        }
        if (!goal_file.empty()) {
            BoardFile f = read_board_from_file(goal_file);
            if (f.blank != blank) {
                throw AlphabetMismatchError("Start and goal files use different blank symbols");
            }
            goal = f.board;
        } else if (!goal_raw.empty()) {
            goal = parse_board(goal_raw);
        } else if (!start_file.empty()) {
            // numeric start file: default goal is 1..8 with the blank last
            goal = {1, 2, 3, 4, 5, 6, 7, 8, blank};
        } else {
            goal = parse_board("12345678" + string(1, static_cast<char>(blank)));
        }
    } catch (const exception& e) {
        cerr << "Error: " << e.what() << '\n';
        return 2;
    }

    auto t0 = chrono::steady_clock::now();
    int visited_nodes = 0;
    vector<vector<int>> path;
    try {
        if (!quiet) {
            Alphabet alphabet = Alphabet::from_boards(start, goal, blank);
            cout << "input:  " << format_packed_state(encode(alphabet.to_codes(start))) << '\n'
                 << "output: " << format_packed_state(encode(alphabet.to_codes(goal))) << "\n\n";
        }
        path = Solve8Puzzle(start, goal, blank, &visited_nodes, options);
    } catch (const UnsolvableError& e) {
        cerr << "Unsolvable: " << e.what() << '\n';
        return 3;
    } catch (const exception& e) {
        cerr << "Error: " << e.what() << '\n';
        return 2;
    }
    auto t1 = chrono::steady_clock::now();
    double ms = chrono::duration_cast<chrono::duration<double, milli>>(t1 - t0).count();

    if (!quiet) {
        print_trace(cout, path, blank);
    }

    bool found = !path.empty();
    size_t steps = found ? path.size() - 1 : 0;
    cout << "time: " << ms << "ms, solution found: " << (found?1:0) << ", steps: " << steps << ", visited nodes: " << visited_nodes << '\n';

    return 0;
}
