#include <iostream>
#include <random>
#include <string>
#include <vector>

#include "packed_state.hpp"
#include "state_file_operations.hpp"
#include "generate_sample_state.hpp"

using namespace std;

int main(int argc, char** argv) {
    int depth = 10;
    unsigned int seed = 0;
    bool uniform_depth = false;
    string output_file;

    // Simple argument parsing
    for (int i = 1; i < argc; ++i) {
        string a = argv[i];
        if (a == "--depth" && i + 1 < argc) { depth = stoi(argv[++i]); }
        else if (a == "--seed" && i + 1 < argc) { seed = (unsigned int)stoul(argv[++i]); }
        else if (a == "--exact-depth") { uniform_depth = true; }
        else if (a == "--output-file" && i + 1 < argc) { output_file = argv[++i]; }
        else if (a == "--help") {
            cout << "Usage: eight-puzzle-generate --output-file F [--depth N] [--seed S] [--exact-depth]\n";
            return 0;
        }
    }
    if (output_file.empty()) {
        cerr << "Error: --output-file is required\n";
        return 1;
    }

    try {
        mt19937 rng(seed);
        PackedState sample = uniform_depth ? random_state_bfs(CANONICAL_GOAL, depth, rng)
                                           : random_state_random_walk(CANONICAL_GOAL, depth, rng);
        // canonical codes 0..7 are written as tiles 1..8, blank as 0
        vector<int> board;
        for (int code : decode(sample)) board.push_back(code + 1);
        write_board_to_file(board, 0, output_file);
    } catch (const exception& e) {
        cerr << "Error: " << e.what() << '\n';
        return 2;
    }
    return 0;
}
