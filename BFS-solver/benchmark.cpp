#include <chrono>
#include <iostream>
#include <random>
#include <string>
#include <vector>

#include "packed_state.hpp"
#include "generate_sample_state.hpp"
#include "8-puzzle-bfs-solver.hpp"

using namespace std;

int main(int argc, char** argv) {
    int depth = 20;
    int instances = 10;
    bool forward = false;
    unsigned int seed = (unsigned int)chrono::high_resolution_clock::now().time_since_epoch().count();

    // Simple argument parsing
    for (int i = 1; i < argc; ++i) {
        string a = argv[i];
        if (a == "--depth" && i + 1 < argc) { depth = stoi(argv[++i]); }
        else if (a == "--instances" && i + 1 < argc) { instances = stoi(argv[++i]); }
        else if (a == "--seed" && i + 1 < argc) { seed = (unsigned int)stoul(argv[++i]); }
        else if (a == "--forward") { forward = true; }
        else if (a == "--help") {
            cout << "Usage: eight-puzzle-benchmark [--depth N] [--instances K] [--seed S] [--forward]\n";
            return 0;
        }
    }

    if (depth < 0 || instances < 0) {
        cerr << "depth and instances must be non-negative\n";
        return 3;
    }

    mt19937 rng(seed);
    SearchOptions options;
    if (forward) options.direction = SearchDirection::Forward;

    // CSV header
    cout << "instance_id,seed,walk_depth,time_ms,found,path_length,expanded_nodes,discovered_states" << '\n';

    for (int id = 0; id < instances; ++id) {
        PackedState start_state = random_state_random_walk(CANONICAL_GOAL, depth, rng);

        auto t0 = chrono::steady_clock::now();
        SearchStats stats;
        vector<PackedState> path;
        try {
            path = BFSPuzzleSolver(start_state, CANONICAL_GOAL, options, &stats);
        } catch (const exception& e) {
            cerr << "Error solving instance " << id << ": " << e.what() << '\n';
            return 4;
        }
        auto t1 = chrono::steady_clock::now();
        double ms = chrono::duration_cast<chrono::duration<double, milli>>(t1 - t0).count();

        bool found = !path.empty();
        cout << id << ',' << seed << ',' << depth << ',' << ms << ',' << (found?1:0) << ','
             << (found ? path.size() - 1 : 0) << ',' << stats.expanded_nodes << ',' << stats.discovered_states << '\n';
    }

    return 0;
}
