#include <random>
#include <unordered_set>
#include <vector>

#include "factoradic.hpp"
#include "moves.hpp"

#include "generate_sample_state.hpp"

using namespace std;

PackedState random_state_random_walk(PackedState goal, int target_depth, mt19937 &rng) {
    PackedState state = goal;
    vector<PackedState> moves;
    for (int i = 0; i < target_depth; ++i) {
        moves.clear();
        for (const auto& direction : DIRECTIONS) {
            PackedState next = make_move(state, direction);
            if (next != state) moves.push_back(next);
        }
        uniform_int_distribution<size_t> dist(0, moves.size() - 1);
        state = moves[dist(rng)];
    }
    return state;
}

PackedState random_state_bfs(PackedState goal, int target_depth, mt19937 &rng) {
    unordered_set<PackedState> explored = {goal};
    vector<PackedState> layer = {goal};

    for (int depth = 0; depth < target_depth && !layer.empty(); ++depth) {
        vector<PackedState> next_layer;
        for (PackedState state : layer) {
            for (const auto& direction : DIRECTIONS) {
                PackedState next = make_move(state, direction);
                if (explored.insert(next).second) {
                    next_layer.push_back(next);
                }
            }
        }
        layer.swap(next_layer);
    }

    if (layer.empty()) {
        // no node found at that depth; return goal as fallback
        return goal;
    }

    uniform_int_distribution<size_t> dist(0, layer.size() - 1);
    return layer[dist(rng)];
}

PackedState random_state_uniform(mt19937 &rng) {
    vector<int> codes = {0, 1, 2, 3, 4, 5, 6, 7, BLANK_CODE};
    uniform_int_distribution<uint64_t> dist(0, factorial(BOARD_CELLS) - 1);
    return encode(nth_permutation(codes, dist(rng)));
}
