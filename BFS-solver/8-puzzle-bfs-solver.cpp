#include <algorithm>
#include <unordered_map>
#include <vector>

#include "moves.hpp"
#include "puzzle_errors.hpp"

#include "8-puzzle-bfs-solver.hpp"

using namespace std;

namespace {

enum class SearchPhase { Initializing, Expanding, Found, Unreachable };

// Follow predecessors from `from` until the self-mapped root.
vector<PackedState> walk_to_root(const unordered_map<PackedState, PackedState>& tree, PackedState from) {
    vector<PackedState> trace = {from};
    PackedState current = from;
    PackedState parent = tree.at(current);
    while (parent != current) {
        current = parent;
        trace.push_back(current);
        parent = tree.at(current);
    }
    return trace;
}

} // namespace

vector<PackedState> BFSPuzzleSolver(PackedState start, PackedState goal, const SearchOptions& options, SearchStats* stats) {
    bool forward = options.direction == SearchDirection::Forward;
    PackedState root = forward ? start : goal;
    PackedState target = forward ? goal : start;

    unordered_map<PackedState, PackedState> tree;
    tree.reserve(MAX_STATES);
    // FIFO: states before `head` have been expanded
    vector<PackedState> frontier;
    frontier.reserve(MAX_STATES);
    size_t head = 0;
    size_t expanded = 0;

    SearchPhase phase = SearchPhase::Initializing;
    tree.emplace(root, root);
    frontier.push_back(root);
    phase = SearchPhase::Expanding;

    if (root == target) {
        phase = SearchPhase::Found;
    }

    while (phase == SearchPhase::Expanding) {
        if (head == frontier.size()) {
            phase = SearchPhase::Unreachable;
            break;
        }
        PackedState current = frontier[head++];
        if (options.termination == TerminationCheck::OnDequeue && current == target) {
            phase = SearchPhase::Found;
            break;
        }
        ++expanded;
        for (const auto& direction : DIRECTIONS) {
            PackedState next = make_move(current, direction);
            // first discoverer wins; a blocked move yields `current`, already present
            if (!tree.emplace(next, current).second) continue;
            frontier.push_back(next);
            if (options.termination == TerminationCheck::OnDiscovery && next == target) {
                phase = SearchPhase::Found;
                break;
            }
        }
    }

    if (stats) {
        stats->expanded_nodes = expanded;
        stats->discovered_states = tree.size();
    }

    if (phase == SearchPhase::Unreachable) {
        throw UnsolvableError("Goal is not reachable from start");
    }

    vector<PackedState> trace = walk_to_root(tree, target);
    if (forward) {
        reverse(trace.begin(), trace.end());
    }
    return trace;
}
