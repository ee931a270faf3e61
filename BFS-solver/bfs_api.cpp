#include <algorithm>
#include <chrono>
#include <cstdio>
#include <string>
#include <vector>

#include "puzzle_errors.hpp"
#include "state_file_operations.hpp"
#include "8-puzzle-solver.hpp"

extern "C" {
    // Run BFS on a given instance file against the goal 1..8 with the blank
    // last. Returns 1 if solution found, 0 if the instance is unsolvable,
    // -1 on bad arguments and -2 on invalid input. Time is in milliseconds.
    int bfs_run_instance(
        const char* input_file,
        double* out_time_ms,
        int* out_steps,
        int* out_visited
    ) {
        if (!input_file || !out_time_ms || !out_steps || !out_visited) {
            return -1;
        }
        try {
            BoardFile start = read_board_from_file(std::string(input_file));
            std::vector<int> goal = {1, 2, 3, 4, 5, 6, 7, 8, start.blank};

            auto t0 = std::chrono::steady_clock::now();
            int visited_nodes = 0;
            std::vector<std::vector<int>> path;
            try {
                path = Solve8Puzzle(start.board, goal, start.blank, &visited_nodes);
            } catch (const UnsolvableError&) {
                path.clear();
            }
            auto t1 = std::chrono::steady_clock::now();
            double ms = std::chrono::duration_cast<std::chrono::duration<double, std::milli>>(t1 - t0).count();

            *out_time_ms = ms;
            *out_steps = path.empty() ? 0 : static_cast<int>(path.size()) - 1;
            *out_visited = visited_nodes;
            return path.empty() ? 0 : 1;
        } catch (const std::exception& e) {
            std::fprintf(stderr, "bfs_run_instance: %s\n", e.what());
            return -2;
        }
    }

    // Solve `start` -> `goal` (9 ints each, `blank` marks the empty slot).
    // Writes up to `out_path_capacity` boards (9 ints each) into `out_path`
    // and the number of boards in the full path into `out_path_len`.
    // Returns 1 on success, 0 if unsolvable, -1 on bad arguments, -2 on invalid input.
    int bfs_solve_boards(
        const int* start,
        const int* goal,
        int blank,
        int* out_path,
        int out_path_capacity,
        int* out_path_len
    ) {
        if (!start || !goal || !out_path_len || out_path_capacity < 0 || (out_path_capacity > 0 && !out_path)) {
            return -1;
        }
        try {
            std::vector<int> s(start, start + 9);
            std::vector<int> g(goal, goal + 9);
            std::vector<std::vector<int>> path = Solve8Puzzle(s, g, blank);
            *out_path_len = static_cast<int>(path.size());
            int n = std::min(out_path_capacity, static_cast<int>(path.size()));
            for (int i = 0; i < n; ++i) {
                std::copy(path[i].begin(), path[i].end(), out_path + i * 9);
            }
            return 1;
        } catch (const UnsolvableError&) {
            *out_path_len = 0;
            return 0;
        } catch (const std::exception& e) {
            std::fprintf(stderr, "bfs_solve_boards: %s\n", e.what());
            return -2;
        }
    }
}
