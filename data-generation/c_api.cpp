#include <string>
#include <random>
#include <chrono>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <vector>

#include "packed_state.hpp"
#include "state_file_operations.hpp"
#include "generate_sample_state.hpp"

namespace fs = std::filesystem;

extern "C" {
    // Generate a random-walk instance and write it to a file inside out_dir.
    // Returns 0 on success, negative on error. On success, writes the full
    // path into out_path_buf (NUL-terminated) if buffer is large enough.
    int datagen_random_walk_to_file(
        int depth,
        unsigned int seed,
        const char* out_dir,
        char* out_path_buf,
        int out_path_buf_len
    ) {
        if (!out_dir || !out_path_buf || out_path_buf_len <= 0 || depth < 0) return -1;
        try {
            fs::create_directories(out_dir);

            auto now = std::chrono::high_resolution_clock::now().time_since_epoch().count();
            std::string fname = "random_walk_d" + std::to_string(depth) + "_" + std::to_string(seed) + "_" + std::to_string(now) + ".state";
            fs::path full = fs::path(out_dir) / fname;

            std::mt19937 rng(seed);
            PackedState s = random_state_random_walk(CANONICAL_GOAL, depth, rng);
            std::vector<int> board;
            for (int code : decode(s)) board.push_back(code + 1);
            write_board_to_file(board, 0, full.string());

            std::string p = full.string();
            if ((int)p.size() + 1 > out_path_buf_len) return -2;
            std::memcpy(out_path_buf, p.c_str(), p.size() + 1);
            return 0;
        } catch (const std::exception& e) {
            std::fprintf(stderr, "datagen_random_walk_to_file: %s\n", e.what());
            return -3;
        }
    }
}
