#include <chrono>
#include <cstring>
#include <exception>
#include <string>
#include <vector>
#include "board.hpp"
#include "board_file_operations.hpp"
#include "hrd_errors.hpp"
#include "hrd-dfs-solver.hpp"
#include "hrd-a-star-solver.hpp"
#include "hrd-bfs-solver.hpp"

/**
 * @file solver_api.cpp
 * @brief C-friendly wrapper around the solvers so they can be called from Python via ctypes.
 */

extern "C" {
    // Run one solver ("dfs", "astar" or "bfs") on a puzzle file; time is in milliseconds.
    // Returns 1 if a solution was found, 0 if not (exhausted or over budget), -1 on bad arguments or input.
    int hrd_run_instance(
        const char* input_file,
        const char* algorithm,
        long max_expansions,
        double* out_time_ms,
        int* out_steps,
        long* out_expanded
    ) {
        if (!input_file || !algorithm || !out_time_ms || !out_steps || !out_expanded) {
            return -1;
        }
        std::vector<Board> (*solver)(const Board &, const SearchOptions &, long *) = nullptr;
        if (std::strcmp(algorithm, "dfs") == 0) solver = HrdSolveDfs;
        else if (std::strcmp(algorithm, "astar") == 0) solver = HrdSolveAstar;
        else if (std::strcmp(algorithm, "bfs") == 0) solver = HrdSolveBfs;
        else return -1;

        Board start;
        try {
            start = read_board_from_file(std::string(input_file));
        } catch (const std::exception&) {
            return -1;
        }
        SearchOptions options;
        options.max_expansions = max_expansions;

        *out_steps = 0;
        *out_expanded = 0;
        auto t0 = std::chrono::steady_clock::now();
        int found = 1;
        try {
            std::vector<Board> path = solver(start, options, out_expanded);
            *out_steps = static_cast<int>(path.size()) - 1;
        } catch (const NoSolutionError&) {
            found = 0;
        } catch (const SearchAbortedError&) {
            found = 0;
        } catch (const std::exception&) {
            // nothing may unwind into the ctypes caller
            return -1;
        }
        auto t1 = std::chrono::steady_clock::now();
        *out_time_ms = std::chrono::duration_cast<std::chrono::duration<double, std::milli>>(t1 - t0).count();
        return found;
    }
}
