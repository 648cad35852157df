#include <chrono>
#include <iostream>
#include <string>
#include <vector>

#include "board.hpp"
#include "board_file_operations.hpp"
#include "hrd_errors.hpp"
#include "hrd-a-star-solver.hpp"
#include "hrd-bfs-solver.hpp"
#include "hrd-dfs-solver.hpp"

using namespace std;

typedef vector<Board> (*SolverFn)(const Board &, const SearchOptions &, long *);

static void benchmark(const string &name, SolverFn solver, const Board &start, const SearchOptions &options) {
    long expanded = 0;
    bool found = true;
    size_t steps = 0;
    auto t0 = chrono::steady_clock::now();
    try {
        steps = solver(start, options, &expanded).size() - 1;
    } catch (const NoSolutionError &) {
        found = false;
    } catch (const SearchAbortedError &e) {
        found = false;
        cerr << name << ": " << e.what() << '\n';
    }
    auto t1 = chrono::steady_clock::now();
    double ms = chrono::duration_cast<chrono::duration<double, milli>>(t1 - t0).count();

    cout << name << "," << ms << "," << (found?1:0) << "," << steps << "," << expanded << '\n';
}

int main(int argc, char** argv) {
    string input_file;
    string algorithm = "all";
    SearchOptions options;

    // Simple argument parsing
    for (int i = 1; i < argc; ++i) {
        string a = argv[i];
        if (a == "--input-file" && i + 1 < argc) { input_file = argv[++i]; }
        else if (a == "--algorithm" && i + 1 < argc) { algorithm = argv[++i]; }
        else if (a == "--max-expansions" && i + 1 < argc) { options.max_expansions = stol(argv[++i]); }
        else if (a == "--help") {
            cout << "Usage: benchmark-solvers --input-file F [--algorithm dfs|astar|bfs|all] [--max-expansions N]\n";
            return 0;
        }
    }
    if (input_file.empty()) {
        cerr << "--input-file is required\n";
        return 1;
    }
    if (algorithm != "all" && algorithm != "dfs" && algorithm != "astar" && algorithm != "bfs") {
        cerr << "Unknown algorithm: " << algorithm << '\n';
        return 1;
    }

    Board start_state;
    try {
        start_state = read_board_from_file(input_file);
    } catch (const std::exception& e) {
        cerr << "Error reading board: " << e.what() << '\n';
        return 2;
    }

    // CSV header
    cout << "algorithm,time_ms,found,steps,expanded_nodes" << '\n';
    if (algorithm == "all" || algorithm == "dfs") benchmark("dfs", HrdSolveDfs, start_state, options);
    if (algorithm == "all" || algorithm == "astar") benchmark("astar", HrdSolveAstar, start_state, options);
    if (algorithm == "all" || algorithm == "bfs") benchmark("bfs", HrdSolveBfs, start_state, options);

    return 0;
}
