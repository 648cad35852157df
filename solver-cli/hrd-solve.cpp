#include <chrono>
#include <iostream>
#include <string>
#include <vector>

#include "board.hpp"
#include "board_file_operations.hpp"
#include "hrd_errors.hpp"
#include "hrd-dfs-solver.hpp"
#include "hrd-a-star-solver.hpp"

using namespace std;

typedef vector<Board> (*SolverFn)(const Board &, const SearchOptions &, long *);

static int run_solver(const string &name, SolverFn solver, const Board &start, const SearchOptions &options,
                      const string &output_file) {
    long expanded = 0;
    auto t0 = chrono::steady_clock::now();
    vector<Board> path;
    try {
        path = solver(start, options, &expanded);
    } catch (const NoSolutionError &e) {
        cerr << name << ": no solution: " << e.what() << '\n';
        return 3;
    } catch (const SearchAbortedError &e) {
        cerr << name << ": " << e.what() << '\n';
        return 3;
    }
    auto t1 = chrono::steady_clock::now();
    double ms = chrono::duration_cast<chrono::duration<double, milli>>(t1 - t0).count();

    try {
        write_solution_to_file(path, output_file);
    } catch (const std::runtime_error &e) {
        cerr << name << ": " << e.what() << '\n';
        return 4;
    }
    cout << name << ": cost " << path.size() - 1 << ", expanded nodes: " << expanded << ", time: " << ms << "ms\n";
    return 0;
}

int main(int argc, char** argv) {
    vector<string> positional;
    SearchOptions options;

    for (int i = 1; i < argc; ++i) {
        string a = argv[i];
        if (a == "--max-expansions" && i + 1 < argc) { options.max_expansions = stol(argv[++i]); }
        else if (a == "--help") {
            cout << "Usage: hrd-solve <input-file> <dfs-output> <astar-output> [--max-expansions N]\n";
            return 0;
        }
        else positional.push_back(a);
    }
    if (positional.size() != 3) {
        cerr << "Usage: hrd-solve <input-file> <dfs-output> <astar-output> [--max-expansions N]\n";
        return 1;
    }

    Board start;
    try {
        start = read_board_from_file(positional[0]);
    } catch (const std::exception& e) {
        cerr << "Error reading board: " << e.what() << '\n';
        return 2;
    }
    cout << start.to_string() << "\n\n";

    try {
        int dfs_status = run_solver("dfs", HrdSolveDfs, start, options, positional[1]);
        int astar_status = run_solver("astar", HrdSolveAstar, start, options, positional[2]);
        return dfs_status != 0 ? dfs_status : astar_status;
    } catch (const std::exception& e) {
        cerr << "Error: " << e.what() << '\n';
        return 4;
    }
}
