#include <iostream>
#include <vector>
#include <chrono>
#include <string>

#include "board.hpp"
#include "board_file_operations.hpp"
#include "hrd_errors.hpp"
#include "hrd-weighted-a-star-solver.hpp"

using namespace std;

int main(int argc, char** argv) {
    string input_file;
    float weight = 1.0;
    int max_nodes = WEIGHTED_ASTAR_DEFAULT_MAX_NODES;

    // Simple argument parsing
    for (int i = 1; i < argc; ++i) {
        string a = argv[i];
        if (a == "--input-file" && i + 1 < argc) { input_file = argv[++i]; }
        else if (a == "--weight" && i + 1 < argc) { weight = stof(argv[++i]); }
        else if (a == "--max-nodes" && i + 1 < argc) { max_nodes = stoi(argv[++i]); }
        else if (a == "--help") {
            cout << "Usage: benchmark-weighted-a-star --input-file F [--weight W] [--max-nodes N]\n";
            return 0;
        }
    }

    Board start_state;
    try {
        start_state = read_board_from_file(input_file);
    } catch (const std::exception& e) {
        cerr << "Error reading board: " << e.what() << '\n';
        return 2;
    }

    auto t0 = chrono::steady_clock::now();
    long visited_nodes = 0;
    vector<Board> path;
    try {
        path = HrdSolveWeightedAstar(start_state, weight, max_nodes, &visited_nodes);
    } catch (const std::runtime_error& e) {
        cerr << "Search failed: " << e.what() << '\n';
        return 3;
    }
    auto t1 = chrono::steady_clock::now();
    double ms = chrono::duration_cast<chrono::duration<double, milli>>(t1 - t0).count();

    cout << "weight: " << weight << ", time: " << ms << "ms, steps: " << path.size() - 1 << ", visited nodes: " << visited_nodes << '\n';

    return 0;
}
