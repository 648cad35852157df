#include <algorithm>
#include <string>
#include <vector>

#include "search_tree.hpp"
#include "hrd_errors.hpp"

using namespace std;

size_t SearchTree::add_node(const Board& board, size_t parent, int g, int h) {
    nodes.push_back({board, parent, g, h});
    return nodes.size() - 1;
}

vector<Board> SearchTree::reconstruct_path(size_t index) const {
    vector<Board> path;
    for (size_t i = index; i != NO_PARENT; i = nodes[i].parent) {
        path.push_back(nodes[i].board);
    }
    reverse(path.begin(), path.end());
    return path;
}

void check_expansion_budget(const SearchOptions& options, long expanded_nodes, const char* solver_name) {
    if (options.max_expansions > 0 && expanded_nodes >= options.max_expansions) {
        throw SearchAbortedError(string(solver_name) + " search aborted after " + to_string(options.max_expansions) +
                                     " expansions",
                                 expanded_nodes);
    }
}
