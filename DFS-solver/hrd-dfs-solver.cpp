#include <string>
#include <unordered_set>
#include <vector>

#include "board.hpp"
#include "hrd_errors.hpp"
#include "search_tree.hpp"
#include "hrd-dfs-solver.hpp"

using namespace std;

std::vector<Board> HrdSolveDfs(const Board &start, const SearchOptions &options, long* expanded_nodes) {
    SearchTree tree;
    vector<size_t> frontier;
    unordered_set<BoardKey> explored;
    long expanded = 0;
    if (expanded_nodes) *expanded_nodes = 0;

    frontier.push_back(tree.add_node(start, NO_PARENT, 0));
    while (!frontier.empty()) {
        size_t current = frontier.back();
        frontier.pop_back();
        // copied: add_node below may reallocate the arena
        Board board = tree.get_node(current).board;
        int g = tree.get_node(current).g;

        if (board.is_goal()) {
            return tree.reconstruct_path(current);
        }
        if (!explored.insert(board.key()).second) continue;

        check_expansion_budget(options, expanded, "DFS");
        ++expanded;
        if (expanded_nodes) *expanded_nodes = expanded;

        vector<Board> successors = board.get_available_moves();
        // pushed backwards so the first generated successor is popped first
        for (auto it = successors.rbegin(); it != successors.rend(); ++it) {
            if (explored.count(it->key()) || options.seen.count(it->key())) continue;
            frontier.push_back(tree.add_node(*it, current, g + 1));
        }
    }
    throw NoSolutionError("DFS explored " + to_string(expanded) + " boards without reaching the goal");
}
