#include <queue>
#include <string>
#include <unordered_set>
#include <vector>
#include "board.hpp"
#include "hrd_errors.hpp"
#include "search_tree.hpp"

#include "hrd-bfs-solver.hpp"

using namespace std;

std::vector<Board> HrdSolveBfs(const Board &start, const SearchOptions &options, long* expanded_nodes) {
    SearchTree tree;
    queue<size_t> frontier;
    unordered_set<BoardKey> discovered;
    long expanded = 0;
    if (expanded_nodes) *expanded_nodes = 0;

    frontier.push(tree.add_node(start, NO_PARENT, 0));
    discovered.insert(start.key());
    while (!frontier.empty()) {
        size_t current = frontier.front();
        frontier.pop();
        Board board = tree.get_node(current).board;
        int g = tree.get_node(current).g;

        if (board.is_goal()) {
            return tree.reconstruct_path(current);
        }

        check_expansion_budget(options, expanded, "BFS");
        ++expanded;
        if (expanded_nodes) *expanded_nodes = expanded;

        for (const auto &next : board.get_available_moves()) {
            if (options.seen.count(next.key())) continue;
            if (discovered.insert(next.key()).second) {
                frontier.push(tree.add_node(next, current, g + 1));
            }
        }
    }
    throw NoSolutionError("BFS explored " + to_string(expanded) + " boards without reaching the goal");
}
