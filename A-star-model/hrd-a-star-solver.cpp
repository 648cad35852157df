#include "hrd-a-star-solver.hpp"
#include <queue>
#include <string>
#include <unordered_map>
#include <vector>
#include "distance.hpp"
#include "hrd_errors.hpp"

using namespace std;

namespace {

struct FrontierEntry {
    int f;
    int g;
    size_t index;
};

// priority_queue keeps the "largest" on top: lowest f, then highest g, then oldest node
struct FrontierCompare {
    bool operator()(const FrontierEntry& a, const FrontierEntry& b) const {
        if (a.f != b.f) return a.f > b.f;
        if (a.g != b.g) return a.g < b.g;
        return a.index > b.index;
    }
};

typedef priority_queue<FrontierEntry, vector<FrontierEntry>, FrontierCompare> PQueue;

}  // namespace

std::vector<Board> HrdSolveAstar(const Board &start, const SearchOptions &options, long* expanded_nodes) {
    SearchTree tree;
    PQueue frontier;
    unordered_map<BoardKey, int> best_g;  // cheapest g put on the frontier per board
    unordered_map<BoardKey, int> closed;  // g each board was expanded with
    long expanded = 0;
    if (expanded_nodes) *expanded_nodes = 0;

    int h0 = manhattan_distance(start);
    size_t root = tree.add_node(start, NO_PARENT, 0, h0);
    best_g[start.key()] = 0;
    frontier.push({h0, 0, root});

    while (!frontier.empty()) {
        FrontierEntry entry = frontier.top();
        frontier.pop();
        Board board = tree.get_node(entry.index).board;
        int g = entry.g;

        if (board.is_goal()) {
            return tree.reconstruct_path(entry.index);
        }

        BoardKey key = board.key();
        if (g > best_g[key]) continue;  // stale entry
        auto done = closed.find(key);
        if (done != closed.end() && done->second <= g) continue;
        closed[key] = g;

        check_expansion_budget(options, expanded, "A*");
        ++expanded;
        if (expanded_nodes) *expanded_nodes = expanded;

        for (const Board &next : board.get_available_moves()) {
            BoardKey next_key = next.key();
            if (options.seen.count(next_key)) continue;
            int next_g = g + 1;
            auto known = best_g.find(next_key);
            if (known != best_g.end() && known->second <= next_g) continue;
            best_g[next_key] = next_g;
            int h = manhattan_distance(next);
            size_t index = tree.add_node(next, entry.index, next_g, h);
            frontier.push({next_g + h, next_g, index});
        }
    }
    throw NoSolutionError("A* explored " + to_string(expanded) + " boards without reaching the goal");
}
