#ifndef __SEARCH_TREE_HPP___
#define __SEARCH_TREE_HPP___

#include <cstddef>
#include <unordered_set>
#include <vector>

#include "board.hpp"

/**
 * @file search_tree.hpp
 * @brief Node arena shared by the solvers, and path reconstruction.
 */

const size_t NO_PARENT = static_cast<size_t>(-1);

/**
 * @brief A discovered board with its cost so far and the index of its parent node.
 */
struct SearchNode {
    Board board;
    size_t parent;
    int g;  // moves from the start
    int h;  // heuristic estimate, 0 for uninformed searches

    int f() const { return g + h; }
};

/**
 * @brief Per-invocation search settings.
 *
 * `seen` lists canonical keys the caller treats as already explored: boards
 * with these keys are never put on the frontier (the start board is always
 * examined). `max_expansions` caps the number of expanded nodes, 0 means no cap.
 */
struct SearchOptions {
    std::unordered_set<BoardKey> seen;
    long max_expansions = 0;
};

/**
 * @brief Append-only arena of search nodes; parents are referenced by index.
 */
class SearchTree {
public:
    SearchTree() = default;

    /**
     * @brief Store a node and return its index.
     */
    size_t add_node(const Board& board, size_t parent, int g, int h = 0);

    const SearchNode& get_node(size_t index) const { return nodes[index]; }
    size_t size() const { return nodes.size(); }

    /**
     * @brief Boards from the root to `index`, inclusive.
     */
    std::vector<Board> reconstruct_path(size_t index) const;

private:
    std::vector<SearchNode> nodes;
};

/**
 * @brief Call before each expansion: throws SearchAbortedError when the budget in
 * `options` is already used up by `expanded_nodes`.
 */
void check_expansion_budget(const SearchOptions& options, long expanded_nodes, const char* solver_name);

#endif // __SEARCH_TREE_HPP___
