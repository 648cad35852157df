#ifndef __HRD_DFS_SOLVER_HPP___
#define __HRD_DFS_SOLVER_HPP___

#include <vector>

#include "board.hpp"
#include "search_tree.hpp"

/**
 * @file hrd-dfs-solver.hpp
 * @brief Depth-first search solver for Hua Rong Dao boards.
 */

/**
 * @brief Solve the puzzle with depth-first search.
 *
 * Successors are explored in move generation order (piece id, then up, down,
 * left, right). Boards are marked visited when popped. The returned path is
 * a solution but usually not a shortest one.
 *
 * @param start Starting board.
 * @param options Pre-explored keys and expansion budget.
 * @param expanded_nodes Optional out-parameter to receive the number of expanded nodes.
 * @return Boards from start to goal, inclusive.
 * @throws NoSolutionError when every reachable board was explored.
 * @throws SearchAbortedError when the expansion budget runs out.
 */
std::vector<Board> HrdSolveDfs(const Board &start, const SearchOptions &options = SearchOptions(), long* expanded_nodes = nullptr);

#endif // __HRD_DFS_SOLVER_HPP___
