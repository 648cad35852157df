#ifndef __HRD_BFS_SOLVER_HPP___
#define __HRD_BFS_SOLVER_HPP___

#include <vector>

#include "board.hpp"
#include "search_tree.hpp"

/**
 * @file hrd-bfs-solver.hpp
 * @brief Breadth-first search solver for Hua Rong Dao boards.
 */

/**
 * @brief Solve the puzzle using BFS (shortest path, no heuristic).
 *
 * @param start Starting board.
 * @param options Pre-explored keys and expansion budget.
 * @param expanded_nodes Optional out-parameter to receive the number of expanded nodes.
 * @return A shortest sequence of boards from start to goal, inclusive.
 * @throws NoSolutionError when every reachable board was explored.
 * @throws SearchAbortedError when the expansion budget runs out.
 */
std::vector<Board> HrdSolveBfs(const Board &start, const SearchOptions &options = SearchOptions(), long* expanded_nodes = nullptr);

#endif // __HRD_BFS_SOLVER_HPP___
