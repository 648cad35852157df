#ifndef HRD_ASTAR_SOLVER_HPP
#define HRD_ASTAR_SOLVER_HPP

#include <vector>

#include "board.hpp"
#include "search_tree.hpp"

/**
 * @file hrd-a-star-solver.hpp
 * @brief A* solver for Hua Rong Dao boards.
 */

/**
 * @brief Solve the puzzle using A* with the Manhattan distance of the 2x2 piece.
 *
 * The frontier is ordered by f, then by higher g, then by discovery order.
 * Instead of decrease-key, a board may sit on the frontier several times;
 * entries whose g is worse than the best known one are dropped when popped.
 *
 * @param start Starting board.
 * @param options Pre-explored keys and expansion budget.
 * @param expanded_nodes Optional out-parameter to receive the number of expanded nodes.
 * @return A shortest sequence of boards from start to goal, inclusive.
 * @throws NoSolutionError when every reachable board was explored.
 * @throws SearchAbortedError when the expansion budget runs out.
 */
std::vector<Board> HrdSolveAstar(const Board &start, const SearchOptions &options = SearchOptions(), long* expanded_nodes = nullptr);

#endif // HRD_ASTAR_SOLVER_HPP
