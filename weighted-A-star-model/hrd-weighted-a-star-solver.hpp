#ifndef HRD_WEIGHTED_ASTAR_SOLVER_HPP
#define HRD_WEIGHTED_ASTAR_SOLVER_HPP

#include <vector>

#include "board.hpp"

/**
 * @file hrd-weighted-a-star-solver.hpp
 * @brief Weighted A* solver adapter for Hua Rong Dao boards, on top of stlastar.
 */

const int WEIGHTED_ASTAR_DEFAULT_MAX_NODES = 200000;

/**
 * @brief Solve the puzzle using weighted A*.
 *
 * Unit move cost, heuristic `heuristic_weight` times the Manhattan distance
 * of the 2x2 piece. With a weight of 1 the path is a shortest one; larger
 * weights trade optimality for fewer expansions.
 *
 * @param start Starting board.
 * @param heuristic_weight Weight applied to the heuristic component (w*A*).
 * @param max_nodes Size of the search node pool.
 * @param expanded_nodes Optional out-parameter to receive the number of search steps.
 * @return Sequence of boards from start to goal, inclusive.
 * @throws NoSolutionError when the search fails.
 * @throws SearchAbortedError when the node pool runs out.
 */
std::vector<Board> HrdSolveWeightedAstar(const Board &start, float heuristic_weight = 1.0, int max_nodes = WEIGHTED_ASTAR_DEFAULT_MAX_NODES, long* expanded_nodes = nullptr);

#endif // HRD_WEIGHTED_ASTAR_SOLVER_HPP
