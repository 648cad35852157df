#ifndef __DISTANCE_HPP___
#define __DISTANCE_HPP___

#include "board.hpp"

/**
 * @file distance.hpp
 * @brief Heuristic distance functions for Hua Rong Dao boards.
 */

/**
 * @brief Manhattan distance from the 2x2 anchor to the goal anchor.
 *
 * Every move shifts one piece by one cell, so this never overestimates the
 * number of remaining moves and drops by at most one per move.
 *
 * @param board Current board.
 * @return Lower bound on the moves left to reach the goal.
 */
int manhattan_distance(const Board& board);

/**
 * @brief Manhattan distance scaled by `weight` (weighted A*).
 *
 * Not admissible for weight > 1.
 */
float weighted_manhattan_distance(const Board& board, float weight);

#endif // __DISTANCE_HPP___
