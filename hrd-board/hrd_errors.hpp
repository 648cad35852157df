#ifndef __HRD_ERRORS_HPP___
#define __HRD_ERRORS_HPP___

#include <stdexcept>
#include <string>

/**
 * @file hrd_errors.hpp
 * @brief Exception types raised by the board model and the solvers.
 */

/**
 * @brief A board violates the layout invariants (piece count, kinds, overlap, bounds).
 */
class InvalidBoardError : public std::invalid_argument {
public:
    explicit InvalidBoardError(const std::string& what) : std::invalid_argument(what) {}
};

/**
 * @brief A move leaves the grid, hits another piece or names an unknown piece.
 *
 * The move generator only proposes legal moves, so seeing this from a solver
 * means the generator is broken.
 */
class IllegalMoveError : public std::logic_error {
public:
    explicit IllegalMoveError(const std::string& what) : std::logic_error(what) {}
};

/**
 * @brief The search exhausted its frontier without reaching the goal.
 */
class NoSolutionError : public std::runtime_error {
public:
    explicit NoSolutionError(const std::string& what) : std::runtime_error(what) {}
};

/**
 * @brief The search ran over its expansion budget.
 */
class SearchAbortedError : public std::runtime_error {
public:
    SearchAbortedError(const std::string& what, long expanded_nodes)
        : std::runtime_error(what), expanded_nodes(expanded_nodes) {}

    long get_expanded_nodes() const { return expanded_nodes; }

private:
    long expanded_nodes;
};

#endif // __HRD_ERRORS_HPP___
