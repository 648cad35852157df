#include <cstdlib>

#include "board.hpp"
#include "distance.hpp"

using namespace std;

int manhattan_distance(const Board& board) {
    const Piece& square = board.get_square();
    return abs(square.row - GOAL_ROW) + abs(square.column - GOAL_COLUMN);
}

float weighted_manhattan_distance(const Board& board, float weight) {
    return weight * static_cast<float>(manhattan_distance(board));
}
