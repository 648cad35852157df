// Google Test for Board::get_legal_moves / get_available_moves
#include <gtest/gtest.h>
#include <queue>
#include <set>
#include <string>
#include <unordered_set>
#include <vector>

#include "board.hpp"
#include "board_file_operations.hpp"

static Board board_from(const std::vector<std::string>& rows) {
    return parse_board(rows);
}

static void expect_layout_invariants(const Board& b) {
    int empty = 0;
    std::set<int> ids;
    for (int r = 0; r < BOARD_ROWS; ++r) {
        for (int c = 0; c < BOARD_COLUMNS; ++c) {
            int id = b.get_cell_piece(r, c);
            if (id == -1) {
                ++empty;
                continue;
            }
            ids.insert(id);
            EXPECT_TRUE(b.get_piece(id).covers(r, c));
        }
    }
    EXPECT_EQ(empty, 2);
    EXPECT_EQ(ids.size(), 10u);

    int squares = 0, dominoes = 0, singles = 0;
    for (const Piece& p : b.get_pieces()) {
        if (p.kind == SQUARE) ++squares;
        else if (p.kind == HORIZONTAL || p.kind == VERTICAL) ++dominoes;
        else if (p.kind == SINGLE) ++singles;
    }
    EXPECT_EQ(squares, 1);
    EXPECT_EQ(dominoes, 5);
    EXPECT_EQ(singles, 4);
}

TEST(AvailableMoves, ClassicOpening) {
    Board b = board_from({"2113", "2113", "4665", "4775", "7007"});

    std::vector<Move> expected = {{6, DOWN}, {7, DOWN}, {8, RIGHT}, {9, LEFT}};
    EXPECT_EQ(b.get_legal_moves(), expected);

    auto moves = b.get_available_moves();
    ASSERT_EQ(moves.size(), 4u);
    // single (3,1) dropped into (4,1)
    std::vector<int> expected_empty = {13, 18};
    EXPECT_EQ(moves[0].get_empty_positions(), expected_empty);
    EXPECT_EQ(moves[0], b.apply_move(6, DOWN));
}

TEST(AvailableMoves, SquareDropsIntoTwoEmptyCells) {
    Board b = board_from({"2663", "2773", "4115", "4115", "7007"});

    // the square is reachable from both empty cells but listed once
    std::vector<Move> expected = {{6, DOWN}, {8, RIGHT}, {9, LEFT}};
    EXPECT_EQ(b.get_legal_moves(), expected);
    EXPECT_TRUE(b.get_available_moves()[0].is_goal());
}

TEST(AvailableMoves, SidewaysNeedsStackedEmptyCells) {
    Board b = board_from({"6677", "1102", "1102", "3457", "3457"});

    std::vector<Move> expected = {{1, DOWN}, {3, RIGHT}, {4, LEFT}, {7, UP}};
    EXPECT_EQ(b.get_legal_moves(), expected);

    Board shifted = b.apply_move(3, RIGHT);
    EXPECT_EQ(shifted.get_square().column, 1);
    std::vector<int> expected_empty = {4, 8};
    EXPECT_EQ(shifted.get_empty_positions(), expected_empty);
}

TEST(AvailableMoves, LyingPieceNeedsBothCellsAbove) {
    // only (3,1) is free above the 1x2 piece at the bottom left
    Board b = board_from({"2113", "2113", "4775", "4075", "6607"});

    std::vector<Move> expected = {{4, DOWN}, {7, DOWN}, {7, LEFT}, {8, RIGHT}, {9, LEFT}};
    EXPECT_EQ(b.get_legal_moves(), expected);
    EXPECT_FALSE(b.can_move(8, UP));
    EXPECT_FALSE(b.can_move(3, RIGHT));
}

TEST(AvailableMoves, SuccessorsKeepInvariantsAndAreReversible) {
    Board start = board_from({"2113", "2113", "4665", "4775", "7007"});

    std::queue<Board> frontier;
    std::unordered_set<BoardKey> discovered;
    frontier.push(start);
    discovered.insert(start.key());
    int examined = 0;
    while (!frontier.empty() && examined < 500) {
        Board b = frontier.front();
        frontier.pop();
        ++examined;
        expect_layout_invariants(b);

        for (const Move& move : b.get_legal_moves()) {
            Board next = b.apply_move(move.first, move.second);
            EXPECT_EQ(next.apply_move(move.first, dir_inv(move.second)), b);
            if (discovered.insert(next.key()).second) frontier.push(next);
        }
    }
    EXPECT_EQ(examined, 500);
}
