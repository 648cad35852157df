// Google Test for the DFS, A* and BFS solvers
#include <gtest/gtest.h>
#include <algorithm>
#include <string>
#include <vector>

#include "board.hpp"
#include "board_file_operations.hpp"
#include "hrd_errors.hpp"
#include "hrd-a-star-solver.hpp"
#include "hrd-bfs-solver.hpp"
#include "hrd-dfs-solver.hpp"

static const std::vector<std::string> CLASSIC = {"2113", "2113", "4665", "4775", "7007"};
static const std::vector<std::string> ONE_MOVE = {"2663", "2773", "4115", "4115", "7007"};
static const std::vector<std::string> SOLVED = {"2663", "2773", "4005", "4115", "7117"};

static void expect_valid_path(const Board& start, const std::vector<Board>& path) {
    ASSERT_FALSE(path.empty());
    EXPECT_EQ(path.front(), start);
    EXPECT_TRUE(path.back().is_goal());
    for (size_t i = 1; i < path.size(); ++i) {
        std::vector<Board> next = path[i - 1].get_available_moves();
        EXPECT_NE(std::find(next.begin(), next.end(), path[i]), next.end()) << "step " << i << " is not a single move";
    }
}

TEST(PuzzleSolver, AlreadySolved) {
    Board start = parse_board(SOLVED);
    long dfs_expanded = -1, astar_expanded = -1;

    auto dfs_path = HrdSolveDfs(start, SearchOptions(), &dfs_expanded);
    auto astar_path = HrdSolveAstar(start, SearchOptions(), &astar_expanded);

    ASSERT_EQ(dfs_path.size(), 1u);
    ASSERT_EQ(astar_path.size(), 1u);
    EXPECT_EQ(dfs_path[0], start);
    EXPECT_EQ(astar_path[0], start);
    EXPECT_EQ(dfs_expanded, 0);
    EXPECT_EQ(astar_expanded, 0);
}

TEST(PuzzleSolver, OneMoveSolution) {
    Board start = parse_board(ONE_MOVE);

    auto astar_path = HrdSolveAstar(start);
    auto dfs_path = HrdSolveDfs(start);
    auto bfs_path = HrdSolveBfs(start);

    EXPECT_EQ(astar_path.size(), 2u);
    EXPECT_EQ(bfs_path.size(), 2u);
    // the square's move is generated first, so DFS takes it straight away
    EXPECT_EQ(dfs_path.size(), 2u);
    expect_valid_path(start, astar_path);
    expect_valid_path(start, dfs_path);
    EXPECT_EQ(astar_path.back(), start.apply_move(6, DOWN));
}

TEST(PuzzleSolver, ClassicLayout) {
    Board start = parse_board(CLASSIC);
    long dfs_expanded = 0, astar_expanded = 0, bfs_expanded = 0;

    auto astar_path = HrdSolveAstar(start, SearchOptions(), &astar_expanded);
    auto bfs_path = HrdSolveBfs(start, SearchOptions(), &bfs_expanded);
    auto dfs_path = HrdSolveDfs(start, SearchOptions(), &dfs_expanded);

    expect_valid_path(start, astar_path);
    expect_valid_path(start, bfs_path);
    expect_valid_path(start, dfs_path);

    // A* is optimal, DFS only finds some solution
    EXPECT_EQ(astar_path.size(), bfs_path.size());
    EXPECT_LE(astar_path.size(), dfs_path.size());
    // a consistent heuristic never expands more than blind breadth-first search
    EXPECT_LE(astar_expanded, bfs_expanded);
    EXPECT_GT(astar_expanded, 0);
    EXPECT_GT(dfs_expanded, 0);
}

TEST(PuzzleSolver, RepeatedRunsAreDeterministic) {
    Board start = parse_board(CLASSIC);
    long first_expanded = 0, second_expanded = 0;

    auto first = HrdSolveAstar(start, SearchOptions(), &first_expanded);
    auto second = HrdSolveAstar(start, SearchOptions(), &second_expanded);

    EXPECT_EQ(first, second);
    EXPECT_EQ(first_expanded, second_expanded);
}

TEST(PuzzleSolver, SeenBoardsExhaustFrontier) {
    Board start = parse_board(CLASSIC);
    SearchOptions options;
    for (const Board& next : start.get_available_moves()) {
        options.seen.insert(next.key());
    }

    long expanded = 0;
    EXPECT_THROW(HrdSolveDfs(start, options, &expanded), NoSolutionError);
    EXPECT_EQ(expanded, 1);
    EXPECT_THROW(HrdSolveAstar(start, options, &expanded), NoSolutionError);
    EXPECT_EQ(expanded, 1);
    EXPECT_THROW(HrdSolveBfs(start, options, &expanded), NoSolutionError);
    EXPECT_EQ(expanded, 1);
}

TEST(PuzzleSolver, UnsolvableBoard) {
    // the two empty cells can never meet, so nothing larger than a 1x1 piece ever moves
    Board start = parse_board({"2340", "2347", "1155", "1176", "7076"});
    long expanded = 0;

    EXPECT_THROW(HrdSolveDfs(start, SearchOptions(), &expanded), NoSolutionError);
    EXPECT_EQ(expanded, 8);
    EXPECT_THROW(HrdSolveAstar(start, SearchOptions(), &expanded), NoSolutionError);
    EXPECT_EQ(expanded, 8);
    EXPECT_THROW(HrdSolveBfs(start, SearchOptions(), &expanded), NoSolutionError);
    EXPECT_EQ(expanded, 8);
}

TEST(PuzzleSolver, DefaultBoardIsRejected) {
    EXPECT_THROW(HrdSolveDfs(Board()), InvalidBoardError);
    EXPECT_THROW(HrdSolveAstar(Board()), InvalidBoardError);
    EXPECT_THROW(HrdSolveBfs(Board()), InvalidBoardError);
}

TEST(PuzzleSolver, SeenDoesNotHideStart) {
    Board start = parse_board(SOLVED);
    SearchOptions options;
    options.seen.insert(start.key());

    EXPECT_EQ(HrdSolveAstar(start, options).size(), 1u);
    EXPECT_EQ(HrdSolveDfs(start, options).size(), 1u);
}

TEST(PuzzleSolver, ExpansionBudgetAborts) {
    Board start = parse_board(CLASSIC);
    SearchOptions options;
    options.max_expansions = 10;

    try {
        HrdSolveAstar(start, options);
        FAIL() << "expected SearchAbortedError";
    } catch (const SearchAbortedError& e) {
        EXPECT_EQ(e.get_expanded_nodes(), 10);
    }
    EXPECT_THROW(HrdSolveDfs(start, options), SearchAbortedError);
    EXPECT_THROW(HrdSolveBfs(start, options), SearchAbortedError);

    // a budget that is large enough changes nothing
    EXPECT_EQ(HrdSolveAstar(parse_board(ONE_MOVE), options).size(), 2u);
}
