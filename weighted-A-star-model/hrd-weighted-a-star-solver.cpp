#include <string>
#include <vector>
#include "board.hpp"
#include "distance.hpp"
#include "hrd_errors.hpp"
#include "hrd-weighted-a-star-solver.hpp"
#include "stlastar.h"

// Board type that implements the A* user-state interface
class HrdAStarState {
public:
    HrdAStarState() = default;
    HrdAStarState(const Board &b, float heuristic_weight) {
        board_ = b;
        heuristic_weight_ = heuristic_weight;
    }
    ~HrdAStarState() = default;

    // AStarState interface
    float GoalDistanceEstimate(HrdAStarState &nodeGoal);
    bool IsGoal(HrdAStarState &nodeGoal);
    bool GetSuccessors(AStarSearch<HrdAStarState> *astarsearch, HrdAStarState *parent_node);
    float GetCost(HrdAStarState &successor);
    bool IsSameState(HrdAStarState &rhs);
    size_t Hash();

    const Board &to_board() const { return board_; }

private:
    Board board_;
    float heuristic_weight_ = 1.0;
};

float HrdAStarState::GoalDistanceEstimate(HrdAStarState &nodeGoal) {
    return weighted_manhattan_distance(board_, heuristic_weight_);
}

// The search keeps the goal state it was given and hands it out as the last
// solution step, so the board that actually reached the goal is recorded there.
bool HrdAStarState::IsGoal(HrdAStarState &nodeGoal) {
    if (!board_.is_goal()) return false;
    nodeGoal.board_ = board_;
    return true;
}

bool HrdAStarState::GetSuccessors(AStarSearch<HrdAStarState> *astarsearch, HrdAStarState *parent_node) {
    for (const Board &next : board_.get_available_moves()) {
        // skip undoing the move that led here
        if (parent_node && next == parent_node->board_) continue;
        HrdAStarState tmp(next, heuristic_weight_);
        if (!astarsearch->AddSuccessor(tmp)) return false;
    }
    return true;
}

float HrdAStarState::GetCost(HrdAStarState &successor) {
    return 1.0f;
}

bool HrdAStarState::IsSameState(HrdAStarState &rhs) {
    return board_ == rhs.board_;
}

size_t HrdAStarState::Hash() {
    return board_.hash();
}

std::vector<Board> HrdSolveWeightedAstar(const Board &start, float heuristic_weight, int max_nodes, long* expanded_nodes) {
    HrdAStarState sstart(start, heuristic_weight);
    // any board will do: IsGoal only looks at the 2x2 piece
    HrdAStarState sgoal(start, heuristic_weight);

    AStarSearch<HrdAStarState> search_(max_nodes);
    search_.SetStartAndGoalStates(sstart, sgoal);

    unsigned int result = 0;
    do {
        result = search_.SearchStep();
    } while (result == AStarSearch<HrdAStarState>::SEARCH_STATE_SEARCHING);

    if (expanded_nodes) {
        *expanded_nodes = search_.GetStepCount();
    }

    if (result == AStarSearch<HrdAStarState>::SEARCH_STATE_OUT_OF_MEMORY) {
        throw SearchAbortedError("Weighted A* ran out of its " + std::to_string(max_nodes) + " node pool",
                                 search_.GetStepCount());
    }
    if (result != AStarSearch<HrdAStarState>::SEARCH_STATE_SUCCEEDED) {
        throw NoSolutionError("Weighted A* explored " + std::to_string(search_.GetStepCount()) +
                              " boards without reaching the goal");
    }

    std::vector<Board> path;
    HrdAStarState *p = search_.GetSolutionStart();
    while (p) {
        path.push_back(p->to_board());
        p = search_.GetSolutionNext();
    }

    search_.FreeSolutionNodes();
    return path;
}
