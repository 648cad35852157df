/**
 * @file board.hpp
 * @brief Hua Rong Dao board representation (pieces, occupancy and moves).
 *
 * This header declares the Board class used by every solver and tool.
 */

#ifndef __BOARD_HPP___
#define __BOARD_HPP___

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

const int BOARD_ROWS = 5;
const int BOARD_COLUMNS = 4;
const int BOARD_CELLS = BOARD_ROWS * BOARD_COLUMNS;
const int BOARD_PIECES = 10;

// Anchor of the 2x2 piece in a solved board (bottom centre).
const int GOAL_ROW = 3;
const int GOAL_COLUMN = 1;

// Values double as the per-cell digits of the canonical key and of the output format.
enum PieceKind {
    EMPTY = 0,
    SQUARE = 1,      // 2x2
    HORIZONTAL = 2,  // 1x2 lying
    VERTICAL = 3,    // 1x2 standing
    SINGLE = 4,      // 1x1
};

// Order is the move generation priority.
enum Direction {
    UP = 0,
    DOWN = 1,
    LEFT = 2,
    RIGHT = 3,
};

const Direction DIRECTIONS[4] = {Direction::UP, Direction::DOWN, Direction::LEFT, Direction::RIGHT};

typedef struct DirectionDelta {
    int drow, dcolumn;
} DirectionDelta;

const DirectionDelta DIRECTION_DELTAS[4] = {
    {-1, 0},  // Up
    {1, 0},   // Down
    {0, -1},  // Left
    {0, 1},   // Right
};

inline Direction dir_inv(const Direction& dir) { return static_cast<Direction>(dir ^ 1); }

inline DirectionDelta dir_to_delta(const Direction& dir) { return DIRECTION_DELTAS[dir]; }

const char* dir_to_str(const Direction& dir);

/**
 * @brief A piece: its kind and anchor (top-left occupied cell).
 */
struct Piece {
    PieceKind kind;
    int row;
    int column;

    int height() const;
    int width() const;
    bool covers(int cell_row, int cell_column) const;
    bool operator==(const Piece& other) const;
};

typedef uint64_t BoardKey;
typedef std::pair<int, Direction> Move;  // (piece id, direction)

/**
 * @brief Immutable Hua Rong Dao configuration.
 *
 * Pieces are addressed by id (their index in the list given at construction);
 * ids survive moves. Occupancy and the canonical key are derived from the
 * piece list once, at construction. Equality, ordering and hashing only look
 * at the canonical key, so two boards that differ in piece numbering but not
 * in layout compare equal.
 */
class Board {

private:
    std::vector<Piece> pieces;
    std::array<int8_t, BOARD_CELLS> cells{};  // piece id per cell, -1 when empty
    BoardKey canonical_key = 0;
    int square_id = -1;
    void init(const std::vector<Piece>& pieces);
public:
    Board() = default;

    /**
     * @brief Construct a board from its pieces.
     *
     * @param pieces Exactly one SQUARE, five HORIZONTAL/VERTICAL and four SINGLE pieces.
     * @throws InvalidBoardError when a footprint leaves the grid, footprints
     *         overlap, or the piece multiset is wrong.
     */
    explicit Board(const std::vector<Piece>& pieces);
    ~Board() = default;

    // Rule of five
    Board(const Board& other) = default;
    Board& operator=(const Board& other) = default;
    Board(Board&& other) = default;
    Board& operator=(Board&& other) = default;

    /**
     * @brief True iff the 2x2 piece is anchored at (GOAL_ROW, GOAL_COLUMN).
     */
    bool is_goal() const;

    /**
     * @brief Canonical key: 3 bits of piece kind per cell, row-major, cell 0 in the low bits.
     *
     * Independent of piece ids. The kind grid pins the layout down because a run
     * of equally oriented 1x2 cells can only be split into pieces from its first cell.
     */
    BoardKey key() const { return canonical_key; }

    size_t hash() const;

    const std::vector<Piece>& get_pieces() const { return pieces; }
    const Piece& get_piece(int piece_id) const;
    const Piece& get_square() const;

    /**
     * @brief Id of the piece covering a cell, or -1 for an empty cell.
     */
    int get_cell_piece(int row, int column) const;

    PieceKind get_cell_kind(int row, int column) const;

    /**
     * @brief Return the linear indices (row * BOARD_COLUMNS + column) of the two empty cells.
     */
    std::vector<int> get_empty_positions() const;

    bool can_move(int piece_id, Direction dir) const;

    /**
     * @brief Slide one piece one cell.
     *
     * @throws IllegalMoveError if the id is unknown, the piece would leave the
     *         grid or a target cell is covered by another piece.
     * @return The resulting board; this board is left untouched.
     */
    Board apply_move(int piece_id, Direction dir) const;

    /**
     * @brief All legal (piece id, direction) pairs, ordered by piece id, then UP, DOWN, LEFT, RIGHT.
     */
    std::vector<Move> get_legal_moves() const;

    /**
     * @brief Successor boards, in get_legal_moves() order.
     */
    std::vector<Board> get_available_moves() const;

    /**
     * @brief Kind digits, one line per row, no trailing newline.
     */
    std::string to_string() const;

    bool operator==(const Board& rhs) const;
    bool operator!=(const Board& rhs) const;
    bool operator<(const Board& rhs) const;
};

struct BoardHash {
    size_t operator()(const Board& board) const { return board.hash(); }
};

#endif // __BOARD_HPP___
