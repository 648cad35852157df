#include <algorithm>
#include <functional>
#include <set>
#include <string>
#include <vector>

#include "board.hpp"
#include "hrd_errors.hpp"

using namespace std;

const char* dir_to_str(const Direction& dir) {
    switch (dir) {
        case Direction::UP:
            return "up";
        case Direction::DOWN:
            return "down";
        case Direction::LEFT:
            return "left";
        case Direction::RIGHT:
            return "right";
        default:
            return "?";
    }
}

int Piece::height() const {
    return (kind == SQUARE || kind == VERTICAL) ? 2 : 1;
}

int Piece::width() const {
    return (kind == SQUARE || kind == HORIZONTAL) ? 2 : 1;
}

bool Piece::covers(int cell_row, int cell_column) const {
    return cell_row >= row && cell_row < row + height() &&
           cell_column >= column && cell_column < column + width();
}

bool Piece::operator==(const Piece& other) const {
    return kind == other.kind && row == other.row && column == other.column;
}

static bool inside_grid(int row, int column) {
    return row >= 0 && row < BOARD_ROWS && column >= 0 && column < BOARD_COLUMNS;
}

void Board::init(const vector<Piece>& pieces) {
    if (pieces.size() != static_cast<size_t>(BOARD_PIECES)) {
        throw InvalidBoardError("Board must hold exactly 10 pieces, got " + std::to_string(pieces.size()));
    }
    int squares = 0, dominoes = 0, singles = 0;
    cells.fill(-1);
    for (size_t id = 0; id < pieces.size(); ++id) {
        const Piece& piece = pieces[id];
        switch (piece.kind) {
            case SQUARE: ++squares; break;
            case HORIZONTAL:
            case VERTICAL: ++dominoes; break;
            case SINGLE: ++singles; break;
            default:
                throw InvalidBoardError("Piece " + std::to_string(id) + " has no valid kind");
        }
        for (int r = piece.row; r < piece.row + piece.height(); ++r) {
            for (int c = piece.column; c < piece.column + piece.width(); ++c) {
                if (!inside_grid(r, c)) {
                    throw InvalidBoardError("Piece " + std::to_string(id) + " leaves the grid");
                }
                int8_t& cell = cells[r * BOARD_COLUMNS + c];
                if (cell != -1) {
                    throw InvalidBoardError("Pieces " + std::to_string(cell) + " and " + std::to_string(id) +
                                            " overlap at (" + std::to_string(r) + "," + std::to_string(c) + ")");
                }
                cell = static_cast<int8_t>(id);
            }
        }
        if (piece.kind == SQUARE) square_id = static_cast<int>(id);
    }
    if (squares != 1 || dominoes != 5 || singles != 4) {
        throw InvalidBoardError("Board needs one 2x2, five 1x2 and four 1x1 pieces");
    }

    canonical_key = 0;
    for (int i = BOARD_CELLS - 1; i >= 0; --i) {
        canonical_key <<= 3;
        if (cells[i] != -1) canonical_key |= static_cast<BoardKey>(pieces[cells[i]].kind);
    }
    this->pieces = pieces;
}

Board::Board(const vector<Piece>& pieces) {
    init(pieces);
}

bool Board::is_goal() const {
    const Piece& square = get_square();
    return square.row == GOAL_ROW && square.column == GOAL_COLUMN;
}

size_t Board::hash() const {
    return std::hash<BoardKey>()(canonical_key);
}

const Piece& Board::get_piece(int piece_id) const {
    if (piece_id < 0 || piece_id >= static_cast<int>(pieces.size())) {
        throw out_of_range("No piece with id " + std::to_string(piece_id));
    }
    return pieces[piece_id];
}

const Piece& Board::get_square() const {
    // only a default-constructed board has no square
    if (square_id == -1) {
        throw InvalidBoardError("Board has no pieces");
    }
    return get_piece(square_id);
}

int Board::get_cell_piece(int row, int column) const {
    if (!inside_grid(row, column)) {
        throw out_of_range("Cell (" + std::to_string(row) + "," + std::to_string(column) + ") is off the board");
    }
    return cells[row * BOARD_COLUMNS + column];
}

PieceKind Board::get_cell_kind(int row, int column) const {
    int id = get_cell_piece(row, column);
    return id == -1 ? EMPTY : pieces[id].kind;
}

vector<int> Board::get_empty_positions() const {
    vector<int> empty_positions;
    for (int i = 0; i < BOARD_CELLS; ++i) {
        if (cells[i] == -1) empty_positions.push_back(i);
    }
    return empty_positions;
}

bool Board::can_move(int piece_id, Direction dir) const {
    if (piece_id < 0 || piece_id >= static_cast<int>(pieces.size())) return false;
    const Piece& piece = pieces[piece_id];
    DirectionDelta delta = dir_to_delta(dir);
    int row = piece.row + delta.drow;
    int column = piece.column + delta.dcolumn;
    for (int r = row; r < row + piece.height(); ++r) {
        for (int c = column; c < column + piece.width(); ++c) {
            if (!inside_grid(r, c)) return false;
            int occupant = cells[r * BOARD_COLUMNS + c];
            if (occupant != -1 && occupant != piece_id) return false;
        }
    }
    return true;
}

Board Board::apply_move(int piece_id, Direction dir) const {
    if (piece_id < 0 || piece_id >= static_cast<int>(pieces.size())) {
        throw IllegalMoveError("No piece with id " + std::to_string(piece_id));
    }
    if (!can_move(piece_id, dir)) {
        throw IllegalMoveError("Piece " + std::to_string(piece_id) + " cannot move " + dir_to_str(dir));
    }
    vector<Piece> moved = pieces;
    DirectionDelta delta = dir_to_delta(dir);
    moved[piece_id].row += delta.drow;
    moved[piece_id].column += delta.dcolumn;
    return Board(moved);
}

vector<Move> Board::get_legal_moves() const {
    // Only a piece next to an empty cell can slide, so look around the two holes.
    set<Move> candidates;
    for (int empty_pos : get_empty_positions()) {
        int row = empty_pos / BOARD_COLUMNS;
        int column = empty_pos % BOARD_COLUMNS;
        for (Direction dir : DIRECTIONS) {
            // The neighbour that would slide into this cell when moving in `dir`
            DirectionDelta delta = dir_to_delta(dir);
            int from_row = row - delta.drow;
            int from_column = column - delta.dcolumn;
            if (!inside_grid(from_row, from_column)) continue;
            int piece_id = cells[from_row * BOARD_COLUMNS + from_column];
            if (piece_id == -1) continue;
            if (can_move(piece_id, dir)) candidates.insert({piece_id, dir});
        }
    }
    return vector<Move>(candidates.begin(), candidates.end());
}

vector<Board> Board::get_available_moves() const {
    vector<Board> moves;
    for (const Move& move : get_legal_moves()) {
        moves.push_back(apply_move(move.first, move.second));
    }
    return moves;
}

string Board::to_string() const {
    string s;
    for (int r = 0; r < BOARD_ROWS; ++r) {
        if (r) s += '\n';
        for (int c = 0; c < BOARD_COLUMNS; ++c) {
            s += static_cast<char>('0' + get_cell_kind(r, c));
        }
    }
    return s;
}

bool Board::operator==(const Board& rhs) const {
    return canonical_key == rhs.canonical_key;
}

bool Board::operator!=(const Board& rhs) const {
    return !(*this == rhs);
}

bool Board::operator<(const Board& rhs) const {
    return canonical_key < rhs.canonical_key;
}
