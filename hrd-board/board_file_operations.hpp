#ifndef __BOARD_FILE_OPERATIONS_HPP___
#define __BOARD_FILE_OPERATIONS_HPP___

#include <algorithm>
#include <cctype>
#include <fstream>
#include <map>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "board.hpp"
#include "hrd_errors.hpp"

/**
 * @file board_file_operations.hpp
 * @brief Helpers to read/write `Board` values and solutions from plain text files.
 *
 * Puzzle files hold five rows of four characters:
 * `0` empty, `1` the 2x2 piece, `2`..`6` one 1x2 piece each (orientation is
 * read from the shape), `7` a 1x1 piece. Blank lines and surrounding
 * whitespace are ignored.
 *
 * Boards are written back with one digit per cell naming the piece kind:
 * `0` empty, `1` 2x2, `2` horizontal 1x2, `3` vertical 1x2, `4` 1x1.
 */

/**
 * @brief Build a `Board` from the five text rows of a puzzle.
 *
 * Piece ids follow the row-major order in which pieces are first met.
 *
 * @throws InvalidBoardError if the grid is malformed.
 */
inline Board parse_board(const std::vector<std::string>& lines) {
    std::vector<std::string> rows;
    for (const std::string& line : lines) {
        std::string row;
        for (char ch : line) {
            if (!std::isspace(static_cast<unsigned char>(ch))) row += ch;
        }
        if (!row.empty()) rows.push_back(row);
    }
    if (rows.size() != static_cast<size_t>(BOARD_ROWS)) {
        throw InvalidBoardError("Expected " + std::to_string(BOARD_ROWS) + " rows, got " + std::to_string(rows.size()));
    }

    // label -> cells in row-major order, plus the order labels appear in
    std::map<char, std::vector<std::pair<int, int>>> groups;
    std::vector<char> labels;
    std::vector<Piece> pieces;
    for (int r = 0; r < BOARD_ROWS; ++r) {
        if (rows[r].size() != static_cast<size_t>(BOARD_COLUMNS)) {
            throw InvalidBoardError("Row " + std::to_string(r) + " must have " + std::to_string(BOARD_COLUMNS) + " cells");
        }
        for (int c = 0; c < BOARD_COLUMNS; ++c) {
            char ch = rows[r][c];
            if (ch == '0') continue;
            if (ch == '7') {
                pieces.push_back({SINGLE, r, c});
                labels.push_back(ch);
                continue;
            }
            if (ch < '1' || ch > '6') {
                throw InvalidBoardError(std::string("Unknown cell label '") + ch + "'");
            }
            if (groups[ch].empty()) {
                // placeholder, the kind is fixed once every cell is known
                pieces.push_back({EMPTY, r, c});
                labels.push_back(ch);
            }
            groups[ch].push_back({r, c});
        }
    }

    for (size_t id = 0; id < pieces.size(); ++id) {
        if (labels[id] == '7') continue;
        const std::vector<std::pair<int, int>>& group = groups[labels[id]];
        int r = group[0].first, c = group[0].second;
        if (labels[id] == '1') {
            if (group.size() != 4 || group[1] != std::make_pair(r, c + 1) ||
                group[2] != std::make_pair(r + 1, c) || group[3] != std::make_pair(r + 1, c + 1)) {
                throw InvalidBoardError("The 2x2 piece must cover a 2x2 square");
            }
            pieces[id].kind = SQUARE;
        } else if (group.size() == 2 && group[1] == std::make_pair(r, c + 1)) {
            pieces[id].kind = HORIZONTAL;
        } else if (group.size() == 2 && group[1] == std::make_pair(r + 1, c)) {
            pieces[id].kind = VERTICAL;
        } else {
            throw InvalidBoardError(std::string("Piece '") + labels[id] + "' is not a 1x2 piece");
        }
    }
    return Board(pieces);
}

/**
 * @brief Read a `Board` from a puzzle file.
 *
 * @param filename Path to the input file.
 * @throws std::runtime_error if the file cannot be opened.
 * @throws InvalidBoardError if its content is not a valid board.
 */
inline Board read_board_from_file(const std::string& filename) {
    std::ifstream infile(filename);
    if (!infile.is_open()) {
        throw std::runtime_error("Could not open file: " + filename);
    }
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(infile, line)) {
        lines.push_back(line);
    }
    return parse_board(lines);
}

/**
 * @brief Write a `Board` in kind-digit form.
 *
 * @throws std::runtime_error if the file cannot be opened for writing.
 */
inline void write_board_to_file(const Board& board, const std::string& filename) {
    std::ofstream outfile(filename);
    if (!outfile.is_open()) {
        throw std::runtime_error("Could not open file for writing: " + filename);
    }
    outfile << board.to_string() << "\n";
}

/**
 * @brief Write a solution: its cost line, then every board separated by a blank line.
 *
 * @param path Boards from start to goal, inclusive.
 * @throws std::runtime_error if the file cannot be opened for writing.
 */
inline void write_solution_to_file(const std::vector<Board>& path, const std::string& filename) {
    std::ofstream outfile(filename);
    if (!outfile.is_open()) {
        throw std::runtime_error("Could not open file for writing: " + filename);
    }
    size_t cost = path.empty() ? 0 : path.size() - 1;
    outfile << "Cost of the solution: " << cost << "\n";
    for (const Board& board : path) {
        outfile << board.to_string() << "\n\n";
    }
}

#endif // __BOARD_FILE_OPERATIONS_HPP___
