#include "sudoku_rules.h"

#include <algorithm>

bool
isValidPlacement(const SudokuGrid& grid, size_t row, size_t col, cell_t value)
{
    if (value == 0) {
        return true;
    }

    // check row
    for (size_t c = 0; c < SudokuGrid::sideLen; c++) {
        if (c != col && grid.at(row, c) == value) {
            return false;
        }
    }

    // check col
    for (size_t r = 0; r < SudokuGrid::sideLen; r++) {
        if (r != row && grid.at(r, col) == value) {
            return false;
        }
    }

    // check box
    const size_t boxRow = (row / SudokuGrid::boxLen) * SudokuGrid::boxLen;
    const size_t boxCol = (col / SudokuGrid::boxLen) * SudokuGrid::boxLen;
    for (size_t r = boxRow; r < boxRow + SudokuGrid::boxLen; r++) {
        for (size_t c = boxCol; c < boxCol + SudokuGrid::boxLen; c++) {
            if ((r != row || c != col) && grid.at(r, c) == value) {
                return false;
            }
        }
    }

    return true;
}

std::vector<Position>
getConflicts(const SudokuGrid& grid)
{
    std::vector<Position> conflicts;
    for (size_t row = 0; row < SudokuGrid::sideLen; row++) {
        for (size_t col = 0; col < SudokuGrid::sideLen; col++) {
            const cell_t value = grid.at(row, col);
            if (value != 0 && !isValidPlacement(grid, row, col, value)) {
                conflicts.push_back({ row, col });
            }
        }
    }
    return conflicts;
}

bool
isValidPartialBoard(const SudokuGrid& grid)
{
    return getConflicts(grid).empty();
}

bool
hasValidCellValues(const SudokuGrid& grid)
{
    return std::all_of(grid.begin(), grid.end(), [](cell_t value) { return value >= 0 && value <= 9; });
}

bool
isValidBoardShape(const std::vector<std::vector<long long>>& rows)
{
    if (rows.size() != SudokuGrid::sideLen) {
        return false;
    }
    for (const auto& row : rows) {
        if (row.size() != SudokuGrid::sideLen) {
            return false;
        }
        for (const auto cell : row) {
            if (cell < 0 || cell > 9) {
                return false;
            }
        }
    }
    return true;
}

std::optional<SudokuGrid>
gridFromRows(const std::vector<std::vector<long long>>& rows)
{
    if (!isValidBoardShape(rows)) {
        return std::nullopt;
    }

    SudokuGrid grid;
    for (size_t row = 0; row < SudokuGrid::sideLen; row++) {
        for (size_t col = 0; col < SudokuGrid::sideLen; col++) {
            grid.at(row, col) = static_cast<cell_t>(rows[row][col]);
        }
    }
    return grid;
}

std::optional<SudokuGrid>
parseGrid(std::string_view text)
{
    SudokuGrid grid;
    size_t tokens = 0;
    for (const char ch : text) {
        switch (ch) {
            case ' ':
            case '\t':
            case '\r':
            case '\n':
            case '|':
            case '-':
            case '+':
                continue;
            default:
                break;
        }

        if (tokens == grid.size()) {
            // More than 81 cell symbols
            return std::nullopt;
        }

        if (ch >= '0' && ch <= '9') {
            grid[tokens++] = ch - '0';
        } else if (ch == '.') {
            grid[tokens++] = 0;
        } else {
            return std::nullopt;
        }
    }

    if (tokens != grid.size()) {
        return std::nullopt;
    }
    return grid;
}
