#ifndef SUDOKUFORGE_SUDOKU_RULES_H
#define SUDOKUFORGE_SUDOKU_RULES_H

#include "sudoku_grid.h"
#include <optional>
#include <string_view>
#include <vector>

/**
 * Checks whether value may occupy the cell (row, col), i.e. it does not appear in any other cell of the same row,
 * column or box. The cell itself is not compared, so this works for empty and for already filled cells.
 *
 * @return true for value 0, otherwise true iff there is no conflicting cell
 */
[[nodiscard]] bool
isValidPlacement(const SudokuGrid& grid, size_t row, size_t col, cell_t value);

/**
 * Returns the positions of all filled cells that conflict with another cell, in row-major order.
 */
[[nodiscard]] std::vector<Position>
getConflicts(const SudokuGrid& grid);

[[nodiscard]] bool
isValidPartialBoard(const SudokuGrid& grid);

/**
 * Checks that every cell holds a value in [0, 9]. SudokuGrid does not enforce the range on writes.
 */
[[nodiscard]] bool
hasValidCellValues(const SudokuGrid& grid);

/**
 * Structural check for untrusted input: exactly 9 rows of exactly 9 integers, each in [0, 9].
 */
[[nodiscard]] bool
isValidBoardShape(const std::vector<std::vector<long long>>& rows);

/**
 * Builds a grid from decoded rows.
 *
 * @return the grid or std::nullopt if the rows fail isValidBoardShape()
 */
[[nodiscard]] std::optional<SudokuGrid>
gridFromRows(const std::vector<std::vector<long long>>& rows);

/**
 * Parses the text form written by SudokuGrid::printGrid(). Exactly 81 cell symbols are expected: '1'-'9' for
 * filled cells and '0' or '.' for empty cells. Whitespace and the box separators '|', '-' and '+' are skipped.
 *
 * @return the grid or std::nullopt for any other character or symbol count
 */
[[nodiscard]] std::optional<SudokuGrid>
parseGrid(std::string_view text);

#endif // SUDOKUFORGE_SUDOKU_RULES_H
