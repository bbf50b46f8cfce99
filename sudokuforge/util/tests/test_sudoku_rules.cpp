#include "gtest/gtest.h"
#include "sudoku_rules.h"

#include <vector>

namespace {

SudokuGrid
classicPuzzle()
{
    return *parseGrid("53..7....6..195....98....6.8...6...34..8.3..17...2...6.6....28....419..5....8..79");
}

std::vector<std::vector<long long>>
rowsOf(const SudokuGrid& grid)
{
    std::vector<std::vector<long long>> rows(9);
    for (size_t row = 0; row < 9; row++) {
        for (size_t col = 0; col < 9; col++) {
            rows[row].push_back(grid.at(row, col));
        }
    }
    return rows;
}

TEST(sudoku_rules, test_placement_rejects_row_duplicate)
{
    SudokuGrid grid;
    grid.at(0, 7) = 5;
    EXPECT_FALSE(isValidPlacement(grid, 0, 2, 5));
}

TEST(sudoku_rules, test_placement_rejects_col_and_box_duplicates)
{
    SudokuGrid grid;
    grid.at(6, 2) = 4;
    grid.at(1, 1) = 8;

    EXPECT_FALSE(isValidPlacement(grid, 0, 2, 4));
    EXPECT_FALSE(isValidPlacement(grid, 0, 2, 8));
    EXPECT_TRUE(isValidPlacement(grid, 0, 2, 1));
}

TEST(sudoku_rules, test_placement_accepts_conflict_free_value)
{
    const auto grid = classicPuzzle();

    // Row 0 holds 5, 3, 7; column 2 holds 8; the top-left box holds 5, 3, 6, 9, 8
    EXPECT_TRUE(isValidPlacement(grid, 0, 2, 4));
    EXPECT_TRUE(isValidPlacement(grid, 0, 2, 1));
    EXPECT_FALSE(isValidPlacement(grid, 0, 2, 5));
    EXPECT_FALSE(isValidPlacement(grid, 0, 2, 8));
    EXPECT_FALSE(isValidPlacement(grid, 0, 2, 6));
}

TEST(sudoku_rules, test_placement_of_zero_is_always_valid)
{
    const auto grid = classicPuzzle();
    for (size_t idx = 0; idx < grid.size(); idx++) {
        EXPECT_TRUE(isValidPlacement(grid, idx / 9, idx % 9, 0));
    }
}

TEST(sudoku_rules, test_placement_excludes_the_cell_itself)
{
    const auto grid = classicPuzzle();
    for (size_t row = 0; row < 9; row++) {
        for (size_t col = 0; col < 9; col++) {
            EXPECT_TRUE(isValidPlacement(grid, row, col, grid.at(row, col)));
        }
    }
}

TEST(sudoku_rules, test_conflicts_on_empty_board)
{
    EXPECT_TRUE(getConflicts(SudokuGrid()).empty());
    EXPECT_TRUE(isValidPartialBoard(SudokuGrid()));
}

TEST(sudoku_rules, test_conflicts_two_sevens_in_a_row)
{
    SudokuGrid grid;
    grid.at(3, 1) = 7;
    grid.at(3, 6) = 7;
    grid.at(5, 5) = 2;

    const auto conflicts = getConflicts(grid);
    ASSERT_EQ(conflicts.size(), 2);
    EXPECT_EQ(conflicts[0], (Position{ 3, 1 }));
    EXPECT_EQ(conflicts[1], (Position{ 3, 6 }));
    EXPECT_FALSE(isValidPartialBoard(grid));
}

TEST(sudoku_rules, test_conflicts_in_box_and_column)
{
    SudokuGrid grid;
    grid.at(0, 0) = 4;
    grid.at(2, 2) = 4;
    grid.at(8, 4) = 1;
    grid.at(0, 4) = 1;

    const auto conflicts = getConflicts(grid);
    const std::vector<Position> expected{ { 0, 0 }, { 0, 4 }, { 2, 2 }, { 8, 4 } };
    EXPECT_EQ(conflicts, expected);
}

TEST(sudoku_rules, test_conflicts_none_on_valid_puzzle)
{
    EXPECT_TRUE(getConflicts(classicPuzzle()).empty());
    EXPECT_TRUE(isValidPartialBoard(classicPuzzle()));
}

TEST(sudoku_rules, test_cell_value_range)
{
    auto grid = classicPuzzle();
    EXPECT_TRUE(hasValidCellValues(grid));
    EXPECT_TRUE(hasValidCellValues(SudokuGrid()));

    grid.at(0, 2) = 10;
    EXPECT_FALSE(hasValidCellValues(grid));

    grid.at(0, 2) = -3;
    EXPECT_FALSE(hasValidCellValues(grid));

    grid.at(0, 2) = 9;
    EXPECT_TRUE(hasValidCellValues(grid));
}

TEST(sudoku_rules, test_board_shape_accepts_valid_rows)
{
    const auto rows = rowsOf(classicPuzzle());
    EXPECT_TRUE(isValidBoardShape(rows));

    const auto grid = gridFromRows(rows);
    ASSERT_TRUE(grid.has_value());
    EXPECT_EQ(*grid, classicPuzzle());
}

TEST(sudoku_rules, test_board_shape_rejects_wrong_dimensions)
{
    auto rows = rowsOf(classicPuzzle());

    auto missingRow = rows;
    missingRow.pop_back();
    EXPECT_FALSE(isValidBoardShape(missingRow));
    EXPECT_FALSE(gridFromRows(missingRow).has_value());

    auto extraRow = rows;
    extraRow.push_back(rows.front());
    EXPECT_FALSE(isValidBoardShape(extraRow));

    auto shortRow = rows;
    shortRow[4].pop_back();
    EXPECT_FALSE(isValidBoardShape(shortRow));

    auto longRow = rows;
    longRow[8].push_back(0);
    EXPECT_FALSE(isValidBoardShape(longRow));

    EXPECT_FALSE(isValidBoardShape({}));
}

TEST(sudoku_rules, test_board_shape_rejects_out_of_range_values)
{
    auto rows = rowsOf(SudokuGrid());
    rows[2][3] = 10;
    EXPECT_FALSE(isValidBoardShape(rows));
    EXPECT_FALSE(gridFromRows(rows).has_value());

    rows[2][3] = -1;
    EXPECT_FALSE(isValidBoardShape(rows));

    rows[2][3] = 9;
    EXPECT_TRUE(isValidBoardShape(rows));
}

TEST(sudoku_rules, test_board_shape_is_pure)
{
    const auto valid = rowsOf(classicPuzzle());
    auto invalid = valid;
    invalid[0][0] = 42;

    for (int i = 0; i < 3; i++) {
        EXPECT_TRUE(isValidBoardShape(valid));
        EXPECT_FALSE(isValidBoardShape(invalid));
    }
    EXPECT_EQ(invalid[0][0], 42);
}

}
