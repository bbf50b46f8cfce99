#ifndef SUDOKUFORGE_SUDOKU_GRID_H
#define SUDOKUFORGE_SUDOKU_GRID_H

#include <array>
#include <cstddef>
#include <iostream>

using cell_t = int;

/**
 * Row/column coordinate of a cell. Both components are in [0, 8].
 */
struct Position
{
    size_t row;
    size_t col;

    [[nodiscard]] bool operator==(const Position& other) const noexcept;
    [[nodiscard]] bool operator!=(const Position& other) const noexcept;

    friend std::ostream& operator<<(std::ostream& output, const Position& pos);
};

/**
 * Fixed 9x9 sudoku grid. Cells hold values in [0, 9] where 0 marks an empty cell.
 * Cells are stored in row-major order.
 */
class SudokuGrid
{
  public:
    static constexpr size_t sideLen = 9;
    static constexpr size_t boxLen = 3;
    static constexpr size_t cellCount = sideLen * sideLen;

  private:
    std::array<cell_t, cellCount> elements{};

  public:
    SudokuGrid() = default;

    SudokuGrid(const SudokuGrid& other) = default;
    SudokuGrid& operator=(const SudokuGrid& other) = default;

    [[nodiscard]] cell_t& operator[](size_t idx);
    [[nodiscard]] const cell_t& operator[](size_t idx) const;

    [[nodiscard]] cell_t& at(size_t idx);
    [[nodiscard]] const cell_t& at(size_t idx) const;

    [[nodiscard]] cell_t& at(size_t row, size_t col);
    [[nodiscard]] const cell_t& at(size_t row, size_t col) const;

    [[nodiscard]] size_t size() const noexcept;

    [[nodiscard]] bool isCellFilled(size_t row, size_t col) const;

    /**
     * Number of non-empty cells.
     */
    [[nodiscard]] size_t filledCount() const;

    auto begin() noexcept { return elements.begin(); }
    auto end() noexcept { return elements.end(); }
    [[nodiscard]] auto begin() const noexcept { return elements.begin(); }
    [[nodiscard]] auto end() const noexcept { return elements.end(); }

    [[nodiscard]] bool operator==(const SudokuGrid& other) const;
    [[nodiscard]] bool operator!=(const SudokuGrid& other) const;

    static void printGrid(std::ostream& os, const SudokuGrid& grid, bool flat = true);

    friend std::ostream& operator<<(std::ostream& output, const SudokuGrid& grid);
};

/**
 * Marks the clue cells of a puzzle. A cell is a given if it was non-empty when the puzzle was created.
 */
class GivenMask
{
    std::array<bool, SudokuGrid::cellCount> givens{};

  public:
    GivenMask() = default;
    explicit GivenMask(const SudokuGrid& puzzle);

    [[nodiscard]] bool isGiven(size_t row, size_t col) const;
    [[nodiscard]] size_t count() const;
};

#endif // SUDOKUFORGE_SUDOKU_GRID_H
