#include "backtracking.h"
#include "SudokuSolver.h"
#include "sudoku_rules.h"

#include <utility>

size_t
findEmptyCell(const SudokuGrid& grid, size_t start)
{
    for (size_t idx = start; idx < grid.size(); idx++) {
        if (grid[idx] == 0) {
            return idx;
        }
    }
    return grid.size();
}

BacktrackingSearch::BacktrackingSearch(size_t nodeBudget, CandidateOrder candidateOrder)
  : nodeBudget(nodeBudget)
  , candidateOrder(std::move(candidateOrder))
{}

bool
BacktrackingSearch::fill(SudokuGrid& grid)
{
    return fillFrom(grid, 0);
}

size_t
BacktrackingSearch::count(SudokuGrid& grid, size_t limit)
{
    size_t found = 0;
    if (limit > 0) {
        countFrom(grid, 0, limit, found);
    }
    return found;
}

BacktrackingSearch::Candidates
BacktrackingSearch::candidates()
{
    Candidates digits{ 1, 2, 3, 4, 5, 6, 7, 8, 9 };
    if (candidateOrder) {
        candidateOrder(digits);
    }
    return digits;
}

void
BacktrackingSearch::visit()
{
    nodes++;
    if (nodeBudget != 0 && nodes > nodeBudget) {
        throw SearchBudgetExceeded(nodeBudget);
    }
}

bool
BacktrackingSearch::fillFrom(SudokuGrid& grid, size_t start)
{
    // Cells before start are filled because cells are visited in row-major order.
    const size_t idx = findEmptyCell(grid, start);
    if (idx == grid.size()) {
        return true;
    }

    const size_t row = idx / SudokuGrid::sideLen;
    const size_t col = idx % SudokuGrid::sideLen;
    for (const auto value : candidates()) {
        if (!isValidPlacement(grid, row, col, value)) {
            continue;
        }
        visit();
        grid[idx] = value;
        if (fillFrom(grid, idx + 1)) {
            return true;
        }
        // Not a solution, backtrack.
        grid[idx] = 0;
    }
    return false;
}

void
BacktrackingSearch::countFrom(SudokuGrid& grid, size_t start, size_t limit, size_t& found)
{
    const size_t idx = findEmptyCell(grid, start);
    if (idx == grid.size()) {
        found++;
        return;
    }

    const size_t row = idx / SudokuGrid::sideLen;
    const size_t col = idx % SudokuGrid::sideLen;
    for (const auto value : candidates()) {
        if (!isValidPlacement(grid, row, col, value)) {
            continue;
        }
        visit();
        grid[idx] = value;
        countFrom(grid, idx + 1, limit, found);
        grid[idx] = 0;
        if (found >= limit) {
            return;
        }
    }
}
