#include "BacktrackingSudokuSolver.h"
#include "backtracking.h"
#include "sudoku_rules.h"

SudokuBacktrackingSolver::SudokuBacktrackingSolver(size_t nodeBudget)
  : nodeBudget(nodeBudget)
{}

std::unique_ptr<SudokuGrid>
SudokuBacktrackingSolver::solve(const SudokuGrid& sudoku) const
{
    // A grid with out of range cells or conflicting givens cannot be completed to a valid grid.
    if (!hasValidCellValues(sudoku) || !isValidPartialBoard(sudoku)) {
        return nullptr;
    }

    auto solution = std::make_unique<SudokuGrid>(sudoku);
    BacktrackingSearch search(nodeBudget);
    if (!search.fill(*solution)) {
        return nullptr;
    }
    return solution;
}

size_t
SudokuBacktrackingSolver::countSolutions(const SudokuGrid& sudoku, size_t limit) const
{
    if (limit == 0 || !hasValidCellValues(sudoku) || !isValidPartialBoard(sudoku)) {
        return 0;
    }

    SudokuGrid grid(sudoku);
    BacktrackingSearch search(nodeBudget);
    return search.count(grid, limit);
}
