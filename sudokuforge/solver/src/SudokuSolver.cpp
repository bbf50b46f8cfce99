#include "SudokuSolver.h"
#include "BacktrackingSudokuSolver.h"
#include "ConstraintSudokuSolver.h"
#include "sudoku_rules.h"

#include <string>

SearchBudgetExceeded::SearchBudgetExceeded(size_t budget)
  : std::runtime_error("Search exceeded the budget of " + std::to_string(budget) + " nodes.")
  , nodeBudget(budget)
{}

size_t
SearchBudgetExceeded::budget() const noexcept
{
    return nodeBudget;
}

bool
SudokuSolver::hasUniqueSolution(const SudokuGrid& sudoku) const
{
    return countSolutions(sudoku, 2) == 1;
}

std::unique_ptr<SudokuSolver>
SudokuSolver::create(SolverType type, size_t nodeBudget)
{
    switch (type) {
        case SolverType::Backtracking:
            return std::make_unique<SudokuBacktrackingSolver>(nodeBudget);
        case SolverType::Constraint:
            return std::make_unique<SudokuConstraintSolver>(nodeBudget);
        default:
            throw std::runtime_error("Invalid solver type.");
    }
}

bool
isBoardComplete(const SudokuGrid& grid)
{
    for (size_t row = 0; row < SudokuGrid::sideLen; row++) {
        for (size_t col = 0; col < SudokuGrid::sideLen; col++) {
            const cell_t value = grid.at(row, col);
            if (value < 1 || value > 9 || !isValidPlacement(grid, row, col, value)) {
                return false;
            }
        }
    }
    return true;
}

std::string_view
toString(SolverType type)
{
    switch (type) {
        case SolverType::Backtracking:
            return "backtracking";
        case SolverType::Constraint:
            return "constraint";
    }
    return "unknown";
}

std::optional<SolverType>
parseSolverType(std::string_view name)
{
    if (name == "backtracking") {
        return SolverType::Backtracking;
    }
    if (name == "constraint") {
        return SolverType::Constraint;
    }
    return std::nullopt;
}
