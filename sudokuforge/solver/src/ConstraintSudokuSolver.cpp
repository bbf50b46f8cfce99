#include <bitset>
#include <cstdint>

#include "ConstraintSudokuSolver.h"
#include "sudoku_rules.h"

namespace {

enum class ConstraintSolverState
{
    SOLVED,
    UNMODIFIED,
    MODIFIED,
    UNSOLVABLE
};

// Bit d is set if digit d is still possible. Bit 0 is never set.
using CandidateMask = uint16_t;

constexpr CandidateMask allDigits = 0x3FE;

size_t
countCandidates(CandidateMask mask)
{
    return std::bitset<16>(mask).count();
}

class NodeCounter
{
    size_t nodeBudget;
    size_t nodes = 0;

  public:
    explicit NodeCounter(size_t nodeBudget)
      : nodeBudget(nodeBudget)
    {}

    void visit()
    {
        nodes++;
        if (nodeBudget != 0 && nodes > nodeBudget) {
            throw SearchBudgetExceeded(nodeBudget);
        }
    }
};

// Requires every cell value to be in [0, 9]. The solver entry points reject other grids.
CandidateMask
getCellPossibilities(const SudokuGrid& grid, size_t row, size_t col)
{
    unsigned used = 0;

    // check row and col
    for (size_t i = 0; i < SudokuGrid::sideLen; i++) {
        used |= 1u << grid.at(row, i);
        used |= 1u << grid.at(i, col);
    }

    // check box
    const size_t boxRow = (row / SudokuGrid::boxLen) * SudokuGrid::boxLen;
    const size_t boxCol = (col / SudokuGrid::boxLen) * SudokuGrid::boxLen;
    for (size_t i = boxRow; i < boxRow + SudokuGrid::boxLen; i++) {
        for (size_t j = boxCol; j < boxCol + SudokuGrid::boxLen; j++) {
            used |= 1u << grid.at(i, j);
        }
    }

    return static_cast<CandidateMask>(allDigits & ~used);
}

ConstraintSolverState
solveTrivialCells(SudokuGrid& grid, NodeCounter& counter)
{
    bool solved = true;
    bool modified = false;
    for (size_t row = 0; row < SudokuGrid::sideLen; row++) {
        for (size_t col = 0; col < SudokuGrid::sideLen; col++) {
            if (grid.isCellFilled(row, col)) {
                // Cell is already filled. No further checks necessary.
                continue;
            }
            const auto candidates = getCellPossibilities(grid, row, col);
            const auto numCandidates = countCandidates(candidates);

            if (numCandidates == 0) {
                return ConstraintSolverState::UNSOLVABLE;
            }
            if (numCandidates == 1) {
                counter.visit();
                cell_t value = 1;
                while ((candidates & (1u << value)) == 0) {
                    value++;
                }
                grid.at(row, col) = value;
                modified = true;
            } else {
                solved = false;
            }
        }
    }

    if (modified) {
        return ConstraintSolverState::MODIFIED;
    }
    return solved ? ConstraintSolverState::SOLVED : ConstraintSolverState::UNMODIFIED;
}

ConstraintSolverState
solveTrivialCellsIter(SudokuGrid& grid, NodeCounter& counter)
{
    ConstraintSolverState lastState;
    while ((lastState = solveTrivialCells(grid, counter)) == ConstraintSolverState::MODIFIED) {
    }

    return lastState;
}

/**
 * Selects the empty cell with the fewest candidates. Must only be called after solveTrivialCellsIter() returned
 * UNMODIFIED, i.e. every empty cell has at least two candidates.
 */
size_t
selectNextCell(const SudokuGrid& grid, CandidateMask& bestCandidates)
{
    size_t minCandidates = SudokuGrid::sideLen + 1;
    size_t bestIdx = grid.size();
    for (size_t row = 0; row < SudokuGrid::sideLen; row++) {
        for (size_t col = 0; col < SudokuGrid::sideLen; col++) {
            if (grid.isCellFilled(row, col)) {
                continue;
            }
            const auto candidates = getCellPossibilities(grid, row, col);
            const size_t numCandidates = countCandidates(candidates);
            if (numCandidates < minCandidates) {
                bestIdx = row * SudokuGrid::sideLen + col;
                bestCandidates = candidates;
                minCandidates = numCandidates;
            }
        }
    }
    return bestIdx;
}

std::unique_ptr<SudokuGrid>
solveRecursive(SudokuGrid& grid, NodeCounter& counter)
{
    switch (solveTrivialCellsIter(grid, counter)) {
        case ConstraintSolverState::SOLVED:
            return std::make_unique<SudokuGrid>(grid);
        case ConstraintSolverState::UNSOLVABLE:
            return nullptr;
        default:
            // Not changed, need to try a cell value and backtrack if erroneous
            break;
    }

    CandidateMask candidates = 0;
    const size_t idx = selectNextCell(grid, candidates);

    for (cell_t value = 1; value <= static_cast<cell_t>(SudokuGrid::sideLen); value++) {
        if ((candidates & (1u << value)) == 0) {
            continue;
        }
        counter.visit();
        SudokuGrid sudokuCopy(grid);
        sudokuCopy[idx] = value;

        auto solution = solveRecursive(sudokuCopy, counter);
        if (solution != nullptr) {
            return solution;
        }
        // Not a solution, backtrack.
    }

    return nullptr;
}

void
countRecursive(SudokuGrid& grid, NodeCounter& counter, size_t limit, size_t& found)
{
    switch (solveTrivialCellsIter(grid, counter)) {
        case ConstraintSolverState::SOLVED:
            found++;
            return;
        case ConstraintSolverState::UNSOLVABLE:
            return;
        default:
            break;
    }

    CandidateMask candidates = 0;
    const size_t idx = selectNextCell(grid, candidates);

    for (cell_t value = 1; value <= static_cast<cell_t>(SudokuGrid::sideLen); value++) {
        if ((candidates & (1u << value)) == 0) {
            continue;
        }
        counter.visit();
        SudokuGrid sudokuCopy(grid);
        sudokuCopy[idx] = value;

        countRecursive(sudokuCopy, counter, limit, found);
        if (found >= limit) {
            return;
        }
    }
}

}

SudokuConstraintSolver::SudokuConstraintSolver(size_t nodeBudget)
  : nodeBudget(nodeBudget)
{}

SudokuConstraintSolver::~SudokuConstraintSolver() = default;

std::unique_ptr<SudokuGrid>
SudokuConstraintSolver::solve(const SudokuGrid& sudokuGrid) const
{
    if (!hasValidCellValues(sudokuGrid) || !isValidPartialBoard(sudokuGrid)) {
        return nullptr;
    }

    SudokuGrid sudoku(sudokuGrid);
    NodeCounter counter(nodeBudget);
    return solveRecursive(sudoku, counter);
}

size_t
SudokuConstraintSolver::countSolutions(const SudokuGrid& sudokuGrid, size_t limit) const
{
    if (limit == 0 || !hasValidCellValues(sudokuGrid) || !isValidPartialBoard(sudokuGrid)) {
        return 0;
    }

    SudokuGrid sudoku(sudokuGrid);
    NodeCounter counter(nodeBudget);
    size_t found = 0;
    countRecursive(sudoku, counter, limit, found);
    return found;
}
