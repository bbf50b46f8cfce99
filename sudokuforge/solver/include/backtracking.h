#ifndef SUDOKUFORGE_BACKTRACKING_H
#define SUDOKUFORGE_BACKTRACKING_H

#include "sudoku_grid.h"
#include <array>
#include <functional>

/**
 * Depth-first search over the empty cells of a grid.
 *
 * The next empty cell is always the first one in row-major order. At every cell the digits 1 to 9 are tried in the
 * order produced by the candidate order callback (ascending if none is set); a digit is placed if it is a valid
 * placement, then the search recurses and reverts the cell to 0 if the branch fails.
 *
 * The search mutates the grid it is given. Callers that must not expose the mutation work on a copy.
 */
class BacktrackingSearch
{
  public:
    using Candidates = std::array<cell_t, SudokuGrid::sideLen>;
    using CandidateOrder = std::function<void(Candidates&)>;

    /**
     * @param nodeBudget maximum number of tentative placements, 0 for no limit
     * @param candidateOrder reorders the digits before they are tried at a cell, may be empty
     */
    explicit BacktrackingSearch(size_t nodeBudget = 0, CandidateOrder candidateOrder = nullptr);

    /**
     * Completes the grid in place with the first solution found.
     * @return true if the grid was completed. On false the grid holds its original values.
     * @throws SearchBudgetExceeded if the node budget is exhausted
     */
    bool fill(SudokuGrid& grid);

    /**
     * Counts completions of the grid, stopping at every level as soon as limit is reached.
     * The grid holds its original values afterwards.
     * @throws SearchBudgetExceeded if the node budget is exhausted
     */
    size_t count(SudokuGrid& grid, size_t limit);

  private:
    size_t nodeBudget;
    size_t nodes = 0;
    CandidateOrder candidateOrder;

    [[nodiscard]] Candidates candidates();
    void visit();
    bool fillFrom(SudokuGrid& grid, size_t start);
    void countFrom(SudokuGrid& grid, size_t start, size_t limit, size_t& found);
};

/**
 * Returns the row-major index of the first empty cell at or after start, or SudokuGrid::cellCount if there is none.
 */
[[nodiscard]] size_t
findEmptyCell(const SudokuGrid& grid, size_t start = 0);

#endif // SUDOKUFORGE_BACKTRACKING_H
