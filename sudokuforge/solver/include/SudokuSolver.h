#ifndef SUDOKUFORGE_SUDOKUSOLVER_H
#define SUDOKUFORGE_SUDOKUSOLVER_H

#include "sudoku_grid.h"
#include <memory>
#include <optional>
#include <stdexcept>
#include <string_view>

enum class SolverType
{
    /**
     * Plain depth-first backtracking. Cells are visited in row-major order and the digits 1 to 9 are tried in
     * ascending order.
     */
    Backtracking,
    /**
     * Backtracking that first fills all cells with a single remaining candidate and then branches on the cell with
     * the fewest candidates.
     */
    Constraint
};

/**
 * Node budget applied to puzzles read from untrusted sources such as user supplied files. Typical puzzles need a few
 * thousand nodes at most.
 */
constexpr size_t untrustedInputNodeBudget = 10'000'000;

/**
 * Thrown by a solver that was created with a node budget once the search placed more tentative values than allowed.
 */
class SearchBudgetExceeded : public std::runtime_error
{
  public:
    explicit SearchBudgetExceeded(size_t budget);

    [[nodiscard]] size_t budget() const noexcept;

  private:
    size_t nodeBudget;
};

/**
 * Interface for a sudoku solving algorithm.
 *
 * Implementations never modify the grids passed in and keep no state between calls, so a solver can be shared by
 * multiple threads.
 */
class SudokuSolver
{
  public:
    virtual ~SudokuSolver() = default;
    /**
     * Solves the given sudoku grid.
     * @param sudoku input sudoku grid
     * @return Pointer to the solution or nullptr if there is no solution to the grid.
     * @throws SearchBudgetExceeded if the solver has a node budget and the search exceeds it
     */
    [[nodiscard]] virtual std::unique_ptr<SudokuGrid> solve(const SudokuGrid& sudoku) const = 0;

    /**
     * Counts the distinct completions of the given grid. The search stops as soon as limit solutions are found.
     * @param sudoku input sudoku grid
     * @param limit upper bound for the result
     * @return min(number of solutions, limit)
     * @throws SearchBudgetExceeded if the solver has a node budget and the search exceeds it
     */
    [[nodiscard]] virtual size_t countSolutions(const SudokuGrid& sudoku, size_t limit) const = 0;

    [[nodiscard]] bool hasUniqueSolution(const SudokuGrid& sudoku) const;

    /**
     * @param type solving algorithm
     * @param nodeBudget maximum number of tentative placements per call, 0 for no limit
     */
    static std::unique_ptr<SudokuSolver> create(SolverType type = SolverType::Backtracking, size_t nodeBudget = 0);
};

/**
 * Checks that no cell is empty and that every value is a valid placement with respect to the rest of the grid.
 */
[[nodiscard]] bool
isBoardComplete(const SudokuGrid& grid);

[[nodiscard]] std::string_view
toString(SolverType type);

/**
 * Accepts "backtracking" and "constraint".
 */
[[nodiscard]] std::optional<SolverType>
parseSolverType(std::string_view name);

#endif // SUDOKUFORGE_SUDOKUSOLVER_H
