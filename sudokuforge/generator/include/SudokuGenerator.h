#ifndef SUDOKUFORGE_SUDOKUGENERATOR_H
#define SUDOKUFORGE_SUDOKUGENERATOR_H

#include "SudokuSolver.h"
#include "sudoku_grid.h"

#include <memory>
#include <optional>
#include <random>
#include <string_view>

enum class Difficulty
{
    Easy,
    Medium,
    Hard
};

/**
 * Number of givens a puzzle of the given difficulty should keep: 42, 34 or 26.
 */
[[nodiscard]] size_t
targetGivens(Difficulty difficulty);

[[nodiscard]] std::string_view
toString(Difficulty difficulty);

/**
 * Accepts "easy", "medium" and "hard".
 */
[[nodiscard]] std::optional<Difficulty>
parseDifficulty(std::string_view name);

struct GeneratedPuzzle
{
    SudokuGrid puzzle;
    SudokuGrid solution;
    Difficulty difficulty;
    GivenMask givens;

    GeneratedPuzzle(const SudokuGrid& puzzle, const SudokuGrid& solution, Difficulty difficulty);
};

struct GeneratorOptions
{
    /**
     * Number of full grids that may be carved before a puzzle with more givens than the target is accepted. The
     * attempt with the fewest givens is kept.
     */
    size_t maxAttempts = 1;

    /**
     * Algorithm used to check that a removal keeps the solution unique.
     */
    SolverType counter = SolverType::Backtracking;
};

/**
 * Generates sudokus with exactly one solution.
 *
 * A generator owns its random engine and is not thread safe. Use one generator per thread.
 */
class SudokuGenerator
{
    std::mt19937 randomEngine;
    GeneratorOptions options;
    std::unique_ptr<SudokuSolver> solutionCounter;

  public:
    /**
     * Seeds the random engine from std::random_device.
     */
    explicit SudokuGenerator(GeneratorOptions options = {});

    /**
     * Uses a fixed seed. The same seed and options produce the same puzzles with the same standard library.
     */
    explicit SudokuGenerator(std::mt19937::result_type seed, GeneratorOptions options = {});

    ~SudokuGenerator();
    SudokuGenerator(SudokuGenerator&&) noexcept;
    SudokuGenerator& operator=(SudokuGenerator&&) noexcept;
    SudokuGenerator(const SudokuGenerator&) = delete;
    SudokuGenerator& operator=(const SudokuGenerator&) = delete;

    /**
     * Fills an empty grid by backtracking with the digit order shuffled at every cell.
     * @throws std::logic_error if no complete grid is found, which indicates a defect
     */
    [[nodiscard]] SudokuGrid generateFullGrid();

    /**
     * Clears cells of a solved grid in random order as long as the result keeps exactly one solution, until only
     * targetGivens cells are left. Every position is tried at most once; if all positions are exhausted first the
     * result has more givens than requested.
     */
    [[nodiscard]] SudokuGrid removeCells(const SudokuGrid& solution, size_t targetGivens);

    [[nodiscard]] GeneratedPuzzle generate(Difficulty difficulty);

    /**
     * Same as generate(difficulty) but carves toward the given number of givens instead of targetGivens(difficulty).
     * Each attempt carves a fresh full grid. The loop stops at the first attempt that reaches the target, otherwise
     * the attempt with the fewest givens is returned.
     */
    [[nodiscard]] GeneratedPuzzle generate(Difficulty difficulty, size_t targetGivens);
};

#endif // SUDOKUFORGE_SUDOKUGENERATOR_H
