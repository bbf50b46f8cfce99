#include "SudokuGenerator.h"
#include "backtracking.h"
#include "utils.h"

#include <algorithm>
#include <numeric>
#include <stdexcept>
#include <utility>
#include <vector>

size_t
targetGivens(Difficulty difficulty)
{
    switch (difficulty) {
        case Difficulty::Easy:
            return 42;
        case Difficulty::Medium:
            return 34;
        case Difficulty::Hard:
            return 26;
    }
    throw std::invalid_argument("Invalid difficulty.");
}

std::string_view
toString(Difficulty difficulty)
{
    switch (difficulty) {
        case Difficulty::Easy:
            return "easy";
        case Difficulty::Medium:
            return "medium";
        case Difficulty::Hard:
            return "hard";
    }
    return "unknown";
}

std::optional<Difficulty>
parseDifficulty(std::string_view name)
{
    if (name == "easy") {
        return Difficulty::Easy;
    }
    if (name == "medium") {
        return Difficulty::Medium;
    }
    if (name == "hard") {
        return Difficulty::Hard;
    }
    return std::nullopt;
}

GeneratedPuzzle::GeneratedPuzzle(const SudokuGrid& puzzle, const SudokuGrid& solution, Difficulty difficulty)
  : puzzle(puzzle)
  , solution(solution)
  , difficulty(difficulty)
  , givens(puzzle)
{}

SudokuGenerator::SudokuGenerator(GeneratorOptions options)
  : SudokuGenerator(std::random_device{}(), options)
{}

SudokuGenerator::SudokuGenerator(std::mt19937::result_type seed, GeneratorOptions options)
  : randomEngine(seed)
  , options(options)
  , solutionCounter(SudokuSolver::create(options.counter))
{}

SudokuGenerator::~SudokuGenerator() = default;

SudokuGenerator::SudokuGenerator(SudokuGenerator&&) noexcept = default;

SudokuGenerator&
SudokuGenerator::operator=(SudokuGenerator&&) noexcept = default;

SudokuGrid
SudokuGenerator::generateFullGrid()
{
    SudokuGrid grid;
    BacktrackingSearch search(0, [this](BacktrackingSearch::Candidates& digits) {
        shuffleInPlace(digits, randomEngine);
    });

    if (!search.fill(grid)) {
        // An empty grid always has a completion.
        throw std::logic_error("Failed to fill an empty sudoku grid.");
    }
    return grid;
}

SudokuGrid
SudokuGenerator::removeCells(const SudokuGrid& solution, size_t targetGivens)
{
    std::vector<size_t> positions(solution.size());
    std::iota(positions.begin(), positions.end(), 0);
    shuffleInPlace(positions, randomEngine);

    SudokuGrid puzzle(solution);
    size_t givens = puzzle.filledCount();
    for (const auto idx : positions) {
        if (givens <= targetGivens) {
            break;
        }
        const cell_t value = puzzle[idx];
        if (value == 0) {
            continue;
        }

        puzzle[idx] = 0;
        if (solutionCounter->countSolutions(puzzle, 2) == 1) {
            givens--;
        } else {
            // The removal made the puzzle ambiguous.
            puzzle[idx] = value;
        }
    }
    return puzzle;
}

GeneratedPuzzle
SudokuGenerator::generate(Difficulty difficulty)
{
    return generate(difficulty, targetGivens(difficulty));
}

GeneratedPuzzle
SudokuGenerator::generate(Difficulty difficulty, size_t target)
{
    std::optional<GeneratedPuzzle> best;
    for (size_t attempt = 0; attempt < std::max<size_t>(options.maxAttempts, 1); attempt++) {
        const auto solution = generateFullGrid();
        const auto puzzle = removeCells(solution, target);

        if (!best || puzzle.filledCount() < best->puzzle.filledCount()) {
            best.emplace(puzzle, solution, difficulty);
        }
        if (best->puzzle.filledCount() <= target) {
            break;
        }
    }
    return std::move(*best);
}
