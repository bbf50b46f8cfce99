#ifndef SUDOKUFORGE_BACKTRACKINGSUDOKUSOLVER_H
#define SUDOKUFORGE_BACKTRACKINGSUDOKUSOLVER_H

#include "SudokuSolver.h"

class SudokuBacktrackingSolver : public SudokuSolver
{
    size_t nodeBudget;

  public:
    explicit SudokuBacktrackingSolver(size_t nodeBudget = 0);
    ~SudokuBacktrackingSolver() override = default;

    [[nodiscard]] std::unique_ptr<SudokuGrid> solve(const SudokuGrid& sudoku) const override;

    [[nodiscard]] size_t countSolutions(const SudokuGrid& sudoku, size_t limit) const override;
};

#endif // SUDOKUFORGE_BACKTRACKINGSUDOKUSOLVER_H
