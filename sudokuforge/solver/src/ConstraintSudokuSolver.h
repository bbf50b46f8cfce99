#ifndef SUDOKUFORGE_CONSTRAINTSUDOKUSOLVER_H
#define SUDOKUFORGE_CONSTRAINTSUDOKUSOLVER_H

#include "SudokuSolver.h"

class SudokuConstraintSolver : public SudokuSolver
{
    size_t nodeBudget;

  public:
    explicit SudokuConstraintSolver(size_t nodeBudget = 0);
    ~SudokuConstraintSolver() override;

    [[nodiscard]] std::unique_ptr<SudokuGrid> solve(const SudokuGrid& sudokuGrid) const override;

    [[nodiscard]] size_t countSolutions(const SudokuGrid& sudokuGrid, size_t limit) const override;
};

#endif // SUDOKUFORGE_CONSTRAINTSUDOKUSOLVER_H
