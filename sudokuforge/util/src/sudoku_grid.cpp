#include "sudoku_grid.h"
#include <algorithm>
#include <cassert>
#include <string>

bool
Position::operator==(const Position& other) const noexcept
{
    return row == other.row && col == other.col;
}

bool
Position::operator!=(const Position& other) const noexcept
{
    return !(*this == other);
}

std::ostream&
operator<<(std::ostream& output, const Position& pos)
{
    return output << '(' << pos.row << ", " << pos.col << ')';
}

cell_t&
SudokuGrid::operator[](size_t idx)
{
    return elements[idx];
}

const cell_t&
SudokuGrid::operator[](size_t idx) const
{
    return elements[idx];
}

cell_t&
SudokuGrid::at(size_t idx)
{
    return elements.at(idx);
}

const cell_t&
SudokuGrid::at(size_t idx) const
{
    return elements.at(idx);
}

cell_t&
SudokuGrid::at(size_t row, size_t col)
{
    assert(row < sideLen && col < sideLen);

    return elements[sideLen * row + col];
}

const cell_t&
SudokuGrid::at(size_t row, size_t col) const
{
    assert(row < sideLen && col < sideLen);

    return elements[sideLen * row + col];
}

bool
SudokuGrid::isCellFilled(size_t row, size_t col) const
{
    return at(row, col) > 0;
}

size_t
SudokuGrid::size() const noexcept
{
    return elements.size();
}

size_t
SudokuGrid::filledCount() const
{
    return static_cast<size_t>(std::count_if(elements.begin(), elements.end(), [](cell_t v) { return v != 0; }));
}

bool
SudokuGrid::operator==(const SudokuGrid& other) const
{
    return elements == other.elements;
}

bool
SudokuGrid::operator!=(const SudokuGrid& other) const
{
    return elements != other.elements;
}

void
SudokuGrid::printGrid(std::ostream& os, const SudokuGrid& grid, bool flat)
{
    // "---+---+---"
    std::string vblock_div;
    if (!flat) {
        for (size_t i = 0; i < boxLen; i++) {
            vblock_div.append(boxLen, '-');
            if (i != boxLen - 1) {
                vblock_div += '+';
            }
        }
        vblock_div += '\n';
    }

    for (size_t row = 0; row < sideLen; row++) {
        for (size_t col = 0; col < sideLen; col++) {
            auto val = grid.at(row, col);
            os << (val == 0 ? "." : std::to_string(val));
            if (!flat && (col % boxLen == boxLen - 1)) {
                os << ((col != sideLen - 1) ? '|' : '\n');
            }
        }
        if (!flat && (row != sideLen - 1) && (row % boxLen == boxLen - 1)) {
            os << vblock_div;
        }
    }
}

std::ostream&
operator<<(std::ostream& output, const SudokuGrid& grid)
{
    SudokuGrid::printGrid(output, grid, true);
    return output;
}

GivenMask::GivenMask(const SudokuGrid& puzzle)
{
    for (size_t i = 0; i < puzzle.size(); i++) {
        givens[i] = puzzle[i] != 0;
    }
}

bool
GivenMask::isGiven(size_t row, size_t col) const
{
    assert(row < SudokuGrid::sideLen && col < SudokuGrid::sideLen);

    return givens[SudokuGrid::sideLen * row + col];
}

size_t
GivenMask::count() const
{
    return static_cast<size_t>(std::count(givens.begin(), givens.end(), true));
}
