#ifndef SUDOKUFORGE_UTILS_H
#define SUDOKUFORGE_UTILS_H

#include <algorithm>
#include <filesystem>
#include <iterator>
#include <string>
#include <utility>
#include <vector>

/**
 * Uniformly shuffles the elements of an owned sequence with the given random engine.
 */
template<typename Container, typename RandomEngine>
void
shuffleInPlace(Container& values, RandomEngine& engine)
{
    std::shuffle(std::begin(values), std::end(values), engine);
}

struct GridRecord
{
    size_t lineNo;
    std::string text;

    inline GridRecord(size_t lineNo, std::string text)
      : lineNo(lineNo)
      , text(std::move(text))
    {}
};

/**
 * Reads one record per line. Blank lines and lines starting with '#' are skipped. Surrounding whitespace is removed.
 *
 * @throws std::runtime_error if the file cannot be opened
 */
std::vector<GridRecord>
readGridRecords(const std::filesystem::path& file);

#endif // SUDOKUFORGE_UTILS_H
