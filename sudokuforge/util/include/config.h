#ifndef SUDOKUFORGE_CONFIG_H
#define SUDOKUFORGE_CONFIG_H

#include <filesystem>
namespace fs = std::filesystem;

#ifndef SUDOKUFORGE_DATA_DIR
#define SUDOKUFORGE_DATA_DIR "data"
#endif

const fs::path dataPath = SUDOKUFORGE_DATA_DIR;

const fs::path sudokusPath = dataPath / "sudokus";

const fs::path referenceSudokusPath = sudokusPath / "reference.txt";
const fs::path easySudokusPath = sudokusPath / "easy.txt";
const fs::path hardSudokusPath = sudokusPath / "hard.txt";
const fs::path invalidSudokusPath = sudokusPath / "invalid.txt";

#endif // SUDOKUFORGE_CONFIG_H
