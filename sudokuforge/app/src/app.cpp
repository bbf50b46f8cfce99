#include <SudokuGenerator.h>
#include <SudokuSolver.h>

#include <cli_opts.h>
#include <sudoku_rules.h>
#include <utils.h>

#include <fmt/format.h>

#include <chrono>
#include <filesystem>
#include <iostream>
#include <random>
#include <sstream>

namespace fs = std::filesystem;

namespace {

constexpr int exitOk = 0;
constexpr int exitFailure = 1;
constexpr int exitUsage = 2;

void
usage(const char* argv0)
{
    fmt::print(stderr,
               "Usage: {0} generate [--difficulty easy|medium|hard] [--count N] [--seed S] [--attempts N] [--pretty]\n"
               "       {0} solve <file> [--solver backtracking|constraint] [--budget N]\n"
               "       {0} check <file> [--budget N]\n"
               "  Each non-empty, non-comment line of <file> must contain 81 cells: digits 0-9 or '.' for empty.\n"
               "  --seed takes a value in [0, {1}].\n"
               "  --budget limits the search nodes per puzzle. Default {2}, 0 disables the limit.\n",
               argv0,
               std::mt19937::max(),
               untrustedInputNodeBudget);
}

std::string
flat(const SudokuGrid& grid)
{
    std::ostringstream oss;
    oss << grid;
    return oss.str();
}

class SudokuCommands
{
    const CliOptionsParser& opts;

  public:
    explicit SudokuCommands(const CliOptionsParser& opts)
      : opts(opts)
    {}

    int generate() const
    {
        const auto difficulty = parseDifficulty(opts.getOption("--difficulty", "medium"));
        if (!difficulty) {
            fmt::print(stderr, "Invalid difficulty. Use easy, medium, or hard.\n");
            return exitUsage;
        }

        const auto count = opts.getNumericOption("--count", 1);
        const auto attempts = opts.getNumericOption("--attempts", 1);
        const auto seed = opts.getNumericOption("--seed", 0, std::mt19937::max());
        if (!count || !attempts || !seed) {
            fmt::print(stderr,
                       "--count and --attempts expect a non-negative number, --seed a number in [0, {}].\n",
                       std::mt19937::max());
            return exitUsage;
        }

        GeneratorOptions generatorOptions;
        generatorOptions.maxAttempts = *attempts;

        auto generator = opts.hasOption("--seed")
                           ? SudokuGenerator(static_cast<std::mt19937::result_type>(*seed), generatorOptions)
                           : SudokuGenerator(generatorOptions);

        const bool pretty = opts.hasOption("--pretty");
        for (unsigned long long i = 0; i < *count; i++) {
            const auto start = std::chrono::steady_clock::now();
            const auto generated = generator.generate(*difficulty);
            const std::chrono::duration<double, std::milli> elapsed = std::chrono::steady_clock::now() - start;

            const size_t givens = generated.givens.count();
            if (givens > targetGivens(*difficulty)) {
                fmt::print(stderr,
                           "Puzzle {} keeps {} givens, target for {} is {}.\n",
                           i + 1,
                           givens,
                           toString(*difficulty),
                           targetGivens(*difficulty));
            }

            if (pretty) {
                fmt::print("# {} puzzle, {} givens, {:.1f} ms\n", toString(*difficulty), givens, elapsed.count());
                SudokuGrid::printGrid(std::cout, generated.puzzle, false);
                std::cout << '\n';
                SudokuGrid::printGrid(std::cout, generated.solution, false);
                std::cout << std::endl;
            } else {
                fmt::print("{};{}\n", flat(generated.puzzle), flat(generated.solution));
            }
        }
        return exitOk;
    }

    int solve(const fs::path& file) const
    {
        const auto solverType = parseSolverType(opts.getOption("--solver", "backtracking"));
        const auto budget = opts.getNumericOption("--budget", untrustedInputNodeBudget);
        if (!solverType || !budget) {
            fmt::print(stderr, "Invalid --solver or --budget.\n");
            return exitUsage;
        }
        const auto solver = SudokuSolver::create(*solverType, *budget);

        size_t total = 0;
        size_t solved = 0;
        for (const auto& record : readGridRecords(file)) {
            total++;
            const auto grid = parseGrid(puzzlePart(record.text));
            if (!grid) {
                fmt::print("[line {}] INVALID\n", record.lineNo);
                continue;
            }

            try {
                const auto solution = solver->solve(*grid);
                if (solution) {
                    solved++;
                    fmt::print("[line {}] {}\n", record.lineNo, flat(*solution));
                } else {
                    fmt::print("[line {}] UNSOLVABLE\n", record.lineNo);
                }
            } catch (const SearchBudgetExceeded& e) {
                fmt::print("[line {}] BUDGET EXCEEDED ({})\n", record.lineNo, e.what());
            }
        }

        fmt::print("SUMMARY: solver={} total={} solved={} failed={}\n", toString(*solverType), total, solved, total - solved);
        return exitOk;
    }

    int check(const fs::path& file) const
    {
        const auto budget = opts.getNumericOption("--budget", untrustedInputNodeBudget);
        if (!budget) {
            fmt::print(stderr, "Invalid --budget.\n");
            return exitUsage;
        }
        const auto solver = SudokuSolver::create(SolverType::Backtracking, *budget);

        for (const auto& record : readGridRecords(file)) {
            const auto grid = parseGrid(puzzlePart(record.text));
            if (!grid) {
                fmt::print("[line {}] INVALID\n", record.lineNo);
                continue;
            }

            std::ostringstream conflicts;
            for (const auto& pos : getConflicts(*grid)) {
                conflicts << pos << ' ';
            }

            std::string solutions;
            try {
                switch (solver->countSolutions(*grid, 2)) {
                    case 0:
                        solutions = "none";
                        break;
                    case 1:
                        solutions = "unique";
                        break;
                    default:
                        solutions = "multiple";
                }
            } catch (const SearchBudgetExceeded&) {
                solutions = "unknown (budget exceeded)";
            }

            fmt::print("[line {}] givens={} complete={} solutions={} conflicts=[{}]\n",
                       record.lineNo,
                       grid->filledCount(),
                       isBoardComplete(*grid) ? "yes" : "no",
                       solutions,
                       conflicts.str());
        }
        return exitOk;
    }

  private:
    // Lines may carry the solution after a ';' as written by "generate".
    static std::string puzzlePart(const std::string& line) { return line.substr(0, line.find(';')); }
};

}

int
main(int argc, char* argv[])
{
    const CliOptionsParser opts(argc, argv);
    const auto& command = opts.getPositionalOption(0);

    if (command.empty() || opts.hasOption("--help")) {
        usage(argv[0]);
        return command.empty() ? exitUsage : exitOk;
    }

    const SudokuCommands commands(opts);
    try {
        if (command == "generate") {
            return commands.generate();
        }

        if (command == "solve" || command == "check") {
            const fs::path file(opts.getPositionalOption(1));
            if (file.empty() || !fs::is_regular_file(file)) {
                fmt::print(stderr, "The specified path is not a file: '{}'\n", file.string());
                return exitUsage;
            }
            return command == "solve" ? commands.solve(file) : commands.check(file);
        }
    } catch (const std::exception& e) {
        fmt::print(stderr, "Error: {}\n", e.what());
        return exitFailure;
    }

    fmt::print(stderr, "Unknown command: {}\n", command);
    usage(argv[0]);
    return exitUsage;
}
