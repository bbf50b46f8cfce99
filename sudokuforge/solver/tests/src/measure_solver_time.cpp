#include <array>
#include <chrono>
#include <cmath>
#include <fmt/format.h>
#include <limits>
#include <string>
#include <vector>

#include "SudokuSolver.h"
#include "config.h"
#include "test_helper.h"

void
measure(SolverType solverType, const fs::path& path)
{
    using namespace std::chrono;
    std::unique_ptr<SudokuSolver> solver = SudokuSolver::create(solverType);

    const auto challenges = readSudokuChallenges(path);

    std::vector<double> times;
    size_t failures = 0;
    for (const auto& challenge : challenges) {
        auto start = high_resolution_clock::now();

        const auto result = solver->solve(challenge.grid);

        auto end = high_resolution_clock::now();
        duration<double, std::milli> dur = end - start;
        times.push_back(dur.count());

        int errCnt = 0;
        if (!challenge.isValidSolution(result.get(), &errCnt)) {
            failures++;
        }
    }

    if (times.empty()) {
        fmt::print(stderr, "No challenges in {}\n", path.string());
        return;
    }

    double totalTime = 0.0;
    for (auto t : times) {
        totalTime += t;
    }

    double mean = totalTime / static_cast<double>(times.size());

    double min = std::numeric_limits<double>::max();
    double max = 0.0;
    double var = 0.0;
    for (auto t : times) {
        double x = t - mean;
        var += x * x;

        if (t < min) {
            min = t;
        }
        if (t > max) {
            max = t;
        }
    }
    double stddev = std::sqrt(var / static_cast<double>(times.size()));

    fmt::print("{:9.2f} {:9.2f} {:9.2f} {:9.2f} {:9.2f} {:8} path={}\n",
               totalTime,
               mean,
               stddev,
               min,
               max,
               failures,
               path.string());
}

int
main()
{
    const std::array<fs::path, 3> files{
        referenceSudokusPath,
        easySudokusPath,
        hardSudokusPath,
    };

    for (const auto type : { SolverType::Backtracking, SolverType::Constraint }) {
        fmt::print("{}:\n", toString(type));
        fmt::print("totalTime      mean    stddev       min       max failures path\n");
        for (const auto& file : files) {
            measure(type, file);
        }
    }
}
