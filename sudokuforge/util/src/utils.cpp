#include <utils.h>

#include <fstream>
#include <stdexcept>

namespace {

std::string
trim(const std::string& s)
{
    const auto isSpace = [](char c) { return c == ' ' || c == '\t' || c == '\r' || c == '\n'; };

    size_t a = 0;
    while (a < s.size() && isSpace(s[a])) {
        a++;
    }
    size_t b = s.size();
    while (b > a && isSpace(s[b - 1])) {
        b--;
    }
    return s.substr(a, b - a);
}

}

std::vector<GridRecord>
readGridRecords(const std::filesystem::path& file)
{
    std::ifstream inStream(file);

    if (!inStream) {
        throw std::runtime_error("Could not open " + file.string());
    }

    std::vector<GridRecord> output;

    std::string line;
    size_t lineNo = 0;
    while (std::getline(inStream, line)) {
        lineNo++;
        auto text = trim(line);
        if (text.empty() || text.front() == '#') {
            continue;
        }
        output.emplace_back(lineNo, std::move(text));
    }
    return output;
}
