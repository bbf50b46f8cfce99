#ifndef SUDOKUFORGE_CLI_OPTS_H
#define SUDOKUFORGE_CLI_OPTS_H

#include <algorithm>
#include <charconv>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

/**
 * Simple command line option parser based on std::find.
 *
 * Options are of the form "--name value". Positional values are read by their index in the argument list, so they
 * must precede any option.
 */
class CliOptionsParser
{
    std::vector<std::string> args;

  public:
    explicit CliOptionsParser(int argc, char** argv)
    {
        for (int i = 1; i < argc; ++i) {
            this->args.emplace_back(argv[i]);
        }
    }

    explicit CliOptionsParser(std::vector<std::string> args)
      : args(std::move(args))
    {}

    /**
     * Returns the string value following the given option. If the option is not present an empty string is returned.
     * If the same option is specified multiple times, the first value is returned.
     *
     * @param option Name of the option
     * @return Option value or empty string
     */
    [[nodiscard]] auto getOption(const std::string_view& option) const -> const std::string&
    {
        auto optIter = std::find(this->args.begin(), this->args.end(), option);
        if (optIter != this->args.end() && ++optIter != this->args.end()) {
            return *optIter;
        }

        // We cannot return a reference to an empty literal as this would be a reference to a temporary std::string.
        static const std::string noOptValue;
        return noOptValue;
    }

    /**
     * Same as getOption() but falls back to the given value if the option is absent or has no value.
     */
    [[nodiscard]] auto getOption(const std::string_view& option, const std::string& fallback) const -> std::string
    {
        const auto& value = getOption(option);
        return value.empty() ? fallback : value;
    }

    /**
     * Parses the value of the given option as an unsigned number.
     *
     * @return The number, the fallback if the option is absent, or std::nullopt if the value is not a number or is
     * larger than maxValue.
     */
    [[nodiscard]] auto getNumericOption(const std::string_view& option,
                                        unsigned long long fallback,
                                        unsigned long long maxValue = std::numeric_limits<unsigned long long>::max()) const
      -> std::optional<unsigned long long>
    {
        if (!hasOption(option)) {
            return fallback;
        }

        const auto& value = getOption(option);
        unsigned long long number = 0;
        const auto* last = value.data() + value.size();
        auto [ptr, ec] = std::from_chars(value.data(), last, number);
        if (value.empty() || ec != std::errc() || ptr != last || number > maxValue) {
            return std::nullopt;
        }
        return number;
    }

    /**
     * Returns the positional value at the given index. If the index is out of bounds an empty string is returned.
     *
     * @param idx Value index. 0 is the first option, not the command name
     * @return Value or empty string
     */
    [[nodiscard]] auto getPositionalOption(size_t idx) const -> const std::string&
    {
        if (idx < args.size()) {
            return args.at(idx);
        }

        static const std::string noOptValue;
        return noOptValue;
    }

    /**
     * Checks whether the given option is present. This does not ensure, that the options actually has a value and
     * should only be used to check for flag-like options.
     * @param option Name of the option
     * @return True if the option is present, false otherwise
     */
    [[nodiscard]] auto hasOption(const std::string_view& option) const -> bool
    {
        return std::find(this->args.begin(), this->args.end(), option) != this->args.end();
    }
};

#endif // SUDOKUFORGE_CLI_OPTS_H
