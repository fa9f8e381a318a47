#ifndef ARG_PARSER_HPP
#define ARG_PARSER_HPP
#include <string>
#include <set>
#include <vector>
#include <map>

/**
 * @brief Simple command line argument parser.
 *
 * The parser recognizes long style options (e.g. `--flag` or `--opt value`).
 * A list of known flags can be provided so that unknown flags are collected
 * and reported separately. Options may also be specified using the form
 * `--opt=value`. A mapping of short options (like `-h`) to their long
 * counterparts can optionally be supplied. Repeating an option keeps every
 * value (see get_all_options()); get_option() returns the last one.
 */
class ArgParser {
    std::set<std::string> flags_;                ///< Flags present on the command line
    std::map<std::string, std::string> options_; ///< Option values keyed by flag
    std::map<std::string, std::vector<std::string>>
        multi_options_;                      ///< Store all values for repeatable options
    std::vector<std::string> positional_;    ///< Positional arguments in order
    std::vector<std::string> unknown_flags_; ///< Flags not present in known_flags
    std::set<std::string> known_flags_;      ///< List of accepted flags
    std::map<char, std::string> short_map_;  ///< Mapping of short to long flags

    bool is_known(const std::string& key) const;
    void record(const std::string& key);
    void record(const std::string& key, const std::string& val);

  public:
    /**
     * @brief Parse the given command line arguments.
     *
     * @param argc Argument count from `main`.
     * @param argv Argument vector from `main`.
     * @param known_flags Optional set of flags that are considered valid. If
     *        empty, all flags are treated as known.
     * @param short_map Mapping from single character options (e.g. '-h') to
     *        their long form (e.g. '--help').
     */
    ArgParser(int argc, char* argv[], const std::set<std::string>& known_flags = {},
              const std::map<char, std::string>& short_map = {});

    /**
     * @brief Check whether a flag was provided on the command line.
     *
     * @param flag Flag name including the leading `--`.
     * @return `true` if the flag was present, otherwise `false`.
     */
    bool has_flag(const std::string& flag) const { return flags_.count(flag) > 0; }

    /**
     * @brief Retrieve the value associated with an option.
     *
     * If the option was not provided, an empty string is returned.
     *
     * @param opt Option name including the leading `--`.
     * @return Stored option value or empty string if missing.
     */
    std::string get_option(const std::string& opt) const;

    /**
     * @brief Retrieve all values associated with an option.
     *
     * If the option was not provided, an empty vector is returned.
     */
    std::vector<std::string> get_all_options(const std::string& opt) const;

    /** @return Set of all flags found during parsing. */
    const std::set<std::string>& flags() const { return flags_; }

    /** @return Map of option names to their parsed values. */
    const std::map<std::string, std::string>& options() const { return options_; }

    /** @return Ordered list of positional arguments. */
    const std::vector<std::string>& positional() const { return positional_; }

    /** @return Flags that were not part of @a known_flags. */
    const std::vector<std::string>& unknown_flags() const { return unknown_flags_; }
};

#endif // ARG_PARSER_HPP
