#ifndef ARG_PARSER_HPP
#define ARG_PARSER_HPP
#include <map>
#include <set>
#include <string>
#include <vector>

/**
 * @brief Command line argument parser.
 *
 * Recognizes long options (`--flag`, `--opt value`, `--opt=value`) and short
 * aliases (`-h`, `-L DEBUG`, `-LDEBUG`, stacked switches such as `-dv`).
 * Only options listed in @a value_flags consume a value; everything else is a
 * switch. Flags outside @a known_flags are collected in unknown_flags() so the
 * caller can reject them.
 */
class ArgParser {
    std::set<std::string> flags_;                ///< Flags present on the command line
    std::map<std::string, std::string> options_; ///< Last value seen per option
    std::map<std::string, std::vector<std::string>>
        multi_options_;                      ///< Every value of repeatable options
    std::vector<std::string> positional_;    ///< Positional arguments in order
    std::vector<std::string> unknown_flags_; ///< Flags not present in known_flags
    std::vector<std::string> missing_values_; ///< Value options given without a value
    std::set<std::string> known_flags_;
    std::set<std::string> value_flags_;
    std::map<char, std::string> short_map_;

    bool is_known(const std::string& key) const;
    void record(const std::string& key);
    void record(const std::string& key, const std::string& value);

  public:
    /**
     * @param argc        Argument count from `main`.
     * @param argv        Argument vector from `main`.
     * @param known_flags Accepted long flags. Empty accepts everything.
     * @param value_flags Long flags that take a value.
     * @param short_map   Single-character aliases for long flags.
     */
    ArgParser(int argc, char* argv[], const std::set<std::string>& known_flags = {},
              const std::set<std::string>& value_flags = {},
              const std::map<char, std::string>& short_map = {});

    bool has_flag(const std::string& flag) const { return flags_.count(flag) > 0; }

    /** @return Last value given for @p opt, or an empty string. */
    std::string get_option(const std::string& opt) const;

    /** @return Every value given for @p opt in command line order. */
    std::vector<std::string> get_all_options(const std::string& opt) const;

    const std::set<std::string>& flags() const { return flags_; }
    const std::vector<std::string>& positional() const { return positional_; }
    const std::vector<std::string>& unknown_flags() const { return unknown_flags_; }
    const std::vector<std::string>& missing_values() const { return missing_values_; }
};

#endif // ARG_PARSER_HPP
