#include "arg_parser.hpp"

ArgParser::ArgParser(int argc, char* argv[], const std::set<std::string>& known_flags,
                     const std::set<std::string>& value_flags,
                     const std::map<char, std::string>& short_map)
    : known_flags_(known_flags), value_flags_(value_flags), short_map_(short_map) {
    bool only_positional = false;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (only_positional) {
            positional_.push_back(arg);
        } else if (arg == "--") {
            only_positional = true;
        } else if (arg.rfind("--", 0) == 0) {
            size_t eq = arg.find('=');
            std::string key = arg.substr(0, eq);
            if (!is_known(key)) {
                unknown_flags_.push_back(key);
                if (eq == std::string::npos && value_flags_.count(key) && i + 1 < argc)
                    ++i;
                continue;
            }
            if (eq != std::string::npos) {
                record(key, arg.substr(eq + 1));
            } else if (value_flags_.count(key)) {
                if (i + 1 < argc)
                    record(key, argv[++i]);
                else
                    missing_values_.push_back(key);
            } else {
                record(key);
            }
        } else if (arg.size() >= 2 && arg[0] == '-') {
            // Short options: switches may be stacked, a value option ends the
            // group and takes the remainder or the next argument.
            for (size_t j = 1; j < arg.size(); ++j) {
                auto it = short_map_.find(arg[j]);
                if (it == short_map_.end()) {
                    unknown_flags_.push_back(std::string("-") + arg[j]);
                    break;
                }
                const std::string& key = it->second;
                if (!value_flags_.count(key)) {
                    record(key);
                    continue;
                }
                std::string rest = arg.substr(j + 1);
                if (!rest.empty() && rest[0] == '=')
                    rest.erase(0, 1);
                if (!rest.empty())
                    record(key, rest);
                else if (i + 1 < argc)
                    record(key, argv[++i]);
                else
                    missing_values_.push_back(key);
                break;
            }
        } else {
            positional_.push_back(arg);
        }
    }
}

bool ArgParser::is_known(const std::string& key) const {
    return known_flags_.empty() || known_flags_.count(key) > 0;
}

void ArgParser::record(const std::string& key) { flags_.insert(key); }

void ArgParser::record(const std::string& key, const std::string& value) {
    flags_.insert(key);
    options_[key] = value;
    multi_options_[key].push_back(value);
}

std::string ArgParser::get_option(const std::string& opt) const {
    auto it = options_.find(opt);
    if (it != options_.end())
        return it->second;
    return "";
}

std::vector<std::string> ArgParser::get_all_options(const std::string& opt) const {
    auto it = multi_options_.find(opt);
    if (it != multi_options_.end())
        return it->second;
    return {};
}
