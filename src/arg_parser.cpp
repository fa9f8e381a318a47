#include "arg_parser.hpp"

namespace {

bool looks_like_flag(const std::string& arg) { return arg.size() >= 2 && arg[0] == '-'; }

} // namespace

bool ArgParser::is_known(const std::string& key) const {
    return known_flags_.empty() || known_flags_.count(key) > 0;
}

void ArgParser::record(const std::string& key) {
    if (is_known(key))
        flags_.insert(key);
    else
        unknown_flags_.push_back(key);
}

void ArgParser::record(const std::string& key, const std::string& val) {
    if (!is_known(key)) {
        unknown_flags_.push_back(key);
        return;
    }
    flags_.insert(key);
    options_[key] = val;
    multi_options_[key].push_back(val);
}

ArgParser::ArgParser(int argc, char* argv[], const std::set<std::string>& known_flags,
                     const std::map<char, std::string>& short_map)
    : known_flags_(known_flags), short_map_(short_map) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg.rfind("--", 0) == 0) {
            size_t eq = arg.find('=');
            if (eq != std::string::npos) {
                record(arg.substr(0, eq), arg.substr(eq + 1));
            } else if (i + 1 < argc && !looks_like_flag(argv[i + 1])) {
                record(arg, argv[++i]);
            } else {
                record(arg);
            }
        } else if (arg.rfind('-', 0) == 0 && arg.size() >= 2 && short_map_.count(arg[1])) {
            // Short flags may be bundled (-gs) and the last one may carry a
            // value inline (-i5m), after '=' (-i=5m) or in the next argument.
            size_t eq = arg.find('=');
            std::string before =
                arg.substr(1, eq != std::string::npos ? eq - 1 : std::string::npos);
            std::string after = eq != std::string::npos ? arg.substr(eq + 1) : "";

            for (size_t j = 0; j < before.size();) {
                char c = before[j];
                if (!short_map_.count(c))
                    break;
                const std::string& key = short_map_.at(c);
                std::string val;
                bool last = (j == before.size() - 1);
                if (last) {
                    if (!after.empty())
                        val = after;
                    else if (i + 1 < argc && !looks_like_flag(argv[i + 1]))
                        val = argv[++i];
                } else if (!short_map_.count(before[j + 1])) {
                    val = before.substr(j + 1) + after;
                }
                if (!val.empty()) {
                    record(key, val);
                    break;
                }
                record(key);
                ++j;
            }
        } else if (looks_like_flag(arg)) {
            unknown_flags_.push_back(arg);
        } else {
            positional_.push_back(arg);
        }
    }
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
