// options_timing.cpp
//
// Parse timing values: the monitor interval and the summary request timeout.

#include <map>
#include <stdexcept>
#include <string>

#include "options.hpp"
#include "arg_parser.hpp"
#include "parse_utils.hpp"

void parse_timing_options(Options& opts, const ArgParser& parser,
                          const std::function<std::string(const std::string&)>& cfg_opt,
                          const ConfigValues& cfg) {
    bool ok = false;
    auto read_interval = [&](const std::string& val) {
        auto dur = parse_duration(val, ok);
        if (!ok || dur.count() < 1)
            throw std::runtime_error("Invalid value for --interval");
        opts.manager.check_interval = dur;
    };
    if (cfg.opts.count("--interval"))
        read_interval(cfg_opt("--interval"));
    if (parser.has_flag("--interval"))
        read_interval(parser.get_option("--interval"));

    auto read_timeout = [&](const std::string& val) {
        opts.summary.timeout = parse_time_ms(val, ok);
        if (!ok || opts.summary.timeout.count() < 1)
            throw std::runtime_error("Invalid value for --summary-timeout");
    };
    if (cfg.opts.count("--summary-timeout"))
        read_timeout(cfg_opt("--summary-timeout"));
    if (parser.has_flag("--summary-timeout"))
        read_timeout(parser.get_option("--summary-timeout"));
}
