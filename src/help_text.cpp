#include "help_text.hpp"
#include <algorithm>
#include <cstring>
#include <iomanip>
#include <iostream>
#include <map>
#include <string>
#include <vector>

struct OptionInfo {
    const char* long_flag;
    const char* short_flag;
    const char* arg;
    const char* desc;
    const char* category;
};

static std::string flag_column(const OptionInfo& o) {
    std::string flag = "  ";
    if (std::strlen(o.short_flag))
        flag += std::string(o.short_flag) + ", ";
    else
        flag += "    ";
    flag += o.long_flag;
    if (std::strlen(o.arg))
        flag += " " + std::string(o.arg);
    return flag;
}

void print_help(const char* prog, std::ostream& os) {
    static const std::vector<OptionInfo> opts = {
        {"--root", "-o", "<path>", "Root folder to scan for repositories", "Basics"},
        {"--interval", "-i", "<N[s|m|h|d]>", "Delay between checks (default 30m)", "Basics"},
        {"--single-run", "-u", "", "Run one check cycle and exit", "Basics"},
        {"--scan-exclude", "-x", "<text>", "Skip directories whose name contains text (repeatable)",
         "Scanning"},
        {"--check-exclude", "-X", "<text>",
         "Track but never commit repos whose name contains text (repeatable)", "Scanning"},
        {"--no-default-excludes", "", "", "Drop node_modules, .git and .venv from scan excludes",
         "Scanning"},
        {"--cache-file", "-C", "<path>", "Repository cache (default .autogitpush_cache.txt)",
         "Scanning"},
        {"--rescan", "", "", "Ignore the cached repository list and scan again", "Scanning"},
        {"--clear-cache", "", "", "Empty the cache file before starting", "Scanning"},
        {"--remote", "", "<name>", "Default push remote (default origin)", "Git"},
        {"--author-name", "", "<name>", "Commit author when git config has none", "Git"},
        {"--author-email", "", "<email>", "Commit email when git config has none", "Git"},
        {"--ssh-public-key", "", "<path>", "SSH public key for push", "Git"},
        {"--ssh-private-key", "", "<path>", "SSH private key for push", "Git"},
        {"--credential-file", "", "<path>", "File with username and password lines", "Git"},
        {"--summary-url", "", "<url>", "HTTP endpoint that writes commit messages", "Summary"},
        {"--summary-timeout", "", "<ms|s|m>", "Timeout for the summary request (default 10s)",
         "Summary"},
        {"--summary-max-bytes", "", "<B/KB/MB>", "Diff bytes sent to the endpoint (default 64KB)",
         "Summary"},
        {"--config-yaml", "-y", "<file>", "Load options from YAML file", "Config"},
        {"--config-json", "-j", "<file>", "Load options from JSON file", "Config"},
        {"--log-file", "-l", "<path>", "File for general logs", "Logging"},
        {"--log-level", "-L", "<level>", "Set log verbosity", "Logging"},
        {"--verbose", "-g", "", "Shorthand for --log-level DEBUG", "Logging"},
        {"--max-log-size", "", "<bytes>", "Rotate --log-file when over this size", "Logging"},
        {"--log-files", "", "<n>", "Rotated log files to keep (default 1)", "Logging"},
        {"--json-log", "", "", "Write log entries as JSON", "Logging"},
        {"--compress-logs", "", "", "Gzip rotated log files", "Logging"},
        {"--syslog", "", "", "Log to syslog", "Logging"},
        {"--silent", "-s", "", "Do not print warnings and errors to stderr", "Logging"},
        {"--version", "-V", "", "Print program version and exit", "Basics"},
        {"--help", "-h", "", "Show this message", "Basics"}};

    std::map<std::string, std::vector<const OptionInfo*>> groups;
    size_t width = 0;
    for (const auto& o : opts) {
        groups[o.category].push_back(&o);
        width = std::max(width, flag_column(o).size());
    }

    os << "autogitpush - Automatic Git Committer & Pusher\n";
    os << "Finds Git repositories under a folder, then periodically commits and pushes\n";
    os << "their local changes with a generated commit message.\n";
    os << "Configuration can be read from YAML or JSON files.\n\n";
    os << "Usage: " << prog << " <root-folder> [options]\n";
    os << "       " << prog << " --root <path> [options]\n\n";
    const std::vector<std::string> order{"Basics", "Scanning", "Git", "Summary", "Config",
                                         "Logging"};
    for (const auto& cat : order) {
        if (!groups.count(cat))
            continue;
        os << cat << ":\n";
        for (const auto* o : groups[cat])
            os << std::left << std::setw(static_cast<int>(width) + 2) << flag_column(*o) << o->desc
               << "\n";
        os << "\n";
    }
}

void print_help(const char* prog) { print_help(prog, std::cout); }
