#include "summarizer.hpp"
#include <vector>

namespace {

bool starts_with(const std::string& s, const char* prefix) { return s.rfind(prefix, 0) == 0; }

// "diff --git a/x b/y" -> "y"
std::string file_from_header(const std::string& line) {
    auto pos = line.rfind(" b/");
    if (pos == std::string::npos)
        return line.substr(11);
    return line.substr(pos + 3);
}

} // namespace

std::string DiffStatSummarizer::summarize(const std::string& diff) {
    std::vector<std::string> files;
    size_t added = 0;
    size_t removed = 0;
    bool in_hunk = false;
    size_t start = 0;
    while (start < diff.size()) {
        size_t end = diff.find('\n', start);
        if (end == std::string::npos)
            end = diff.size();
        std::string line = diff.substr(start, end - start);
        start = end + 1;
        if (starts_with(line, "diff --git ")) {
            files.push_back(file_from_header(line));
            in_hunk = false;
        } else if (starts_with(line, "@@")) {
            in_hunk = true;
        } else if (in_hunk && !line.empty()) {
            if (line[0] == '+')
                ++added;
            else if (line[0] == '-')
                ++removed;
        }
    }
    if (files.empty())
        return kGenericMessage;

    std::string msg = "Update " + std::to_string(files.size()) +
                      (files.size() == 1 ? " file: " : " files: ");
    const size_t shown = files.size() < 3 ? files.size() : 3;
    for (size_t i = 0; i < shown; ++i) {
        if (i > 0)
            msg += ", ";
        msg += files[i];
    }
    if (files.size() > shown)
        msg += " and " + std::to_string(files.size() - shown) + " more";
    msg += " (+" + std::to_string(added) + " -" + std::to_string(removed) + ")";
    return msg;
}
