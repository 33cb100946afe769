#include "ignore.hpp"
#include "errors.hpp"
#include "paths.hpp"
#include "storage.hpp"
#include <algorithm>
#include <fnmatch.h>
#include <iostream>

namespace {

std::string strip_slashes(const std::string& s) {
    auto first = s.find_first_not_of('/');
    if (first == std::string::npos) return "";
    auto last = s.find_last_not_of('/');
    return s.substr(first, last - first + 1);
}

std::string rtrim(std::string s) {
    while (!s.empty() && (s.back() == '\r' || s.back() == ' ' || s.back() == '\t'))
        s.pop_back();
    return s;
}

} // namespace

IgnoreMatcher::IgnoreMatcher(std::vector<std::string> patterns) {
    for (auto& p : patterns) add_pattern(p);
}

IgnoreMatcher IgnoreMatcher::load(FileStore& store, const std::string& ignore_file,
                                  const Settings& settings) {
    IgnoreMatcher matcher({settings.manifest_name, settings.ignore_name, settings.diff_member});
    if (!store.is_file(ignore_file))
        return matcher;

    try {
        auto in = store.open_read(ignore_file);
        std::string line;
        while (std::getline(*in, line)) {
            line = rtrim(line);
            if (line.empty() || line.front() == '#') continue;
            matcher.add_pattern(line);
        }
    } catch (const StorageError& e) {
        std::cerr << "Ignoring unreadable " << ignore_file << ": " << e.what() << "\n";
    }
    return matcher;
}

bool IgnoreMatcher::should_ignore(const std::string& relative_path) const {
    std::string normalized = normalize_path(relative_path);

    std::vector<std::string> parts;
    std::string::size_type start = 0;
    while (start <= normalized.size()) {
        auto end = normalized.find('/', start);
        if (end == std::string::npos) end = normalized.size();
        if (end > start) parts.push_back(normalized.substr(start, end - start));
        start = end + 1;
    }

    for (auto& pattern : patterns_) {
        std::string p = strip_slashes(pattern);
        if (p.empty()) continue;
        for (auto& part : parts) {
            if (fnmatch(p.c_str(), part.c_str(), 0) == 0)
                return true;
        }
    }
    return false;
}

void IgnoreMatcher::add_pattern(const std::string& pattern) {
    std::string p = normalize_path(pattern);
    if (p.empty()) return;
    if (std::find(patterns_.begin(), patterns_.end(), p) == patterns_.end())
        patterns_.push_back(p);
}
