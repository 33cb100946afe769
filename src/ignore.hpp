#pragma once
#include "settings.hpp"
#include <string>
#include <vector>

class FileStore;

// Glob exclusions read from a per-directory ignore file. A pattern is matched
// against every '/'-separated segment of a path; any matching segment
// excludes the whole path.
class IgnoreMatcher {
public:
    IgnoreMatcher() = default;
    explicit IgnoreMatcher(std::vector<std::string> patterns);

    // The settings' manifest, ignore-file and diff-member names, followed by
    // the lines of `ignore_file` if it exists. Blank lines and '#' comments
    // are skipped.
    static IgnoreMatcher load(FileStore& store, const std::string& ignore_file,
                              const Settings& settings);

    bool should_ignore(const std::string& relative_path) const;

    // No-op when the pattern is already present.
    void add_pattern(const std::string& pattern);

    const std::vector<std::string>& patterns() const { return patterns_; }

private:
    std::vector<std::string> patterns_;
};
