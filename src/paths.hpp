#pragma once
#include <string>

// Store paths are plain strings with '/' separators, whatever the backend.

// Backslashes to '/', repeated '/' collapsed, trailing '/' dropped
// (a lone "/" is kept).
std::string normalize_path(const std::string& path);

std::string join_path(const std::string& base, const std::string& relative);

// Everything before the last '/'; "" for a bare name, "/" for "/name".
std::string parent_path(const std::string& path);

std::string base_name(const std::string& path);

// `path` with the `root` prefix removed and no leading '/'.
// Throws std::invalid_argument when `path` is not under `root`.
std::string relative_to(const std::string& path, const std::string& root);

// Manifest keys are JSON strings, so a path must be well-formed UTF-8 to be
// recorded.
bool is_valid_utf8(const std::string& path);
