#pragma once
#include <cstddef>
#include <string>

struct Settings {
    std::string hash_algorithm = "sha256";
    std::string manifest_name  = ".manifestly.json";
    std::string ignore_name    = ".manifestlyignore";
    std::string diff_member    = ".manifestly.diff";
    std::size_t chunk_size     = 8192;

    // Defaults overridden by MANIFESTLY_* environment variables.
    static Settings from_env();
};

const char* manifestly_version();
