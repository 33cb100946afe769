#include "settings.hpp"
#include <cstdlib>
#include <stdexcept>

namespace {

const char* env_or_null(const char* name) {
    const char* value = std::getenv(name);
    if (value == nullptr || *value == '\0')
        return nullptr;
    return value;
}

std::size_t parse_chunk_size(const std::string& text) {
    std::size_t pos = 0;
    unsigned long long value = 0;
    try {
        value = std::stoull(text, &pos);
    } catch (const std::exception&) {
        throw std::invalid_argument("MANIFESTLY_CHUNK_SIZE is not a number: " + text);
    }
    if (pos != text.size() || value == 0)
        throw std::invalid_argument("MANIFESTLY_CHUNK_SIZE must be a positive integer: " + text);
    return static_cast<std::size_t>(value);
}

} // namespace

Settings Settings::from_env() {
    Settings s;
    if (auto v = env_or_null("MANIFESTLY_HASH_ALGORITHM")) s.hash_algorithm = v;
    if (auto v = env_or_null("MANIFESTLY_NAME"))           s.manifest_name = v;
    if (auto v = env_or_null("MANIFESTLY_IGNORE"))         s.ignore_name = v;
    if (auto v = env_or_null("MANIFESTLY_CHUNK_SIZE"))     s.chunk_size = parse_chunk_size(v);
    return s;
}

const char* manifestly_version() {
    return "0.1.0";
}
