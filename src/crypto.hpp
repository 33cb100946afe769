#pragma once
#include <cstddef>
#include <istream>
#include <string>
#include <vector>

// Streams `in` to end-of-data through the named digest, `chunk_size` bytes
// at a time. Throws UnsupportedAlgorithm for names libcrypto does not know.
std::string hash_stream(std::istream& in, const std::string& algorithm,
                        std::size_t chunk_size = 8192);

std::string hash_string(const std::string& data, const std::string& algorithm);

// True when `algorithm` (or one of its aliases) resolves to a digest.
bool is_supported_algorithm(const std::string& algorithm);

std::string hex_encode(const std::vector<unsigned char>& data);
