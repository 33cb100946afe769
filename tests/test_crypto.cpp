#include <catch2/catch.hpp>
#include "crypto.hpp"
#include "errors.hpp"
#include "test_helpers.hpp"
#include <sstream>

TEST_CASE("hash_stream: sha256 of known inputs", "[crypto]") {
    std::istringstream hi("hi");
    REQUIRE(hash_stream(hi, "sha256") == SHA256_HI);

    std::istringstream empty("");
    REQUIRE(hash_stream(empty, "sha256") == SHA256_EMPTY);
}

TEST_CASE("hash_stream: chunk size does not change the digest", "[crypto]") {
    std::string data(100000, 'a');
    for (std::size_t i = 0; i < data.size(); ++i)
        data[i] = static_cast<char>('a' + i % 26);

    std::istringstream one(data), small(data), odd(data);
    auto expected = hash_stream(one, "sha256", 8192);
    REQUIRE(hash_stream(small, "sha256", 1) == expected);
    REQUIRE(hash_stream(odd, "sha256", 4093) == expected);
    REQUIRE(hash_string(data, "sha256") == expected);
}

TEST_CASE("hash_stream: consumes the stream to the end", "[crypto]") {
    std::istringstream in("hello");
    hash_stream(in, "sha256", 2);
    REQUIRE(in.eof());
}

TEST_CASE("hash_stream: other digests by name", "[crypto]") {
    REQUIRE(hash_string("hi", "md5") == "49f68a5c8493ec2c0bf489821c21fc3b");
    REQUIRE(hash_string("hi", "SHA256") == SHA256_HI);
    REQUIRE(hash_string("hi", "sha512").size() == 128);
    REQUIRE(hash_string("hi", "sha3_256").size() == 64);
    REQUIRE(hash_string("hi", "blake2b").size() == 128);
}

TEST_CASE("hash_stream: unknown algorithm", "[crypto]") {
    std::istringstream in("hi");
    REQUIRE_THROWS_AS(hash_stream(in, "not-a-digest"), UnsupportedAlgorithm);
    REQUIRE_FALSE(is_supported_algorithm("not-a-digest"));
    REQUIRE(is_supported_algorithm("sha256"));
}

TEST_CASE("hex_encode: lowercase, zero padded", "[crypto]") {
    REQUIRE(hex_encode({0x00, 0x0f, 0xab, 0xff}) == "000fabff");
    REQUIRE(hex_encode({}).empty());
}
