#include <catch2/catch_test_macros.hpp>
#include <coderag/crypto/hasher.h>

#include "common/test_helpers_catch2.h"

#include <string>
#include <vector>

using namespace coderag;
using namespace coderag::crypto;

namespace {

constexpr const char* kEmptySha256 =
    "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855";
constexpr const char* kAbcSha256 =
    "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad";

} // namespace

TEST_CASE("SHA256Hasher - known vectors", "[crypto][sha256][catch2]") {
    SECTION("Empty input") {
        SHA256Hasher hasher;
        CHECK(hasher.finalize() == kEmptySha256);
    }

    SECTION("abc via one-shot helper") {
        CHECK(SHA256Hasher::hash("abc") == kAbcSha256);
    }

    SECTION("Incremental updates match one-shot") {
        SHA256Hasher hasher;
        hasher.update(std::string_view("a"));
        hasher.update(std::string_view("b"));
        hasher.update(std::string_view("c"));
        CHECK(hasher.finalize() == kAbcSha256);
    }

    SECTION("Hasher is reusable after finalize") {
        SHA256Hasher hasher;
        hasher.update(std::string_view("abc"));
        CHECK(hasher.finalize() == kAbcSha256);
        CHECK(hasher.finalize() == kEmptySha256);
    }

    SECTION("Embedded NUL bytes are hashed") {
        const std::string withNul("a\0b", 3);
        CHECK(SHA256Hasher::hash(withNul) != SHA256Hasher::hash("ab"));
        CHECK(SHA256Hasher::hash(withNul).size() == 64);
    }
}

TEST_CASE("SHA256Hasher - hashFile", "[crypto][sha256][catch2]") {
    test::TempDir dir;

    SECTION("File digest equals content digest") {
        std::string content;
        for (int i = 0; i < 20000; ++i) {
            content += static_cast<char>('a' + i % 26);
        }
        auto path = test::write_file(dir / "data.txt", content);
        SHA256Hasher hasher;
        auto digest = hasher.hashFile(path);
        REQUIRE(digest);
        CHECK(digest.value() == SHA256Hasher::hash(content));
    }

    SECTION("Missing file reports FileNotFound") {
        SHA256Hasher hasher;
        auto digest = hasher.hashFile(dir / "missing.bin");
        REQUIRE_FALSE(digest);
        CHECK(digest.error().code == ErrorCode::FileNotFound);
    }
}
