/**
 * @file code_chunker_catch2_test.cpp
 * @brief Structure-aware source chunking
 *
 * Test Coverage:
 * - Cut priority: structural boundary, blank line, newline, UTF-8 safe hard cut
 * - Overlap between neighbours and lossless reconstruction
 * - Line numbering and ordering
 * - Deterministic chunk ids
 * - Lazy, restartable sequences
 */

#include <catch2/catch_test_macros.hpp>
#include <coderag/chunking/code_chunker.h>

#include <string>
#include <vector>

using namespace coderag::chunking;
using coderag::detection::Language;

namespace {

std::string pythonFunction(const std::string& name, size_t bodyLines) {
    std::string out = "def " + name + "(values):\n";
    for (size_t i = 0; i < bodyLines; ++i) {
        out += "    total = total + 1  # pad\n";
    }
    return out;
}

// Rebuild the file by dropping each chunk's overlap prefix
std::string reconstruct(const std::vector<CodeChunk>& chunks) {
    std::string out;
    for (const auto& chunk : chunks) {
        out += chunk.text.substr(chunk.overlap_length);
    }
    return out;
}

} // namespace

TEST_CASE("CodeChunker - small inputs", "[chunking][code_chunker][catch2]") {
    CodeChunker chunker;

    SECTION("Empty content yields an empty sequence") {
        auto sequence = chunker.split("empty.py", "", Language::Python);
        CHECK(sequence.empty());
        CHECK(sequence.begin() == sequence.end());
        CHECK(sequence.collect().empty());
    }

    SECTION("Content under the limit is one chunk") {
        const std::string content = "def f():\n    return 1\n";
        auto chunks = chunker.split("small.py", content, Language::Python).collect();
        REQUIRE(chunks.size() == 1);
        CHECK(chunks[0].text == content);
        CHECK(chunks[0].ordinal == 0);
        CHECK(chunks[0].start_line == 1);
        CHECK(chunks[0].end_line == 2);
        CHECK(chunks[0].start_offset == 0);
        CHECK(chunks[0].end_offset == content.size());
        CHECK_FALSE(chunks[0].overlap_with_prev);
        CHECK(chunks[0].overlap_length == 0);
        CHECK(chunks[0].source_file == "small.py");
        CHECK(chunks[0].language == Language::Python);
    }
}

TEST_CASE("CodeChunker - cuts at structural boundaries", "[chunking][code_chunker][catch2]") {
    const std::string first = pythonFunction("first", 10);
    const std::string second = pythonFunction("second", 10);
    const std::string content = first + "\n" + second;

    ChunkerConfig config;
    config.max_chunk_chars = 400;
    config.overlap_chars = 50;
    CodeChunker chunker(config);

    auto chunks = chunker.split("funcs.py", content, Language::Python).collect();
    REQUIRE(chunks.size() == 2);

    const size_t secondStart = content.find("def second");
    CHECK(chunks[0].end_offset == secondStart);
    CHECK(chunks[0].text.find("def second") == std::string::npos);

    CHECK(chunks[1].overlap_with_prev);
    CHECK(chunks[1].overlap_length == 50);
    CHECK(chunks[1].start_offset == secondStart - 50);
    CHECK(chunks[1].end_offset == content.size());
    CHECK(chunks[1].text.find("def second") != std::string::npos);

    CHECK(reconstruct(chunks) == content);
}

TEST_CASE("CodeChunker - invariants over a large file", "[chunking][code_chunker][catch2]") {
    std::string content;
    for (int i = 0; i < 40; ++i) {
        content += pythonFunction("handler_" + std::to_string(i), 3 + i % 7);
        content += "\n";
    }

    ChunkerConfig config;
    config.max_chunk_chars = 300;
    config.overlap_chars = 40;
    CodeChunker chunker(config);

    auto chunks = chunker.split("big.py", content, Language::Python).collect();
    REQUIRE(chunks.size() > 5);

    SECTION("Chunks respect the size limit") {
        for (const auto& chunk : chunks) {
            CHECK(chunk.size() <= config.max_chunk_chars);
            CHECK_FALSE(chunk.text.empty());
        }
    }

    SECTION("Ordinals and lines are ordered") {
        for (size_t i = 0; i < chunks.size(); ++i) {
            CHECK(chunks[i].ordinal == i);
            CHECK(chunks[i].start_line <= chunks[i].end_line);
            if (i > 0) {
                CHECK(chunks[i].start_line >= chunks[i - 1].start_line);
                CHECK(chunks[i].end_line >= chunks[i - 1].end_line);
                CHECK(chunks[i].start_offset + chunks[i].overlap_length ==
                      chunks[i - 1].end_offset);
            }
        }
    }

    SECTION("Overlap never exceeds the configured amount") {
        CHECK(chunks.front().overlap_length == 0);
        for (size_t i = 1; i < chunks.size(); ++i) {
            CHECK(chunks[i].overlap_length <= config.overlap_chars);
        }
    }

    SECTION("Dropping overlaps restores the file") {
        CHECK(reconstruct(chunks) == content);
    }
}

TEST_CASE("CodeChunker - falls back to blank lines and newlines",
          "[chunking][code_chunker][catch2]") {
    ChunkerConfig config;
    config.max_chunk_chars = 120;
    config.overlap_chars = 0;
    CodeChunker chunker(config);

    SECTION("Blank line preferred when no structure is known") {
        std::string content;
        content += std::string(59, 'a') + "\n";
        content += std::string(29, 'b') + "\n\n";
        content += std::string(59, 'c') + "\n";
        auto chunks = chunker.split("notes.txt", content, Language::Unknown).collect();
        REQUIRE(chunks.size() == 2);
        CHECK(chunks[0].end_offset == content.find('c'));
        CHECK(reconstruct(chunks) == content);
    }

    SECTION("Plain newline when there is no blank line") {
        std::string content;
        for (int i = 0; i < 6; ++i) {
            content += std::string(39, static_cast<char>('a' + i)) + "\n";
        }
        auto chunks = chunker.split("lines.txt", content, Language::Unknown).collect();
        REQUIRE(chunks.size() == 2);
        CHECK(chunks[0].end_offset == 120);
        CHECK(chunks[0].text.back() == '\n');
        CHECK(reconstruct(chunks) == content);
    }
}

TEST_CASE("CodeChunker - hard cuts keep UTF-8 intact", "[chunking][code_chunker][catch2]") {
    std::string content;
    for (int i = 0; i < 500; ++i) {
        content += "\xC3\xA9"; // U+00E9
    }

    ChunkerConfig config;
    config.max_chunk_chars = 101;
    config.overlap_chars = 10;
    CodeChunker chunker(config);

    auto chunks = chunker.split("accents.txt", content, Language::Unknown).collect();
    REQUIRE(chunks.size() > 1);
    for (const auto& chunk : chunks) {
        REQUIRE_FALSE(chunk.text.empty());
        CHECK(static_cast<unsigned char>(chunk.text.front()) == 0xC3);
        CHECK(chunk.text.size() % 2 == 0);
        CHECK(chunk.size() <= config.max_chunk_chars);
    }
    CHECK(reconstruct(chunks) == content);
}

TEST_CASE("CodeChunker - structural boundary detection", "[chunking][code_chunker][catch2]") {
    SECTION("Decorators stay attached to the definition") {
        const std::string content =
            "import os\n\n@app.route('/')\ndef index():\n    return os.getcwd()\n";
        auto boundaries = CodeChunker::findStructuralBoundaries(content, Language::Python);
        REQUIRE(boundaries.size() == 1);
        CHECK(boundaries[0] == content.find("@app"));
    }

    SECTION("Line after a closing brace opens a unit in brace languages") {
        const std::string content =
            "int a() {\n  return 1;\n}\nint b() {\n  return 2;\n}\n";
        auto boundaries = CodeChunker::findStructuralBoundaries(content, Language::Cpp);
        REQUIRE(boundaries.size() == 1);
        CHECK(boundaries[0] == content.find("int b"));
    }

    SECTION("Deeply indented definitions are not boundaries") {
        const std::string content =
            "class Outer:\n    def method(self):\n            def inner():\n"
            "                pass\n";
        auto boundaries = CodeChunker::findStructuralBoundaries(content, Language::Python);
        REQUIRE(boundaries.size() == 1);
        CHECK(boundaries[0] == content.find("    def method"));
    }

    SECTION("Unknown language has no structure") {
        CHECK(CodeChunker::findStructuralBoundaries("def a():\ndef b():\n", Language::Unknown)
                  .empty());
    }
}

TEST_CASE("CodeChunker - chunk ids", "[chunking][code_chunker][catch2]") {
    std::string content;
    for (int i = 0; i < 10; ++i) {
        content += pythonFunction("f" + std::to_string(i), 5) + "\n";
    }
    ChunkerConfig config;
    config.max_chunk_chars = 250;
    config.overlap_chars = 20;
    CodeChunker chunker(config);

    auto a = chunker.split("pkg/mod.py", content, Language::Python).collect();
    auto b = chunker.split("pkg/mod.py", content, Language::Python).collect();
    auto other = chunker.split("pkg/other.py", content, Language::Python).collect();

    REQUIRE(a.size() == b.size());
    REQUIRE(a.size() == other.size());
    for (size_t i = 0; i < a.size(); ++i) {
        CHECK(a[i].id == b[i].id);
        CHECK(a[i].id != other[i].id);
        CHECK(a[i].id.size() == 64);
        CHECK(a[i].id == generateChunkId("pkg/mod.py", i, a[i].text, config.id_prefix_chars));
    }
    for (size_t i = 1; i < a.size(); ++i) {
        CHECK(a[i].id != a[i - 1].id);
    }
}

TEST_CASE("CodeChunker - sequences are lazy and restartable", "[chunking][code_chunker][catch2]") {
    std::string content;
    for (int i = 0; i < 20; ++i) {
        content += pythonFunction("g" + std::to_string(i), 4) + "\n";
    }
    ChunkerConfig config;
    config.max_chunk_chars = 200;
    config.overlap_chars = 30;

    ChunkSequence sequence = [&]() {
        CodeChunker chunker(config);
        return chunker.split("lazy.py", content, Language::Python);
    }();

    size_t firstPass = 0;
    for (const auto& chunk : sequence) {
        CHECK(chunk.ordinal == firstPass);
        ++firstPass;
    }
    size_t secondPass = 0;
    for (auto it = sequence.begin(); it != sequence.end(); ++it) {
        ++secondPass;
    }
    CHECK(firstPass > 1);
    CHECK(firstPass == secondPass);
    CHECK(sequence.collect().size() == firstPass);
}

TEST_CASE("CodeChunker - unusable configuration is clamped", "[chunking][code_chunker][catch2]") {
    ChunkerConfig config;
    config.max_chunk_chars = 100;
    config.overlap_chars = 150;
    CodeChunker clamped(config);
    CHECK(clamped.getConfig().overlap_chars == 50);

    config.max_chunk_chars = 0;
    config.overlap_chars = 10;
    CodeChunker defaulted(config);
    CHECK(defaulted.getConfig().max_chunk_chars == 800);
}
