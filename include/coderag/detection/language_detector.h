#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace coderag::detection {

/**
 * @brief Source languages recognised by the chunker and feature embedder
 */
enum class Language {
    Unknown = 0,
    Python,
    JavaScript,
    TypeScript,
    Java,
    Cpp,
    C,
    CSharp,
    Go,
    Rust,
    Php,
    Ruby,
    Swift,
    Kotlin,
    Scala
};

/**
 * @brief Detect a language from the file extension (case-insensitive)
 * @return Language::Unknown for unrecognised extensions
 */
Language detectLanguage(const std::filesystem::path& path);

/**
 * @brief Canonical lowercase name ("python", "cpp", "unknown", ...)
 */
std::string_view languageToString(Language language);

/**
 * @brief Parse a canonical name or a common alias ("py", "c++", "js")
 */
Language languageFromString(std::string_view name);

/**
 * @brief Extensions (with leading dot) that map to a known language
 */
const std::vector<std::string>& supportedExtensions();

/// True for languages whose blocks are delimited by braces
bool usesBraces(Language language);

} // namespace coderag::detection
