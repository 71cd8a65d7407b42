#include <coderag/detection/language_detector.h>

#include <algorithm>
#include <cctype>
#include <unordered_map>

namespace coderag::detection {

namespace {

std::string toLower(std::string_view in) {
    std::string out(in);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

const std::unordered_map<std::string, Language>& extensionMap() {
    static const std::unordered_map<std::string, Language> map = {
        {".py", Language::Python},      {".js", Language::JavaScript},
        {".jsx", Language::JavaScript}, {".mjs", Language::JavaScript},
        {".ts", Language::TypeScript},  {".tsx", Language::TypeScript},
        {".java", Language::Java},      {".cpp", Language::Cpp},
        {".cc", Language::Cpp},         {".cxx", Language::Cpp},
        {".hpp", Language::Cpp},        {".hh", Language::Cpp},
        {".c", Language::C},            {".h", Language::C},
        {".cs", Language::CSharp},      {".go", Language::Go},
        {".rs", Language::Rust},        {".php", Language::Php},
        {".rb", Language::Ruby},        {".swift", Language::Swift},
        {".kt", Language::Kotlin},      {".kts", Language::Kotlin},
        {".scala", Language::Scala}};
    return map;
}

} // namespace

Language detectLanguage(const std::filesystem::path& path) {
    auto ext = toLower(path.extension().string());
    const auto& map = extensionMap();
    auto it = map.find(ext);
    return it == map.end() ? Language::Unknown : it->second;
}

std::string_view languageToString(Language language) {
    switch (language) {
        case Language::Python:
            return "python";
        case Language::JavaScript:
            return "javascript";
        case Language::TypeScript:
            return "typescript";
        case Language::Java:
            return "java";
        case Language::Cpp:
            return "cpp";
        case Language::C:
            return "c";
        case Language::CSharp:
            return "csharp";
        case Language::Go:
            return "go";
        case Language::Rust:
            return "rust";
        case Language::Php:
            return "php";
        case Language::Ruby:
            return "ruby";
        case Language::Swift:
            return "swift";
        case Language::Kotlin:
            return "kotlin";
        case Language::Scala:
            return "scala";
        case Language::Unknown:
            break;
    }
    return "unknown";
}

Language languageFromString(std::string_view name) {
    static const std::unordered_map<std::string, Language> names = {
        {"python", Language::Python},     {"py", Language::Python},
        {"javascript", Language::JavaScript}, {"js", Language::JavaScript},
        {"typescript", Language::TypeScript}, {"ts", Language::TypeScript},
        {"java", Language::Java},         {"cpp", Language::Cpp},
        {"c++", Language::Cpp},           {"cxx", Language::Cpp},
        {"c", Language::C},               {"csharp", Language::CSharp},
        {"c#", Language::CSharp},         {"cs", Language::CSharp},
        {"go", Language::Go},             {"golang", Language::Go},
        {"rust", Language::Rust},         {"rs", Language::Rust},
        {"php", Language::Php},           {"ruby", Language::Ruby},
        {"rb", Language::Ruby},           {"swift", Language::Swift},
        {"kotlin", Language::Kotlin},     {"kt", Language::Kotlin},
        {"scala", Language::Scala}};
    auto it = names.find(toLower(name));
    return it == names.end() ? Language::Unknown : it->second;
}

const std::vector<std::string>& supportedExtensions() {
    static const std::vector<std::string> exts = [] {
        std::vector<std::string> out;
        for (const auto& [ext, _] : extensionMap()) {
            out.push_back(ext);
        }
        std::sort(out.begin(), out.end());
        return out;
    }();
    return exts;
}

bool usesBraces(Language language) {
    switch (language) {
        case Language::Python:
        case Language::Ruby:
        case Language::Unknown:
            return false;
        default:
            return true;
    }
}

} // namespace coderag::detection
