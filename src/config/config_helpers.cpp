#include <coderag/config/config_helpers.h>

namespace coderag::config {

std::filesystem::path get_config_dir() {
    if (auto xdg = env_value("XDG_CONFIG_HOME")) {
        return std::filesystem::path(*xdg) / "coderag";
    }
    if (auto home = env_value("HOME")) {
        return std::filesystem::path(*home) / ".config" / "coderag";
    }
    return std::filesystem::current_path() / ".coderag";
}

std::filesystem::path get_data_dir() {
    if (auto xdg = env_value("XDG_DATA_HOME")) {
        return std::filesystem::path(*xdg) / "coderag";
    }
    if (auto home = env_value("HOME")) {
        return std::filesystem::path(*home) / ".local" / "share" / "coderag";
    }
    return std::filesystem::current_path() / "coderag_data";
}

std::filesystem::path get_config_path(const std::string& override_path) {
    if (!override_path.empty()) {
        return expand_tilde(override_path);
    }
    if (auto env = env_value("CODERAG_CONFIG")) {
        return expand_tilde(*env);
    }
    return get_config_dir() / "config.json";
}

std::filesystem::path resolve_data_dir() {
    if (auto env = env_value("CODERAG_DATA_DIR")) {
        return expand_tilde(*env);
    }
    return get_data_dir();
}

} // namespace coderag::config
