#include <schemadex/config/config_helpers.h>

#include <fstream>

namespace schemadex::config {

namespace {
constexpr const char* kAppDirName = "schemadex";

// $<xdgVar>/schemadex, else $HOME/<fallback>/schemadex, else ./.schemadex
std::filesystem::path xdg_dir(const char* xdgVar, const char* homeFallback) {
    if (auto xdg = env_value(xdgVar)) {
        return std::filesystem::path(*xdg) / kAppDirName;
    }
    if (auto home = env_value("HOME")) {
        return std::filesystem::path(*home) / homeFallback / kAppDirName;
    }
    return std::filesystem::current_path() / ".schemadex";
}
} // namespace

std::string parse_config_value(const std::filesystem::path& config_path, const std::string& section,
                               const std::string& key) {
    std::ifstream file(config_path);
    if (!file) {
        return "";
    }

    std::string line;
    std::string currentSection;
    bool in_target_section = section.empty();

    while (std::getline(file, line)) {
        trim(line);

        if (line.empty() || line[0] == '#') {
            continue;
        }

        if (line[0] == '[') {
            size_t end = line.find(']');
            if (end != std::string::npos) {
                currentSection = line.substr(1, end - 1);
                trim(currentSection);
                in_target_section = (section.empty() || currentSection == section);
            }
            continue;
        }

        size_t eq = line.find('=');
        if (eq == std::string::npos) {
            continue;
        }

        std::string k = line.substr(0, eq);
        std::string v = line.substr(eq + 1);
        trim(k);
        trim(v);

        // Dotted form "section.key" is accepted anywhere
        const bool matches = (in_target_section && k == key) ||
                             (!section.empty() && k == section + "." + key);
        if (!matches) {
            continue;
        }

        // Inline comments end the value unless the '#' sits inside quotes
        if (!v.empty() && (v.front() == '"' || v.front() == '\'')) {
            size_t close = v.find(v.front(), 1);
            if (close != std::string::npos) {
                v = v.substr(0, close + 1);
            }
        } else if (size_t comment = v.find('#'); comment != std::string::npos) {
            v = v.substr(0, comment);
            trim(v);
        }
        return unquote(v);
    }

    return "";
}

std::filesystem::path get_config_path(const std::string& override_path) {
    if (!override_path.empty()) {
        return expand_tilde(override_path);
    }
    if (auto env = env_value("SCHEMADEX_CONFIG")) {
        return expand_tilde(*env);
    }
    return get_config_dir() / "config.toml";
}

std::filesystem::path get_config_dir() {
    return xdg_dir("XDG_CONFIG_HOME", ".config");
}

std::filesystem::path get_cache_dir() {
    if (auto env = env_value("SCHEMADEX_CACHE_DIR")) {
        return expand_tilde(*env);
    }
    return xdg_dir("XDG_CACHE_HOME", ".cache");
}

} // namespace schemadex::config
