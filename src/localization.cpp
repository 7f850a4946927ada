#include "localization.hpp"
#include "config.hpp"
#include "utils.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <unordered_map>
#include <limits.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace {
    std::unordered_map<std::string, std::string> translations;
    std::unordered_map<std::string, std::string> missing_key_placeholders;

    fs::path get_executable_dir() {
        char result[PATH_MAX];
        ssize_t count = readlink("/proc/self/exe", result, PATH_MAX - 1);
        if (count != -1) {
            result[count] = '\0';
            return fs::path(result).parent_path();
        }
        return fs::current_path();
    }

    bool load_strings(const std::string& lang, const fs::path& base_dir) {
        std::ifstream file(base_dir / (lang + ".txt"));
        if (!file.is_open()) {
            if (lang != "en") {
                return load_strings("en", base_dir);
            }
            return false;
        }

        std::string line;
        while (std::getline(file, line)) {
            if (line.empty() || line[0] == '#') continue;
            if (line.back() == '\r') line.pop_back();
            size_t pos = line.find('=');
            if (pos != std::string::npos) {
                translations[line.substr(0, pos)] = line.substr(pos + 1);
            }
        }
        return true;
    }
}

void init_localization() {
    const char* lang_env = getenv("LANG");
    std::string lang = "en";
    if (lang_env && std::string(lang_env).find("zh") == 0) {
        lang = "zh";
    }

    translations.clear();
    fs::path relative_l10n_dir = get_executable_dir() / ".." / "l10n";
    if (fs::is_directory(relative_l10n_dir) && load_strings(lang, relative_l10n_dir)) {
        return;
    }
    if (!load_strings(lang, L10N_DIR)) {
        log_warning("Could not open localization files in " + L10N_DIR.string() + ", messages will show their keys.");
    }
}

const std::string& get_string(const std::string& key) {
    auto it = translations.find(key);
    if (it != translations.end()) {
        return it->second;
    }
    auto missing_it = missing_key_placeholders.find(key);
    if (missing_it == missing_key_placeholders.end()) {
        missing_it = missing_key_placeholders.emplace(key, "[MISSING_STRING: " + key + "]").first;
    }
    return missing_it->second;
}
