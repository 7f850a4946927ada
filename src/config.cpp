#include "config.hpp"
#include "exception.hpp"
#include "localization.hpp"

#include <fstream>
#include <istream>

namespace fs = std::filesystem;

fs::path CONFIG_DIR = HPIFETCH_CONF_DIR;
fs::path MIRROR_CONF = fs::path(HPIFETCH_CONF_DIR) / "mirrors.conf";
fs::path L10N_DIR = HPIFETCH_L10N_DIR;

void set_config_dir(const std::string& config_dir) {
    CONFIG_DIR = fs::path(config_dir).lexically_normal();
    if (CONFIG_DIR.empty()) CONFIG_DIR = HPIFETCH_CONF_DIR;
    MIRROR_CONF = CONFIG_DIR / "mirrors.conf";
}

namespace {

std::string trim_mirror_url(const std::string& url) {
    size_t first = url.find_first_not_of(" \t\r");
    if (first == std::string::npos) return {};
    size_t last = url.find_last_not_of(" \t\r/");
    if (last == std::string::npos || last < first) return {};
    return url.substr(first, last - first + 1);
}

} // anonymous namespace

std::vector<std::string> parse_mirror_list(std::istream& in) {
    std::vector<std::string> mirrors;
    std::string line;
    while (std::getline(in, line)) {
        size_t first = line.find_first_not_of(" \t\r");
        if (first == std::string::npos || line[first] == '#') continue;
        std::string url = trim_mirror_url(line);
        if (!url.empty()) mirrors.push_back(std::move(url));
    }
    return mirrors;
}

std::vector<std::string> normalize_mirror_urls(const std::vector<std::string>& urls) {
    std::vector<std::string> mirrors;
    for (const auto& url : urls) {
        std::string trimmed = trim_mirror_url(url);
        if (trimmed.empty()) {
            throw HpiError(string_format("error.invalid_mirror_url", url));
        }
        mirrors.push_back(std::move(trimmed));
    }
    return mirrors;
}

std::vector<std::string> get_mirror_urls() {
    if (!fs::exists(MIRROR_CONF)) {
        return DEFAULT_MIRRORS;
    }
    std::ifstream mirror_file(MIRROR_CONF);
    if (!mirror_file.is_open()) {
        throw HpiError(string_format("error.open_file_failed", MIRROR_CONF.string()));
    }
    auto mirrors = parse_mirror_list(mirror_file);
    if (mirrors.empty()) {
        throw HpiError(string_format("error.invalid_mirror_config", MIRROR_CONF.string()));
    }
    return mirrors;
}
