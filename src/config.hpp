#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <iosfwd>
#include <string>
#include <string_view>
#include <vector>

// Global paths (defaults come from the build, set_config_dir rebases them)
extern std::filesystem::path CONFIG_DIR;
extern std::filesystem::path MIRROR_CONF;
extern std::filesystem::path L10N_DIR;

inline constexpr std::string_view DEFAULT_CATALOG_URL = "https://updates.jenkins.io/update-center.json";
inline constexpr std::string_view DEFAULT_OUTPUT_DIR = "plugins";
inline constexpr std::string_view USER_AGENT = "hpifetch/" HPIFETCH_VERSION;

inline const std::vector<std::string> DEFAULT_MIRRORS = {
    "https://updates.jenkins.io/download/plugins",
    "https://get.jenkins.io/plugins",
    "https://mirrors.tuna.tsinghua.edu.cn/jenkins/plugins",
    "https://archives.jenkins.io/plugins",
};

// Artifact throughput below this rate for a full check window fails the mirror over.
inline constexpr std::uint64_t MIN_BYTES_PER_SECOND = 1024;
inline constexpr std::chrono::seconds SPEED_CHECK_INTERVAL{1};

// Transport hardening applied to every request.
inline constexpr long CONNECT_TIMEOUT_SECONDS = 30;
inline constexpr long STALL_TIMEOUT_SECONDS = 60;
inline constexpr long MAX_REDIRECTS = 5;

void set_config_dir(const std::string& config_dir);

// Mirrors from MIRROR_CONF, or DEFAULT_MIRRORS when the file does not exist.
std::vector<std::string> get_mirror_urls();

// One base URL per line, '#' comments and blank lines skipped, trailing '/' removed.
std::vector<std::string> parse_mirror_list(std::istream& in);

// Mirrors given on the command line: whitespace and trailing '/' removed.
// Throws HpiError for an entry that is blank.
std::vector<std::string> normalize_mirror_urls(const std::vector<std::string>& urls);
