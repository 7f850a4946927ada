#pragma once

#include "exception.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

namespace fs = std::filesystem;

// Color codes
inline constexpr std::string_view COLOR_GREEN = "\033[1;32m";
inline constexpr std::string_view COLOR_WHITE = "\033[1;37m";
inline constexpr std::string_view COLOR_YELLOW = "\033[1;33m";
inline constexpr std::string_view COLOR_RED = "\033[1;31m";
inline constexpr std::string_view COLOR_RESET = "\033[0m";

// Log functions
void log_info(std::string_view msg);
void log_warning(std::string_view msg);
void log_error(std::string_view msg);
void log_progress(const std::string& msg, double percentage, int bar_width = 40);
void end_progress();

// Suppresses info lines and progress bars
void set_quiet_mode(bool enable);
bool get_quiet_mode();

// Filesystem utilities
void ensure_dir_exists(const fs::path& path);

// Joins a base URL and a relative path with exactly one '/' between them.
std::string join_url(std::string_view base, std::string_view path);

// Renders a byte count as "512 B", "1.5 KiB", "3.2 MiB", ...
std::string format_bytes(std::uint64_t bytes);
