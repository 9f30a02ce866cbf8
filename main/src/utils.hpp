#pragma once

#include "exception.hpp"
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

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

// String helpers
std::string_view trim(std::string_view s);
std::vector<std::string> split_whitespace(std::string_view s);

// Reads a text file line by line with line terminators (\n, \r\n) removed.
// Returns std::nullopt if the file cannot be opened.
std::optional<std::vector<std::string>> read_lines(const fs::path& path);
