#include "utils.hpp"

#include "localization.hpp"

#include <unistd.h>

#include <fstream>
#include <iostream>
#include <utility>

namespace {
    // Helper function to reduce code duplication in logging
    void log_internal(std::string_view prefix, std::string_view color, std::string_view msg, std::ostream& stream) {
        bool is_tty = false;
        if (&stream == &std::cout) {
            is_tty = isatty(STDOUT_FILENO);
        } else if (&stream == &std::cerr) {
            is_tty = isatty(STDERR_FILENO);
        }

        if (is_tty) {
            stream << color << prefix << COLOR_WHITE << msg << COLOR_RESET << std::endl;
        } else {
            stream << prefix << msg << std::endl;
        }
    }
}

void log_info(std::string_view msg) {
    log_internal("==> ", COLOR_GREEN, msg, std::cout);
}

void log_warning(std::string_view msg) {
    log_internal(get_string("warning.prefix") + " ", COLOR_YELLOW, msg, std::cerr);
}

void log_error(std::string_view msg) {
    log_internal(get_string("error.prefix") + " ", COLOR_RED, msg, std::cerr);
}

std::string_view trim(std::string_view s) {
    constexpr std::string_view ws = " \t\r\n";
    const auto first = s.find_first_not_of(ws);
    if (first == std::string_view::npos) return {};
    const auto last = s.find_last_not_of(ws);
    return s.substr(first, last - first + 1);
}

std::vector<std::string> split_whitespace(std::string_view s) {
    std::vector<std::string> out;
    size_t pos = 0;
    while (pos < s.size()) {
        const auto start = s.find_first_not_of(" \t", pos);
        if (start == std::string_view::npos) break;
        auto end = s.find_first_of(" \t", start);
        if (end == std::string_view::npos) end = s.size();
        out.emplace_back(s.substr(start, end - start));
        pos = end;
    }
    return out;
}

std::optional<std::vector<std::string>> read_lines(const fs::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return std::nullopt;
    }
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(file, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        lines.push_back(std::move(line));
    }
    return lines;
}
