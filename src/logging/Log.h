#pragma once
#include <filesystem>
#include <memory>
#include <string_view>
#include <spdlog/spdlog.h>

namespace maze::logsys {

struct LogOptions {
    spdlog::level::level_enum level = spdlog::level::info;
    std::filesystem::path file;  // empty = console only
};

// Installs the "maze" logger (stderr, plus `file` if set) as the spdlog default.
// Safe to call more than once; the previous logger is replaced.
void init(const LogOptions& opt = {});

std::shared_ptr<spdlog::logger> get();  // "maze"

// trace|debug|info|warn|error|critical|off (case-insensitive). Throws maze::ConfigError.
[[nodiscard]] spdlog::level::level_enum parse_level(std::string_view name);

} // namespace maze::logsys
