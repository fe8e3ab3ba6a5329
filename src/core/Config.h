#pragma once
#include <cstddef>
#include <filesystem>
#include <string>

#include <spdlog/common.h>

#include "maze/pathfinding/Strategy.hpp"

namespace maze::core {

inline constexpr int kSolverConfigSchemaVersion = 1;

// Persisted solver settings (JSON). Command-line flags override these.
//
//   {
//     "version": 1,
//     "search":  { "strategy": "astar", "maxExpansions": 0 },
//     "output":  { "showExplored": false },
//     "logging": { "level": "info", "file": "" }
//   }
struct SolverConfig {
    pf::Strategy strategy = pf::Strategy::Uninformed;
    std::size_t  maxExpansions = 0; // 0 = unlimited
    bool         showExplored = false;
    spdlog::level::level_enum logLevel = spdlog::level::info;
    std::filesystem::path logFile;
};

// Returns false (cfg untouched) if the file is missing, unreadable or not a JSON object.
// Keys with the wrong type are ignored. Throws maze::ConfigError for an unknown
// strategy or log level name.
bool LoadSolverConfig(SolverConfig& cfg, const std::filesystem::path& file);
bool SaveSolverConfig(const SolverConfig& cfg, const std::filesystem::path& file);

} // namespace maze::core
