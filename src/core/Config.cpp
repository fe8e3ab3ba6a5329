#include "Config.h"
#include "io/AtomicFile.h"
#include "logging/Log.h"

#include <cstdint>
#include <string>
#include <system_error>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace maze::core {

bool LoadSolverConfig(SolverConfig& cfg, const std::filesystem::path& file)
{
    std::error_code ec;
    if (!std::filesystem::exists(file, ec))
    {
        spdlog::debug("LoadSolverConfig: {} not found, using defaults", file.string());
        return false;
    }

    std::string text;
    std::string err;
    if (!io::read_all(file, text, &err))
    {
        spdlog::warn("LoadSolverConfig: failed to read {} ({})", file.string(), err);
        return false;
    }

    // Allow // comments and avoid exceptions on malformed input.
    nlohmann::json j = nlohmann::json::parse(text, nullptr, false, /*ignore_comments*/ true);
    if (j.is_discarded() || !j.is_object())
    {
        spdlog::warn("LoadSolverConfig: {} is not a JSON object", file.string());
        return false;
    }

    if (const auto v = j.find("version"); v != j.end() && v->is_number_integer()
        && v->get<int>() > kSolverConfigSchemaVersion)
    {
        spdlog::warn("LoadSolverConfig: {} has newer schema version {}", file.string(), v->get<int>());
    }

    SolverConfig tmp = cfg;

    if (const auto it = j.find("search"); it != j.end() && it->is_object())
    {
        if (auto s = it->find("strategy"); s != it->end() && s->is_string())
            tmp.strategy = pf::parse_strategy(s->get<std::string>());
        if (auto m = it->find("maxExpansions"); m != it->end() && m->is_number_integer())
        {
            const auto n = m->get<std::int64_t>();
            tmp.maxExpansions = n > 0 ? static_cast<std::size_t>(n) : 0u;
        }
    }

    if (const auto it = j.find("output"); it != j.end() && it->is_object())
    {
        if (auto e = it->find("showExplored"); e != it->end() && e->is_boolean())
            tmp.showExplored = e->get<bool>();
    }

    if (const auto it = j.find("logging"); it != j.end() && it->is_object())
    {
        if (auto l = it->find("level"); l != it->end() && l->is_string())
            tmp.logLevel = logsys::parse_level(l->get<std::string>());
        if (auto f = it->find("file"); f != it->end() && f->is_string())
            tmp.logFile = f->get<std::string>();
    }

    cfg = tmp;
    return true;
}

bool SaveSolverConfig(const SolverConfig& cfg, const std::filesystem::path& file)
{
    nlohmann::json j;
    j["version"] = kSolverConfigSchemaVersion;
    j["search"] = {
        {"strategy", std::string(pf::strategy_name(cfg.strategy))},
        {"maxExpansions", cfg.maxExpansions},
    };
    j["output"] = {
        {"showExplored", cfg.showExplored},
    };
    j["logging"] = {
        {"level", std::string(spdlog::level::to_string_view(cfg.logLevel).data(),
                              spdlog::level::to_string_view(cfg.logLevel).size())},
        {"file", cfg.logFile.string()},
    };

    std::string err;
    if (!io::write_atomic(file, j.dump(2) + "\n", &err))
    {
        spdlog::warn("SaveSolverConfig: failed to write {} ({})", file.string(), err);
        return false;
    }
    return true;
}

} // namespace maze::core
