#include "Log.h"
#include "maze/Errors.hpp"

#include <cctype>
#include <string>
#include <system_error>
#include <vector>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace fs = std::filesystem;
static std::shared_ptr<spdlog::logger> g_logger;

void maze::logsys::init(const LogOptions& opt) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());

    std::string fileError;
    if (!opt.file.empty()) {
        std::error_code ec;
        if (opt.file.has_parent_path())
            fs::create_directories(opt.file.parent_path(), ec);
        try {
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(opt.file.string(), true));
        } catch (const spdlog::spdlog_ex& e) {
            fileError = e.what(); // console-only from here on
        }
    }

    g_logger = std::make_shared<spdlog::logger>("maze", sinks.begin(), sinks.end());
    spdlog::set_default_logger(g_logger);
    spdlog::set_level(opt.level);
    spdlog::flush_on(spdlog::level::warn);
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
    if (!fileError.empty())
        spdlog::warn("Could not open log file {}: {}", opt.file.string(), fileError);
    spdlog::debug("Logging started (level={})", spdlog::level::to_string_view(opt.level));
}

std::shared_ptr<spdlog::logger> maze::logsys::get() {
    if (!g_logger)
        init();
    return g_logger;
}

spdlog::level::level_enum maze::logsys::parse_level(std::string_view name) {
    std::string lowered;
    lowered.reserve(name.size());
    for (char c : name)
        lowered.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));

    if (lowered == "trace")    return spdlog::level::trace;
    if (lowered == "debug")    return spdlog::level::debug;
    if (lowered == "info")     return spdlog::level::info;
    if (lowered == "warn" || lowered == "warning") return spdlog::level::warn;
    if (lowered == "error")    return spdlog::level::err;
    if (lowered == "critical") return spdlog::level::critical;
    if (lowered == "off")      return spdlog::level::off;
    throw maze::ConfigError("unknown log level '" + std::string(name) + "'");
}
