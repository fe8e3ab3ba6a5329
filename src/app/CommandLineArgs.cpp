#include "app/CommandLineArgs.h"

#include <cctype>
#include <charconv>
#include <sstream>
#include <system_error>

namespace maze::app {

namespace {

[[nodiscard]] std::string ToLower(std::string_view s)
{
    std::string out;
    out.reserve(s.size());
    for (char c : s)
        out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    return out;
}

[[nodiscard]] bool StartsWith(std::string_view s, std::string_view prefix)
{
    return s.size() >= prefix.size() && s.substr(0, prefix.size()) == prefix;
}

[[nodiscard]] std::optional<std::size_t> ParseCount(std::string_view s)
{
    if (s.empty())
        return std::nullopt;
    std::size_t v = 0;
    const auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
    if (ec != std::errc{} || ptr != s.data() + s.size())
        return std::nullopt;
    return v;
}

} // namespace

CommandLineArgs ParseCommandLineArgsFromArgv(std::span<const std::string_view> argv)
{
    CommandLineArgs out;

    auto addUnknown = [&](std::string_view raw) {
        out.unknown.emplace_back(raw);
    };

    for (std::size_t i = 1; i < argv.size(); ++i)
    {
        const std::string_view raw = argv[i];
        if (raw.empty())
            continue;

        if (!StartsWith(raw, "-"))
        {
            if (!out.mazeFile)
                out.mazeFile = std::string(raw);
            else
                addUnknown(raw);
            continue;
        }

        // Split "--opt=value" so both spellings share one code path below.
        std::string_view name = raw;
        std::optional<std::string_view> inlineValue;
        if (const auto eq = raw.find('='); eq != std::string_view::npos)
        {
            name = raw.substr(0, eq);
            inlineValue = raw.substr(eq + 1);
        }
        const std::string arg = ToLower(name);

        // Flags take no value; "--flag=value" goes to unknown.
        const auto flag = [&](auto apply) {
            if (inlineValue)
                addUnknown(raw);
            else
                apply();
        };

        if (arg == "--help" || arg == "-h" || arg == "-?") { flag([&] { out.showHelp = true; }); continue; }
        if (arg == "--show-explored") { flag([&] { out.showExplored = true; }); continue; }
        if (arg == "--no-show-explored") { flag([&] { out.showExplored = false; }); continue; }

        // Options with values
        const auto takeValue = [&]() -> std::optional<std::string_view> {
            if (inlineValue)
                return inlineValue;
            if (i + 1 >= argv.size())
                return std::nullopt;
            return argv[++i];
        };

        const auto takeString = [&](std::optional<std::string>& dst) {
            const auto v = takeValue();
            if (!v || v->empty()) {
                addUnknown(raw);
                return;
            }
            dst = std::string(*v);
        };

        if (arg == "--strategy" || arg == "-s") { takeString(out.strategy); continue; }
        if (arg == "--config" || arg == "-c") { takeString(out.configFile); continue; }
        if (arg == "--json" || arg == "-o") { takeString(out.jsonOut); continue; }
        if (arg == "--log-level") { takeString(out.logLevel); continue; }
        if (arg == "--log-file") { takeString(out.logFile); continue; }

        if (arg == "--max-expansions")
        {
            const auto v = takeValue();
            const auto parsed = v ? ParseCount(*v) : std::nullopt;
            if (!parsed)
                addUnknown(raw);
            else
                out.maxExpansions = *parsed;
            continue;
        }

        addUnknown(raw);
    }

    return out;
}

CommandLineArgs ParseCommandLineArgs(int argc, char** argv)
{
    std::vector<std::string_view> v;
    v.reserve(static_cast<std::size_t>(argc > 0 ? argc : 0));
    for (int i = 0; i < argc; ++i)
        v.emplace_back(argv[i] ? argv[i] : "");
    return ParseCommandLineArgsFromArgv(v);
}

std::string BuildCommandLineHelpText()
{
    std::ostringstream ss;
    ss << "Usage: maze_solve <maze.txt> [options]\n"
          "\n"
          "Maze files use 'A' for the start, 'B' for the goal, ' ' for open cells;\n"
          "any other character is a wall.\n"
          "\n"
          "Options:\n"
          "  -s, --strategy <bfs|astar>   Search strategy (default: bfs; 'queue' = bfs)\n"
          "  -c, --config <file.json>     Load solver settings; flags below override them\n"
          "  -o, --json <out.json>        Write maze, solution and explored order as JSON\n"
          "      --show-explored          Mark explored cells with '.' in the output\n"
          "      --max-expansions <N>     Stop after N expansions (0 = unlimited)\n"
          "      --log-level <level>      trace, debug, info, warn, error, critical, off\n"
          "      --log-file <path>        Also write the log to <path>\n"
          "  -h, --help                   Show this help\n";
    return ss.str();
}

} // namespace maze::app
