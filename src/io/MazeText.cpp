#include "maze/io/MazeText.hpp"
#include "maze/Errors.hpp"
#include "io/AtomicFile.h"

#include <algorithm>
#include <unordered_set>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

namespace maze::io {

namespace {

// ASCII line boundaries: \n, \r\n, lone \r, \v, \f and the file/group/record separators.
// A boundary at the very end does not start another row.
constexpr std::string_view kLineBreaks = "\n\r\v\f\x1c\x1d\x1e";

std::vector<std::string_view> split_lines(std::string_view text) {
    std::vector<std::string_view> lines;
    while (!text.empty()) {
        const auto brk = text.find_first_of(kLineBreaks);
        lines.push_back(text.substr(0, brk));
        if (brk == std::string_view::npos)
            break;
        const bool crlf = text[brk] == '\r' && brk + 1 < text.size() && text[brk + 1] == '\n';
        text.remove_prefix(brk + (crlf ? 2 : 1));
    }
    return lines;
}

} // namespace

pf::Grid parse_maze(std::string_view text) {
    if (std::count(text.begin(), text.end(), 'A') != 1)
        throw MazeError("maze must have exactly one start point");
    if (std::count(text.begin(), text.end(), 'B') != 1)
        throw MazeError("maze must have exactly one goal");

    const auto lines = split_lines(text);
    const int height = static_cast<int>(lines.size());
    std::size_t widest = 0;
    for (const auto& l : lines)
        widest = std::max(widest, l.size());
    const int width = static_cast<int>(widest);

    std::vector<std::uint8_t> walls(static_cast<std::size_t>(height) * widest, 0);
    pf::Cell start{}, goal{};

    for (int r = 0; r < height; ++r) {
        const auto& line = lines[static_cast<std::size_t>(r)];
        // Columns past the end of a short row stay open.
        for (std::size_t c = 0; c < line.size(); ++c) {
            const char ch = line[c];
            if (ch == 'A')
                start = { r, static_cast<int>(c) };
            else if (ch == 'B')
                goal = { r, static_cast<int>(c) };
            else if (ch != ' ')
                walls[static_cast<std::size_t>(r) * widest + c] = 1;
        }
    }

    return pf::Grid(height, width, std::move(walls), start, goal);
}

pf::Grid load_maze_file(const std::filesystem::path& path) {
    std::string text;
    std::string err;
    if (!read_all(path, text, &err))
        throw MazeError("could not read maze " + path.string() + " (" + err + ")");

    pf::Grid grid = parse_maze(text);
    spdlog::info("Loaded maze {} ({}x{})", path.string(), grid.height(), grid.width());
    return grid;
}

std::string render_text(const pf::Grid& grid, const pf::SearchResult* result, const RenderOptions& opt) {
    std::unordered_set<pf::Cell, pf::CellHash> path;
    if (result && result->solution && opt.show_solution)
        path.insert(result->solution->cells.begin(), result->solution->cells.end());

    std::unordered_set<pf::Cell, pf::CellHash> explored;
    if (result && opt.show_explored)
        explored.insert(result->explored_order.begin(), result->explored_order.end());

    std::string out = "\n";
    for (int r = 0; r < grid.height(); ++r) {
        for (int c = 0; c < grid.width(); ++c) {
            const pf::Cell cell{ r, c };
            if (grid.is_wall(cell))
                out += "\xE2\x96\x88"; // U+2588 FULL BLOCK
            else if (cell == grid.start())
                out += 'A';
            else if (cell == grid.goal())
                out += 'B';
            else if (path.count(cell))
                out += '*';
            else if (explored.count(cell))
                out += '.';
            else
                out += ' ';
        }
        out += '\n';
    }
    out += '\n';
    return out;
}

} // namespace maze::io
