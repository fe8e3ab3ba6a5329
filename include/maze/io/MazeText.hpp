#pragma once
#include "maze/pathfinding/Grid.hpp"
#include "maze/pathfinding/Search.hpp"
#include <filesystem>
#include <string>
#include <string_view>

namespace maze::io {

// Text maze: 'A' start, 'B' goal, ' ' open, anything else a wall.
// Rows end at \n, \r\n, a lone \r, \v or \f. Rows shorter than the longest row are
// padded with open cells.
// Throws maze::MazeError unless there is exactly one 'A' and one 'B'.
[[nodiscard]] pf::Grid parse_maze(std::string_view text);

// Throws maze::MazeError if the file cannot be read or is malformed.
[[nodiscard]] pf::Grid load_maze_file(const std::filesystem::path& path);

struct RenderOptions {
    bool show_solution = true;
    bool show_explored = false;
};

// Walls are drawn as U+2588, the solution as '*', explored cells as '.'.
// result may be null to draw the bare maze.
[[nodiscard]] std::string render_text(const pf::Grid& grid,
                                      const pf::SearchResult* result = nullptr,
                                      const RenderOptions& opt = {});

} // namespace maze::io
