#pragma once
#include "maze/pathfinding/Grid.hpp"
#include "maze/pathfinding/Search.hpp"
#include <filesystem>
#include <nlohmann/json.hpp>

namespace maze::io {

// Cells are encoded as [row, col]; walls as one string per row using '#' and ' '.
[[nodiscard]] nlohmann::json grid_to_json(const pf::Grid& grid);
[[nodiscard]] nlohmann::json result_to_json(const pf::SearchResult& result);

// {"maze": grid_to_json(...), "result": result_to_json(...)}
[[nodiscard]] nlohmann::json to_json(const pf::Grid& grid, const pf::SearchResult& result);

// Pretty-printed. Throws maze::MazeError if the file cannot be written.
void write_json_file(const nlohmann::json& doc, const std::filesystem::path& path);

} // namespace maze::io
