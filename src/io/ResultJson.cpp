#include "maze/io/ResultJson.hpp"
#include "maze/Errors.hpp"
#include "io/AtomicFile.h"

#include <string>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

namespace maze::io {

namespace {

nlohmann::json cell_json(const pf::Cell& c) {
    return nlohmann::json::array({ c.row, c.col });
}

nlohmann::json cells_json(const std::vector<pf::Cell>& cells) {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& c : cells)
        arr.push_back(cell_json(c));
    return arr;
}

} // namespace

nlohmann::json grid_to_json(const pf::Grid& grid) {
    nlohmann::json walls = nlohmann::json::array();
    for (int r = 0; r < grid.height(); ++r) {
        std::string row(static_cast<std::size_t>(grid.width()), ' ');
        for (int c = 0; c < grid.width(); ++c) {
            if (grid.is_wall({ r, c }))
                row[static_cast<std::size_t>(c)] = '#';
        }
        walls.push_back(std::move(row));
    }

    return {
        {"height", grid.height()},
        {"width", grid.width()},
        {"start", cell_json(grid.start())},
        {"goal", cell_json(grid.goal())},
        {"walls", std::move(walls)},
    };
}

nlohmann::json result_to_json(const pf::SearchResult& result) {
    nlohmann::json j;
    j["strategy"] = std::string(pf::strategy_name(result.strategy));
    j["status"] = std::string(pf::status_name(result.status));
    j["explored_count"] = result.explored_count;
    j["explored_order"] = cells_json(result.explored_order);

    if (result.solution) {
        nlohmann::json actions = nlohmann::json::array();
        for (const pf::Action a : result.solution->actions)
            actions.push_back(std::string(pf::action_name(a)));
        j["solution"] = {
            {"actions", std::move(actions)},
            {"cells", cells_json(result.solution->cells)},
        };
    } else {
        j["solution"] = nullptr;
    }
    return j;
}

nlohmann::json to_json(const pf::Grid& grid, const pf::SearchResult& result) {
    return {
        {"maze", grid_to_json(grid)},
        {"result", result_to_json(result)},
    };
}

void write_json_file(const nlohmann::json& doc, const std::filesystem::path& path) {
    std::string err;
    if (!write_atomic(path, doc.dump(2) + "\n", &err))
        throw MazeError("could not write " + path.string() + " (" + err + ")");
    spdlog::info("Wrote {}", path.string());
}

} // namespace maze::io
