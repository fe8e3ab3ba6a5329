#pragma once
#include <stdexcept>
#include <string>

namespace maze {

// Malformed maze input: bad marker counts, inconsistent wall tables, unreadable files.
class MazeError : public std::runtime_error {
public:
    explicit MazeError(const std::string& what) : std::runtime_error(what) {}
};

// Invalid solver configuration (unknown strategy or log level names, bad config values).
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

} // namespace maze
