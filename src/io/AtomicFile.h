// src/io/AtomicFile.h
//
// Whole-file reads and replace-on-success writes.
//
// write_atomic writes to a sibling "<final>.tmp", flushes it, then renames it over the
// destination, so readers never observe a half-written file.

#pragma once

#include <filesystem>
#include <string>
#include <string_view>

namespace maze::io {

namespace fs = std::filesystem;

/// Atomically write the full contents of `bytes` to `final_path`, creating parent
/// directories as needed.
///
/// @return true on success; false on error (with `err` populated if provided).
[[nodiscard]] bool write_atomic(const fs::path& final_path,
                                std::string_view bytes,
                                std::string* err = nullptr);

/// Read the entire file at `path` into `out`.
///
/// @return true on success; false on error (with `err` populated if provided).
[[nodiscard]] bool read_all(const fs::path& path,
                            std::string& out,
                            std::string* err = nullptr);

} // namespace maze::io
