// C++23 utility helpers for reading /proc with optional root remap
#pragma once
#include <string>
#include <vector>
#include <optional>

namespace procsight::util {

// Map an absolute /proc path to an alternate root if PROCSIGHT_PROC_ROOT is set
auto map_proc_path(const std::string& abs) -> std::string;

// Read entire file as string. Returns std::nullopt on error.
auto read_file_string(const std::string& abs) -> std::optional<std::string>;

// List directory entries (names only). Returns empty vector on error.
auto list_dir(const std::string& abs) -> std::vector<std::string>;

// Number of logical CPUs listed in /proc/stat (at least 1).
auto cpu_count() -> unsigned;

} // namespace procsight::util
