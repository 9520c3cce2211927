// Helpers for reading /proc and /sys with optional root remap
#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace rcpu::util {

// Map an absolute /proc path to an alternate root if RCPU_PROC_ROOT is set
auto map_proc_path(const std::string& abs) -> std::string;

// Map an absolute /sys path to an alternate root if RCPU_SYS_ROOT is set
auto map_sys_path(const std::string& abs) -> std::string;

// Read entire file as string (either tree). Returns std::nullopt on error.
auto read_file_string(const std::string& abs) -> std::optional<std::string>;

// Read the first line of a file and parse it as a signed integer.
auto read_file_int(const std::string& abs) -> std::optional<int64_t>;

// List directory entries (names only). Returns empty vector on error.
auto list_dir(const std::string& abs) -> std::vector<std::string>;

} // namespace rcpu::util
