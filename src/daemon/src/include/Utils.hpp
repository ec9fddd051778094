/*
 * GPU Fan Control — Utility helpers (header)
 * (c) 2025 GpuFanControl contributors
 */
#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <filesystem>
#include <system_error>

#include <nlohmann/json.hpp>

namespace gfc { namespace util {

/* ----------------------------------------------------------------------------
 * Environment helpers
 * ----------------------------------------------------------------------------*/

std::optional<std::string> getenv_str(const char* key);

/* ----------------------------------------------------------------------------
 * String helpers
 * ----------------------------------------------------------------------------*/

std::string trim(std::string_view sv);
std::vector<std::string> split(std::string_view sv, char delim);
std::string join(const std::vector<std::string>& parts, std::string_view sep);

/* Strict base-10 int parse of the whole (trimmed) string. */
std::optional<int> parse_int(std::string_view sv);

/* ----------------------------------------------------------------------------
 * Filesystem helpers
 * ----------------------------------------------------------------------------*/

/** Ensure parent directory of path exists (no-op if already exists). */
void ensure_parent_dirs(const std::filesystem::path& p, std::error_code* ec = nullptr);

/** Read and parse a JSON file; throws std::runtime_error on IO or parse errors. */
nlohmann::json read_json_file(const std::filesystem::path& p);

/* Expand a user/home/environment path:
 *  - Leading '~' -> $HOME
 *  - ${VAR} or $VAR -> environment variable
 * Returns the expanded string (no filesystem checks). */
std::string expandUserPath(const std::string& path);

}} // namespace gfc::util
