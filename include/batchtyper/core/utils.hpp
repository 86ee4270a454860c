#pragma once

#include "types.hpp"

#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

namespace batchtyper::core {

namespace fs = std::filesystem;

// Time utilities
std::string get_iso_timestamp();
std::string format_iso_timestamp(Clock::time_point tp);
std::string get_run_id();

// File utilities
std::string read_text(const fs::path& path);
void write_text(const fs::path& path, const std::string& text);
bool is_nonempty_directory(const fs::path& path);

// Hash utilities
std::string sha256_file(const fs::path& path);

// String utilities
std::string to_lower(const std::string& s);
std::vector<std::string> split(const std::string& str, char delimiter);
std::string join(const std::vector<std::string>& parts, const std::string& delimiter);
std::string replace_all(std::string str, const std::string& from, const std::string& to);
std::string shell_quote(const std::string& s);

// Glob pattern matching on a single path component (*, ?, [...]).
bool has_wildcard(const std::string& pattern);
bool glob_match(const std::string& pattern, const std::string& str);
std::vector<fs::path> glob(const fs::path& dir, const std::string& pattern);

} // namespace batchtyper::core
