#pragma once

#include "types.hpp"
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace monodither::core {

namespace fs = std::filesystem;

// Time utilities
std::string get_iso_timestamp();
std::string get_run_id();

// File utilities
std::vector<uint8_t> read_bytes(const fs::path& path);
void write_bytes(const fs::path& path, const std::vector<uint8_t>& data);

// Math utilities
bool is_power_of_two(int v);

// Parses an unsigned decimal (optional leading '+') that fits in an int.
// nullopt on signs, whitespace, trailing text or overflow.
std::optional<int> parse_unsigned_int(const std::string& s);

// String utilities
std::string to_lower(const std::string& s);
std::string join(const std::vector<std::string>& parts, const std::string& delimiter);

} // namespace monodither::core
