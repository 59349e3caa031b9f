#pragma once

#include <planwise/config/Config.hpp>

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace planwise::config::toml_lite {

/// Flattens `[section] key = value` into "section.key". A missing file is
/// not an error and yields an empty map.
bool parse_file(const std::filesystem::path& path,
                FlatMap& out,
                std::vector<std::string>& warnings,
                std::string& err);

bool parse_text(std::string_view text,
                std::string_view source_name,
                FlatMap& out,
                std::vector<std::string>& warnings,
                std::string& err);

} // namespace planwise::config::toml_lite
