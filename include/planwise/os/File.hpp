#pragma once

#include <filesystem>
#include <string>

namespace planwise::os {

struct ReadTextResult {
    bool ok = false;
    std::string text{};
    std::string err{};
};

/// Reads a whole file and drops carriage returns.
ReadTextResult read_text_file(const std::filesystem::path& path);

} // namespace planwise::os
