#pragma once

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace planwise::cli {

enum class Mode : uint8_t {
    kUsage,
    kVersion,
    kCommand,
};

enum class Command : uint8_t {
    kNone,
    kCheck,
    kShow,
    kResolve,
};

struct PlaceArg {
    std::string semester_id{};
    std::string code{};
};

struct Options {
    Mode mode = Mode::kUsage;
    Command command = Command::kNone;

    std::optional<std::string> catalog_path{};
    std::optional<std::string> format{};
    std::optional<std::string> color{};
    bool quiet_warnings = false;

    // check
    std::vector<PlaceArg> placements{};
    // show / resolve
    std::string target{};

    bool ok = true;
    std::string error{};
};

void print_usage(std::ostream& os);
Options parse_options(int argc, char** argv);

} // namespace planwise::cli
