#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace planwise::config {

using Value = std::variant<std::string, int64_t, bool, std::vector<std::string>>;
using FlatMap = std::map<std::string, Value>;

inline constexpr const char* kProjectFileName = "planwise.toml";

struct Paths {
    std::filesystem::path global_config{};
    std::filesystem::path project_config{};
    std::optional<std::filesystem::path> project_root{};
};

struct LoadedConfig {
    Paths paths{};
    FlatMap global_values{};
    FlatMap project_values{};
    FlatMap effective_values{};
    std::vector<std::string> warnings{};
};

inline constexpr int64_t kMaxPlanYears = 12;
inline constexpr int64_t kMaxSlotsPerSemester = 16;

struct EffectiveSettings {
    std::string catalog_path = "data/course_db.json";

    int64_t plan_years = 4;
    int64_t plan_slots_per_semester = 5;

    std::string diag_format = "text";
    std::string diag_color = "auto";
    bool diag_warnings = true;
};

std::optional<std::filesystem::path> find_project_root(std::filesystem::path start);
Paths resolve_paths(const std::optional<std::filesystem::path>& anchor);

LoadedConfig load(const std::optional<std::filesystem::path>& anchor);
LoadedConfig load_files(const Paths& paths);
EffectiveSettings materialize(const LoadedConfig& cfg, std::vector<std::string>* warnings = nullptr);

bool is_known_key(std::string_view key);

} // namespace planwise::config
