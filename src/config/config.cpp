#include <planwise/config/Config.hpp>

#include <planwise/config/TomlLite.hpp>

#include <algorithm>
#include <array>
#include <cctype>
#include <cstdlib>
#include <initializer_list>

namespace planwise::config {

namespace {

enum class ValueKind : uint8_t {
    kString,
    kInt,
    kBool,
};

struct KeySpec {
    std::string_view key;
    ValueKind kind;
};

constexpr std::array<KeySpec, 6> kKeys{{
    {"catalog.path", ValueKind::kString},
    {"plan.years", ValueKind::kInt},
    {"plan.slots_per_semester", ValueKind::kInt},
    {"diag.format", ValueKind::kString},
    {"diag.color", ValueKind::kString},
    {"diag.warnings", ValueKind::kBool},
}};

const KeySpec* find_spec(std::string_view key) {
    for (const auto& spec : kKeys) {
        if (spec.key == key) return &spec;
    }
    return nullptr;
}

const char* kind_name(ValueKind k) {
    switch (k) {
        case ValueKind::kString: return "string";
        case ValueKind::kInt: return "int";
        case ValueKind::kBool: return "bool";
    }
    return "value";
}

std::string env_or_empty(const char* name) {
    const char* p = std::getenv(name);
    return p == nullptr ? std::string{} : std::string(p);
}

std::filesystem::path global_config_path() {
    const std::string xdg = env_or_empty("XDG_CONFIG_HOME");
    if (!xdg.empty()) return std::filesystem::path(xdg) / "planwise" / "config.toml";

    std::string home = env_or_empty("HOME");
#if defined(_WIN32)
    if (home.empty()) home = env_or_empty("USERPROFILE");
#endif
    const std::filesystem::path base = home.empty() ? std::filesystem::current_path() : std::filesystem::path(home);
    return base / ".config" / "planwise" / "config.toml";
}

void read_layer(const std::filesystem::path& path,
                std::string_view label,
                FlatMap& values,
                std::vector<std::string>& warnings) {
    std::string err{};
    if (!toml_lite::parse_file(path, values, warnings, err)) {
        warnings.push_back("failed to load " + std::string(label) + " config: " + err);
        values.clear();
        return;
    }

    for (auto it = values.begin(); it != values.end();) {
        if (is_known_key(it->first)) {
            ++it;
            continue;
        }
        warnings.push_back(path.string() + ": unknown key '" + it->first + "' ignored");
        it = values.erase(it);
    }
}

template <typename T>
void take(const FlatMap& values, std::string_view key, T& dst, std::vector<std::string>* warnings) {
    const auto it = values.find(std::string(key));
    if (it == values.end()) return;
    if (const auto* p = std::get_if<T>(&it->second)) {
        dst = *p;
        return;
    }
    if (warnings != nullptr) {
        warnings->push_back("config key '" + std::string(key) + "' has wrong type (expected " +
                            kind_name(find_spec(key)->kind) + ")");
    }
}

std::string pick(std::string value, std::initializer_list<std::string_view> allowed, std::string_view fallback) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    for (const auto a : allowed) {
        if (value == a) return value;
    }
    return std::string(fallback);
}

// Out-of-range counts fall back to the default below 1 and are capped above `max`.
void bound(std::string_view key, int64_t& value, int64_t fallback, int64_t max, std::vector<std::string>* warnings) {
    if (value < 1) {
        value = fallback;
    } else if (value > max) {
        if (warnings != nullptr) {
            warnings->push_back("config key '" + std::string(key) + "' is " + std::to_string(value) +
                                ", capped at " + std::to_string(max));
        }
        value = max;
    }
}

} // namespace

bool is_known_key(std::string_view key) {
    return find_spec(key) != nullptr;
}

std::optional<std::filesystem::path> find_project_root(std::filesystem::path start) {
    std::error_code ec{};
    if (start.empty()) start = std::filesystem::current_path(ec);
    if (ec || !std::filesystem::exists(start, ec)) return std::nullopt;
    if (!std::filesystem::is_directory(start, ec)) start = start.parent_path();

    // Stop at the first directory holding planwise.toml or a checkout root.
    std::filesystem::path cur = start;
    while (!cur.empty()) {
        if (std::filesystem::exists(cur / kProjectFileName, ec) || std::filesystem::exists(cur / ".git", ec)) {
            return cur;
        }
        if (cur == cur.root_path() || cur.parent_path() == cur) break;
        cur = cur.parent_path();
    }
    return std::nullopt;
}

Paths resolve_paths(const std::optional<std::filesystem::path>& anchor) {
    std::filesystem::path start = anchor.value_or(std::filesystem::path{});
    if (start.empty()) {
        std::error_code ec{};
        start = std::filesystem::current_path(ec);
        if (ec) start = ".";
    }

    Paths out{};
    out.global_config = global_config_path();
    out.project_root = find_project_root(start);
    if (out.project_root) out.project_config = *out.project_root / kProjectFileName;
    return out;
}

LoadedConfig load_files(const Paths& paths) {
    LoadedConfig out{};
    out.paths = paths;

    read_layer(paths.global_config, "global", out.global_values, out.warnings);
    if (!paths.project_config.empty()) {
        read_layer(paths.project_config, "project", out.project_values, out.warnings);
    }

    // Project values win over global ones key by key.
    out.effective_values = out.global_values;
    for (const auto& [k, v] : out.project_values) out.effective_values[k] = v;
    return out;
}

LoadedConfig load(const std::optional<std::filesystem::path>& anchor) {
    return load_files(resolve_paths(anchor));
}

EffectiveSettings materialize(const LoadedConfig& cfg, std::vector<std::string>* warnings) {
    EffectiveSettings s{};
    const FlatMap& v = cfg.effective_values;

    take(v, "catalog.path", s.catalog_path, warnings);
    take(v, "plan.years", s.plan_years, warnings);
    take(v, "plan.slots_per_semester", s.plan_slots_per_semester, warnings);
    take(v, "diag.format", s.diag_format, warnings);
    take(v, "diag.color", s.diag_color, warnings);
    take(v, "diag.warnings", s.diag_warnings, warnings);

    // A relative catalog path from planwise.toml is relative to the project root.
    if (cfg.project_values.contains("catalog.path") && cfg.paths.project_root) {
        const std::filesystem::path p(s.catalog_path);
        if (p.is_relative()) s.catalog_path = (*cfg.paths.project_root / p).string();
    }

    if (auto env = env_or_empty("PLANWISE_CATALOG"); !env.empty()) s.catalog_path = std::move(env);
    if (auto env = env_or_empty("PLANWISE_DIAG_FORMAT"); !env.empty()) s.diag_format = std::move(env);

    s.diag_format = pick(std::move(s.diag_format), {"text", "json"}, "text");
    s.diag_color = pick(std::move(s.diag_color), {"auto", "always", "never"}, "auto");

    bound("plan.years", s.plan_years, 4, kMaxPlanYears, warnings);
    bound("plan.slots_per_semester", s.plan_slots_per_semester, 5, kMaxSlotsPerSemester, warnings);
    return s;
}

} // namespace planwise::config
