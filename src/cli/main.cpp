#include <planwise/catalog/Catalog.hpp>
#include <planwise/cli/Options.hpp>
#include <planwise/config/Config.hpp>
#include <planwise/diag/DiagCode.hpp>
#include <planwise/grid/Grid.hpp>
#include <planwise/parse/Resolver.hpp>
#include <planwise/render/Render.hpp>
#include <planwise/validate/Validator.hpp>

#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

#if defined(_WIN32)
#include <io.h>
#else
#include <unistd.h>
#endif

using namespace planwise;

namespace {

constexpr const char* kAnsiReset = "\033[0m";
constexpr const char* kAnsiGreen = "\033[32m";
constexpr const char* kAnsiRed = "\033[31m";
constexpr const char* kAnsiOrange = "\033[38;5;208m";

bool use_stderr_color(std::string_view mode) {
    if (mode == "never") return false;
    if (mode == "always") return true;
    if (std::getenv("NO_COLOR") != nullptr) return false;
#if defined(_WIN32)
    return _isatty(_fileno(stderr)) != 0;
#else
    return isatty(fileno(stderr)) != 0;
#endif
}

std::string tag(std::string_view text, const char* ansi, std::string_view color_mode) {
    if (!use_stderr_color(color_mode)) {
        return "[" + std::string(text) + "]";
    }
    return "[" + std::string(ansi) + std::string(text) + kAnsiReset + "]";
}

void emit_warn(std::string_view color_mode, std::string_view message) {
    std::cerr << tag("WARN", kAnsiOrange, color_mode) << " " << message << "\n";
}

void emit_fail(std::string_view color_mode, std::string_view message) {
    std::cerr << tag("FAIL", kAnsiRed, color_mode) << " " << message << "\n";
}

void emit_done(std::string_view color_mode, std::string_view message) {
    std::cerr << tag("DONE", kAnsiGreen, color_mode) << " " << message << "\n";
}

struct AppState {
    config::EffectiveSettings settings{};
    diag::Bag diags{};
    catalog::CatalogStore store{};
};

// Bag contents only; placement errors are printed by the caller.
void print_diagnostics(const AppState& s) {
    if (!s.settings.diag_warnings || s.diags.empty()) return;
    for (const auto& d : s.diags.all()) {
        std::string line = std::string(diag::code_name(d.code)) + ": " + d.message;
        if (!d.subject.empty()) line += " (" + d.subject + ")";
        if (d.severity == diag::Severity::kError) {
            emit_fail(s.settings.diag_color, line);
        } else {
            emit_warn(s.settings.diag_color, line);
        }
    }
}

int run_check(AppState& s, parse::Resolver& resolver, const cli::Options& opt) {
    const auto order = grid::default_semester_order(static_cast<uint32_t>(s.settings.plan_years));
    grid::PlanGrid plan(static_cast<uint32_t>(s.settings.plan_slots_per_semester));
    plan.init_semesters(order);

    bool placed_all = true;
    for (const auto& p : opt.placements) {
        if (!plan.place(p.semester_id, p.code, s.diags)) placed_all = false;
    }
    if (!placed_all) {
        std::cerr << s.diags.render_text();
        emit_fail(s.settings.diag_color, "could not build the plan from --place arguments");
        return 1;
    }

    validate::Validator validator(s.store, resolver, plan);
    const auto report = validator.validate_all(order, s.diags);

    size_t error_count = 0;
    for (const auto& [_, errors] : report) error_count += errors.size();

    if (s.settings.diag_format == "json") {
        std::cout << "{\"placements\":" << render::report_json(report)
                  << ",\"diagnostics\":" << render::diagnostics_json(s.diags) << "}\n";
    } else {
        std::cout << render::report_text(report);
        print_diagnostics(s);
        emit_done(s.settings.diag_color,
                  std::to_string(report.size()) + " placement(s) checked, " +
                      std::to_string(error_count) + " error(s)");
    }
    return error_count == 0 ? 0 : 1;
}

void print_requirement(parse::Resolver& resolver, std::string_view label, const std::optional<std::string>& field) {
    if (!field.has_value()) return;
    std::string text = render::to_readable(resolver.resolve_field(*field));
    if (text.empty()) text = "(none)";
    std::cout << label << ": " << text << "\n";
}

int run_show(AppState& s, parse::Resolver& resolver, const cli::Options& opt) {
    const catalog::Course* course = s.store.course(opt.target);
    if (course == nullptr) {
        emit_fail(s.settings.diag_color, "unknown course: " + opt.target);
        return 1;
    }

    std::cout << course->code << "\n";
    std::cout << course->title << "\n";
    std::cout << "Session: " << catalog::session_label(course->session) << "\n";
    if (course->group.has_value()) std::cout << "Group: " << *course->group << "\n";
    if (course->description.has_value()) std::cout << "\n" << *course->description << "\n\n";

    print_requirement(resolver, "Prerequisites", course->prerequisites);
    print_requirement(resolver, "Corequisites", course->corequisites);
    print_requirement(resolver, "Exclusions", course->exclusions);

    print_diagnostics(s);
    return 0;
}

int run_resolve(AppState& s, parse::Resolver& resolver, const cli::Options& opt) {
    if (!parse::is_courseset_id(opt.target)) {
        emit_warn(s.settings.diag_color, "'" + opt.target + "' does not look like a courseset id");
    }
    const auto tree = resolver.resolve(opt.target);
    const std::string text = render::to_readable(tree);
    std::cout << (text.empty() ? "(no requirement)" : text) << "\n";

    print_diagnostics(s);
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    const auto opt = cli::parse_options(argc, argv);
    if (!opt.ok) {
        std::cerr << "error: " << opt.error << "\n";
        cli::print_usage(std::cerr);
        return 1;
    }
    if (opt.mode == cli::Mode::kUsage) {
        cli::print_usage(std::cout);
        return 0;
    }
    if (opt.mode == cli::Mode::kVersion) {
        std::cout << "planwise dev\n";
        return 0;
    }

    AppState s{};
    const auto loaded = config::load(std::nullopt);
    std::vector<std::string> config_warnings = loaded.warnings;
    s.settings = config::materialize(loaded, &config_warnings);

    if (opt.catalog_path.has_value()) s.settings.catalog_path = *opt.catalog_path;
    if (opt.format.has_value()) s.settings.diag_format = *opt.format;
    if (opt.color.has_value()) s.settings.diag_color = *opt.color;
    if (opt.quiet_warnings) s.settings.diag_warnings = false;

    for (const auto& w : config_warnings) emit_warn(s.settings.diag_color, w);

    if (!catalog::load_json_file(s.settings.catalog_path, s.store, s.diags)) {
        std::cerr << s.diags.render_text();
        emit_fail(s.settings.diag_color, "cannot load course catalog: " + s.settings.catalog_path);
        return 1;
    }

    parse::Resolver resolver(s.store, s.diags);

    switch (opt.command) {
        case cli::Command::kCheck: return run_check(s, resolver, opt);
        case cli::Command::kShow: return run_show(s, resolver, opt);
        case cli::Command::kResolve: return run_resolve(s, resolver, opt);
        case cli::Command::kNone: break;
    }
    cli::print_usage(std::cerr);
    return 1;
}
