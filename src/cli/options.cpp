#include <planwise/cli/Options.hpp>

#include <string_view>

namespace planwise::cli {

namespace {

bool is_command(std::string_view s) {
    return s == "check" || s == "show" || s == "resolve";
}

Command to_command(std::string_view s) {
    if (s == "check") return Command::kCheck;
    if (s == "show") return Command::kShow;
    if (s == "resolve") return Command::kResolve;
    return Command::kNone;
}

bool parse_opt_value(const std::vector<std::string_view>& args,
                     size_t& i,
                     std::string_view key,
                     std::string& out,
                     std::string& err) {
    const auto a = args[i];
    const auto pref = std::string(key) + "=";
    if (a.rfind(pref, 0) == 0) {
        out = std::string(a.substr(pref.size()));
        if (out.empty()) {
            err = std::string(key) + " requires a value";
            return false;
        }
        return true;
    }

    if (i + 1 >= args.size()) {
        err = std::string(key) + " requires a value";
        return false;
    }
    ++i;
    out = std::string(args[i]);
    if (out.empty()) {
        err = std::string(key) + " requires a value";
        return false;
    }
    return true;
}

bool matches_opt(std::string_view a, std::string_view key) {
    return a == key || (a.size() > key.size() && a.rfind(key, 0) == 0 && a[key.size()] == '=');
}

bool parse_place(const std::string& text, PlaceArg& out, std::string& err) {
    const auto colon = text.find(':');
    if (colon == std::string::npos || colon == 0 || colon + 1 >= text.size()) {
        err = "--place expects <semester>:<code>, got '" + text + "'";
        return false;
    }
    out.semester_id = text.substr(0, colon);
    out.code = text.substr(colon + 1);
    return true;
}

} // namespace

void print_usage(std::ostream& os) {
    os << "usage:\n";
    os << "  planwise --help\n";
    os << "  planwise --version\n";
    os << "  planwise check [--catalog <path>] [--format <text|json>] --place <semester>:<code> ...\n";
    os << "  planwise show [--catalog <path>] <COURSE>\n";
    os << "  planwise resolve [--catalog <path>] <COURSESET_ID>\n";
    os << "\n";
    os << "common options:\n";
    os << "  --color <auto|always|never>\n";
    os << "  --no-warnings            hide catalog data warnings\n";
}

Options parse_options(int argc, char** argv) {
    Options opt{};

    std::vector<std::string_view> args{};
    for (int i = 1; i < argc; ++i) args.emplace_back(argv[i]);

    if (args.empty()) {
        opt.mode = Mode::kUsage;
        return opt;
    }
    if (args.size() == 1 && (args[0] == "--help" || args[0] == "-h")) {
        opt.mode = Mode::kUsage;
        return opt;
    }
    if (args.size() == 1 && args[0] == "--version") {
        opt.mode = Mode::kVersion;
        return opt;
    }

    if (!is_command(args[0])) {
        opt.ok = false;
        opt.error = "unknown command: " + std::string(args[0]);
        return opt;
    }
    opt.mode = Mode::kCommand;
    opt.command = to_command(args[0]);

    for (size_t i = 1; i < args.size(); ++i) {
        const auto a = args[i];
        std::string value{};

        if (matches_opt(a, "--catalog")) {
            if (!parse_opt_value(args, i, "--catalog", value, opt.error)) {
                opt.ok = false;
                return opt;
            }
            opt.catalog_path = value;
            continue;
        }
        if (matches_opt(a, "--format")) {
            if (!parse_opt_value(args, i, "--format", value, opt.error)) {
                opt.ok = false;
                return opt;
            }
            if (value != "text" && value != "json") {
                opt.ok = false;
                opt.error = "--format must be text or json";
                return opt;
            }
            opt.format = value;
            continue;
        }
        if (matches_opt(a, "--color")) {
            if (!parse_opt_value(args, i, "--color", value, opt.error)) {
                opt.ok = false;
                return opt;
            }
            opt.color = value;
            continue;
        }
        if (a == "--no-warnings") {
            opt.quiet_warnings = true;
            continue;
        }
        if (matches_opt(a, "--place")) {
            if (opt.command != Command::kCheck) {
                opt.ok = false;
                opt.error = "--place is only valid for check";
                return opt;
            }
            if (!parse_opt_value(args, i, "--place", value, opt.error)) {
                opt.ok = false;
                return opt;
            }
            PlaceArg p{};
            if (!parse_place(value, p, opt.error)) {
                opt.ok = false;
                return opt;
            }
            opt.placements.push_back(std::move(p));
            continue;
        }
        if (a.rfind("--", 0) == 0) {
            opt.ok = false;
            opt.error = "unknown option: " + std::string(a);
            return opt;
        }

        if (opt.command == Command::kCheck || !opt.target.empty()) {
            opt.ok = false;
            opt.error = "unexpected argument: " + std::string(a);
            return opt;
        }
        opt.target = std::string(a);
    }

    if ((opt.command == Command::kShow || opt.command == Command::kResolve) && opt.target.empty()) {
        opt.ok = false;
        opt.error = opt.command == Command::kShow ? "show requires a course code"
                                                  : "resolve requires a courseset id";
    }
    return opt;
}

} // namespace planwise::cli
