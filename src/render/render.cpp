#include <planwise/render/Render.hpp>

#include <planwise/json/Json.hpp>

#include <algorithm>
#include <sstream>
#include <type_traits>

namespace planwise::render {

namespace {

std::string join(const std::vector<std::string>& items, std::string_view sep) {
    std::string out{};
    for (size_t i = 0; i < items.size(); ++i) {
        if (i != 0) out += sep;
        out += items[i];
    }
    return out;
}

std::string json_quoted(std::string_view s) {
    return "\"" + json::escape(s) + "\"";
}

std::string json_string_array(const std::vector<std::string>& items) {
    std::string out = "[";
    for (size_t i = 0; i < items.size(); ++i) {
        if (i != 0) out += ",";
        out += json_quoted(items[i]);
    }
    out += "]";
    return out;
}

std::string missing_json(const eval::MissingInfo& m) {
    if (const auto* c = std::get_if<eval::MissingCourse>(&m)) {
        return "{\"course\":" + json_quoted(c->code) + "}";
    }
    const auto& any = std::get<eval::MissingAnyOf>(m);
    return "{\"any_of\":" + json_string_array(unique_options(any)) + "}";
}

std::string error_json(const validate::PlacementError& e) {
    std::ostringstream oss;
    oss << "{\"kind\":" << json_quoted(validate::rule_name(e.kind));
    switch (e.kind) {
        case validate::RuleKind::kPrerequisite:
        case validate::RuleKind::kCorequisite: {
            oss << ",\"missing\":[";
            for (size_t i = 0; i < e.missing.size(); ++i) {
                if (i != 0) oss << ",";
                oss << missing_json(e.missing[i]);
            }
            oss << "]";
            break;
        }
        case validate::RuleKind::kExclusion:
            oss << ",\"conflicts\":" << json_string_array(e.conflicts);
            break;
        case validate::RuleKind::kSession:
            oss << ",\"detail\":" << json_quoted(e.detail);
            break;
    }
    oss << ",\"message\":" << json_quoted(describe(e)) << "}";
    return oss.str();
}

} // namespace

std::string to_readable(const ast::Node* tree) {
    if (tree == nullptr) return {};

    return std::visit([&](auto&& n) -> std::string {
        using T = std::decay_t<decltype(n)>;

        if constexpr (std::is_same_v<T, ast::CourseRef>) {
            return n.code;
        } else if constexpr (std::is_same_v<T, ast::AllOf>) {
            std::vector<std::string> parts{};
            for (const auto& ch : n.children) parts.push_back(to_readable(ch.get()));
            return join(parts, " and ");
        } else if constexpr (std::is_same_v<T, ast::AnyOf>) {
            if (n.children.size() == 1) return to_readable(n.children.front().get());
            // AND alternatives keep their own parentheses: "((A and B) or C)".
            std::vector<std::string> parts{};
            for (const auto& ch : n.children) {
                std::string text = to_readable(ch.get());
                const auto* all = std::get_if<ast::AllOf>(&ch->data);
                if (all != nullptr && all->children.size() > 1) text = "(" + text + ")";
                parts.push_back(std::move(text));
            }
            return "(" + join(parts, " or ") + ")";
        }
    }, tree->data);
}

std::vector<std::string> unique_options(const eval::MissingAnyOf& m) {
    std::vector<std::string> out{};
    for (const auto& o : m.options) {
        if (std::find(out.begin(), out.end(), o) == out.end()) out.push_back(o);
    }
    return out;
}

std::string describe_missing(const eval::MissingInfo& m) {
    if (const auto* c = std::get_if<eval::MissingCourse>(&m)) return c->code;
    return "one of " + join(unique_options(std::get<eval::MissingAnyOf>(m)), ", ");
}

std::string describe(const validate::PlacementError& e) {
    switch (e.kind) {
        case validate::RuleKind::kPrerequisite:
        case validate::RuleKind::kCorequisite: {
            std::vector<std::string> parts{};
            for (const auto& m : e.missing) parts.push_back(describe_missing(m));
            return std::string("missing ") + validate::rule_name(e.kind) + ": " + join(parts, "; ");
        }
        case validate::RuleKind::kExclusion:
            return "cannot be taken together with " + join(e.conflicts, ", ");
        case validate::RuleKind::kSession:
            return e.detail;
    }
    return {};
}

std::string report_text(const validate::PlanReport& report) {
    std::ostringstream oss;
    for (const auto& [code, errors] : report) {
        for (const auto& e : errors) {
            oss << code << ": " << describe(e) << "\n";
        }
    }
    return oss.str();
}

std::string report_json(const validate::PlanReport& report) {
    std::ostringstream oss;
    oss << "{";
    bool first = true;
    for (const auto& [code, errors] : report) {
        if (!first) oss << ",";
        first = false;
        oss << json_quoted(code) << ":[";
        for (size_t i = 0; i < errors.size(); ++i) {
            if (i != 0) oss << ",";
            oss << error_json(errors[i]);
        }
        oss << "]";
    }
    oss << "}";
    return oss.str();
}

std::string diagnostics_json(const diag::Bag& bag) {
    std::ostringstream oss;
    oss << "[";
    for (size_t i = 0; i < bag.all().size(); ++i) {
        const auto& d = bag.all()[i];
        if (i != 0) oss << ",";
        oss << "{\"code\":" << json_quoted(diag::code_name(d.code))
            << ",\"severity\":" << json_quoted(diag::severity_name(d.severity))
            << ",\"subject\":" << json_quoted(d.subject)
            << ",\"message\":" << json_quoted(d.message) << "}";
    }
    oss << "]";
    return oss.str();
}

} // namespace planwise::render
