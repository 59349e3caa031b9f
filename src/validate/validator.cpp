#include <planwise/validate/Validator.hpp>

#include <algorithm>

namespace planwise::validate {

namespace {

bool session_allows(catalog::Session session, grid::Term term) {
    switch (session) {
        case catalog::Session::kBoth: return true;
        case catalog::Session::kFall: return term == grid::Term::kFall;
        case catalog::Session::kWinter: return term == grid::Term::kWinter;
    }
    return true;
}

std::vector<std::string> present_conflicts(const ast::Node& exclusions, const eval::CodeSet& placed) {
    std::vector<std::string> codes{};
    ast::collect_codes(exclusions, codes);

    std::vector<std::string> out{};
    for (auto& c : codes) {
        if (placed.find(c) == placed.end()) continue;
        if (std::find(out.begin(), out.end(), c) != out.end()) continue;
        out.push_back(std::move(c));
    }
    return out;
}

} // namespace

const char* rule_name(RuleKind k) {
    switch (k) {
        case RuleKind::kPrerequisite: return "prerequisite";
        case RuleKind::kCorequisite: return "corequisite";
        case RuleKind::kExclusion: return "exclusion";
        case RuleKind::kSession: return "session";
    }
    return "unknown";
}

ast::NodePtr Validator::requirement_(const std::optional<std::string>& field) const {
    if (!field.has_value()) return nullptr;
    return resolver_.resolve_field(*field);
}

std::vector<PlacementError> Validator::validate_placement(const catalog::Course& course,
                                                          std::string_view semester_id,
                                                          const grid::SemesterOrder& order,
                                                          diag::Bag& diags) const {
    std::vector<PlacementError> errors{};

    if (!grid::position_of(order, semester_id).has_value()) {
        diags.warn(diag::Code::V_UNKNOWN_SEMESTER, std::string(semester_id),
                   "semester is not in the semester order; nothing counts as taken before it");
    }

    if (const auto pre = requirement_(course.prerequisites)) {
        auto r = eval::evaluate(pre, grid_.placed_before(order, semester_id));
        if (!r.satisfied) {
            PlacementError e{};
            e.kind = RuleKind::kPrerequisite;
            e.missing = std::move(r.missing);
            errors.push_back(std::move(e));
        }
    }

    if (const auto co = requirement_(course.corequisites)) {
        auto r = eval::evaluate(co, grid_.placed_up_to(order, semester_id));
        if (!r.satisfied) {
            PlacementError e{};
            e.kind = RuleKind::kCorequisite;
            e.missing = std::move(r.missing);
            errors.push_back(std::move(e));
        }
    }

    if (const auto excl = requirement_(course.exclusions)) {
        auto placed = grid_.placed_anywhere();
        placed.erase(course.code);
        // A satisfied exclusion tree means a conflicting course is present.
        if (eval::evaluate(excl, placed).satisfied) {
            PlacementError e{};
            e.kind = RuleKind::kExclusion;
            e.conflicts = present_conflicts(*excl, placed);
            errors.push_back(std::move(e));
        }
    }

    const auto term = grid::term_of(semester_id);
    if (!term.has_value()) {
        diags.warn(diag::Code::V_UNKNOWN_TERM, std::string(semester_id),
                   "cannot tell the term of this semester; session rule skipped for " + course.code);
    } else if (!session_allows(course.session, *term)) {
        PlacementError e{};
        e.kind = RuleKind::kSession;
        e.detail = course.code + " is offered in " + catalog::session_name(course.session) +
                   " only, but " + std::string(semester_id) + " is a " + grid::term_name(*term) + " term";
        errors.push_back(std::move(e));
    }

    return errors;
}

PlanReport Validator::validate_all(const grid::SemesterOrder& order, diag::Bag& diags) const {
    PlanReport report{};
    for (const auto& p : grid_.placements(order)) {
        const catalog::Course* course = catalog_.course(p.code);
        if (course == nullptr) {
            diags.warn(diag::Code::V_UNKNOWN_COURSE, p.code,
                       "placed in " + p.semester_id + " but not in the catalog; not validated");
            continue;
        }
        report[p.code] = validate_placement(*course, p.semester_id, order, diags);
    }
    return report;
}

} // namespace planwise::validate
