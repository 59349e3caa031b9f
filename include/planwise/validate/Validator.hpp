#pragma once

#include <planwise/catalog/Catalog.hpp>
#include <planwise/diag/DiagCode.hpp>
#include <planwise/eval/Evaluator.hpp>
#include <planwise/grid/Grid.hpp>
#include <planwise/parse/Resolver.hpp>

#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace planwise::validate {

enum class RuleKind : uint8_t {
    kPrerequisite,
    kCorequisite,
    kExclusion,
    kSession,
};

const char* rule_name(RuleKind k);

struct PlacementError {
    RuleKind kind = RuleKind::kPrerequisite;

    // kPrerequisite / kCorequisite: the evaluator's misses.
    std::vector<eval::MissingInfo> missing{};
    // kExclusion: excluded codes actually present in the plan.
    std::vector<std::string> conflicts{};
    // kSession: readable mismatch.
    std::string detail{};
};

/// Course code -> its placement errors, for every placed catalog course.
using PlanReport = std::map<std::string, std::vector<PlacementError>>;

/// Checks placements against the current grid snapshot. Holds no state of
/// its own; requirement trees come from the resolver cache.
///
/// Anomalies in the placements (unknown semesters, terms or courses) go to
/// the `diags` bag of the call, never into the error lists. Calls may run
/// from several threads as long as each passes its own bag and the grid is
/// not mutated meanwhile.
class Validator {
public:
    Validator(const catalog::Catalog& catalog,
              parse::Resolver& resolver,
              const grid::GridView& grid)
        : catalog_(catalog), resolver_(resolver), grid_(grid) {}

    std::vector<PlacementError> validate_placement(const catalog::Course& course,
                                                   std::string_view semester_id,
                                                   const grid::SemesterOrder& order,
                                                   diag::Bag& diags) const;

    PlanReport validate_all(const grid::SemesterOrder& order, diag::Bag& diags) const;

private:
    ast::NodePtr requirement_(const std::optional<std::string>& field) const;

    const catalog::Catalog& catalog_;
    parse::Resolver& resolver_;
    const grid::GridView& grid_;
};

} // namespace planwise::validate
