#pragma once

#include <planwise/ast/Nodes.hpp>
#include <planwise/diag/DiagCode.hpp>
#include <planwise/eval/Evaluator.hpp>
#include <planwise/validate/Validator.hpp>

#include <string>
#include <vector>

namespace planwise::render {

/// AND renders as "A and B", OR as "(A or B)", a one-child OR without the
/// parentheses. A null tree renders as an empty string.
std::string to_readable(const ast::Node* tree);

inline std::string to_readable(const ast::NodePtr& tree) {
    return to_readable(tree.get());
}

std::vector<std::string> unique_options(const eval::MissingAnyOf& m);
std::string describe_missing(const eval::MissingInfo& m);
std::string describe(const validate::PlacementError& e);

std::string report_text(const validate::PlanReport& report);
std::string report_json(const validate::PlanReport& report);
std::string diagnostics_json(const diag::Bag& bag);

} // namespace planwise::render
