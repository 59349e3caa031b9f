#pragma once

#include <planwise/ast/Nodes.hpp>

#include <set>
#include <string>
#include <variant>
#include <vector>

namespace planwise::eval {

using CodeSet = std::set<std::string>;

struct MissingCourse {
    std::string code{};
};

/// An unsatisfied OR. `options` holds every leaf code of the subtree in
/// tree order; duplicates are kept, de-duplicate for display.
struct MissingAnyOf {
    std::vector<std::string> options{};
};

using MissingInfo = std::variant<MissingCourse, MissingAnyOf>;

struct RequirementResult {
    bool satisfied = true;
    std::vector<MissingInfo> missing{};
};

/// Evaluates `tree` against `completed`. A null tree is satisfied. An
/// unsatisfied AND reports the concatenation of its failing children's
/// misses rather than a nested entry.
RequirementResult evaluate(const ast::Node* tree, const CodeSet& completed);

inline RequirementResult evaluate(const ast::NodePtr& tree, const CodeSet& completed) {
    return evaluate(tree.get(), completed);
}

} // namespace planwise::eval
