#pragma once

#include <memory>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace planwise::ast {

struct Node;

/// Trees are immutable once built; subtrees are shared between parents
/// and with the resolver cache. A null NodePtr means "no requirement".
using NodePtr = std::shared_ptr<const Node>;

struct CourseRef {
    std::string code{};
};

struct AllOf {
    std::vector<NodePtr> children{};
};

struct AnyOf {
    std::vector<NodePtr> children{};
};

struct Node {
    std::variant<CourseRef, AllOf, AnyOf> data;

    bool is_course() const { return std::holds_alternative<CourseRef>(data); }
    bool is_all_of() const { return std::holds_alternative<AllOf>(data); }
    bool is_any_of() const { return std::holds_alternative<AnyOf>(data); }

    const CourseRef* as_course() const { return std::get_if<CourseRef>(&data); }
    const AllOf* as_all_of() const { return std::get_if<AllOf>(&data); }
    const AnyOf* as_any_of() const { return std::get_if<AnyOf>(&data); }
};

inline NodePtr make_course(std::string code) {
    return std::make_shared<const Node>(Node{CourseRef{std::move(code)}});
}

inline NodePtr make_all_of(std::vector<NodePtr> children) {
    return std::make_shared<const Node>(Node{AllOf{std::move(children)}});
}

inline NodePtr make_any_of(std::vector<NodePtr> children) {
    return std::make_shared<const Node>(Node{AnyOf{std::move(children)}});
}

/// Appends every leaf code under `node` in tree order (duplicates kept).
void collect_codes(const Node& node, std::vector<std::string>& out);

} // namespace planwise::ast
