#include <planwise/ast/Nodes.hpp>

#include <type_traits>

namespace planwise::ast {

void collect_codes(const Node& node, std::vector<std::string>& out) {
    std::visit([&](auto&& n) {
        using T = std::decay_t<decltype(n)>;

        if constexpr (std::is_same_v<T, CourseRef>) {
            out.push_back(n.code);
        } else if constexpr (std::is_same_v<T, AllOf> || std::is_same_v<T, AnyOf>) {
            for (const auto& ch : n.children) {
                if (ch) collect_codes(*ch, out);
            }
        }
    }, node.data);
}

} // namespace planwise::ast
