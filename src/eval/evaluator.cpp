#include <planwise/eval/Evaluator.hpp>

#include <type_traits>

namespace planwise::eval {

RequirementResult evaluate(const ast::Node* tree, const CodeSet& completed) {
    RequirementResult out{};
    if (tree == nullptr) return out;

    std::visit([&](auto&& n) {
        using T = std::decay_t<decltype(n)>;

        if constexpr (std::is_same_v<T, ast::CourseRef>) {
            if (completed.find(n.code) == completed.end()) {
                out.satisfied = false;
                out.missing.push_back(MissingCourse{n.code});
            }
        } else if constexpr (std::is_same_v<T, ast::AllOf>) {
            for (const auto& ch : n.children) {
                auto r = evaluate(ch.get(), completed);
                if (r.satisfied) continue;
                out.satisfied = false;
                for (auto& m : r.missing) out.missing.push_back(std::move(m));
            }
        } else if constexpr (std::is_same_v<T, ast::AnyOf>) {
            for (const auto& ch : n.children) {
                if (evaluate(ch.get(), completed).satisfied) return;
            }
            out.satisfied = false;
            MissingAnyOf miss{};
            ast::collect_codes(*tree, miss.options);
            out.missing.push_back(std::move(miss));
        }
    }, tree->data);

    return out;
}

} // namespace planwise::eval
