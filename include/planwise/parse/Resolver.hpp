#pragma once

#include <planwise/ast/Nodes.hpp>
#include <planwise/catalog/Catalog.hpp>
#include <planwise/diag/DiagCode.hpp>

#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace planwise::parse {

inline constexpr std::string_view kAndDelimiter = " & ";
inline constexpr std::string_view kOrDelimiter = " / ";

/// `{2-4 uppercase}{3 digits}{H|Y}{digit}_{p|c|e}{digits}`, e.g. ECE435H1_p6.
bool is_courseset_id(std::string_view token);

/// Expands courseset ids into expression trees and memoizes them.
///
/// Anomalies (unknown ids, cycles, malformed strings, unknown course codes)
/// go to the diagnostic bag as warnings; the returned tree is always a best
/// effort and a null tree means "no requirement". Each anomaly is reported
/// once per resolver.
///
/// A reference back to an id that is still being expanded is read as absent.
/// The tree of an id on a cycle is the one obtained when expansion starts at
/// that id, whatever was resolved before it: cycle members reached from
/// another id are expanded again rather than taken from the cache.
///
/// The cache is guarded by a read-mostly lock; lookups of already expanded
/// ids may run concurrently.
class Resolver {
public:
    Resolver(const catalog::Catalog& catalog, diag::Bag& diags)
        : catalog_(catalog), diags_(diags) {}

    Resolver(const Resolver&) = delete;
    Resolver& operator=(const Resolver&) = delete;

    ast::NodePtr resolve(std::string_view courseset_id);

    /// Resolves a course requirement field, which is either a single
    /// courseset id or an inline expression over codes and ids.
    ast::NodePtr resolve_field(std::string_view field);

    /// Expands `ids` up front. Returns how many produced a tree.
    size_t prime(const std::vector<std::string>& ids);

    size_t cache_size() const;

private:
    struct Operand {
        ast::NodePtr node{};
        bool vacuous = false;
    };

    struct Entry {
        ast::NodePtr node{};
        bool on_cycle = false;
    };

    static constexpr size_t kNoCycle = static_cast<size_t>(-1);

    // Ids being expanded, outermost first. `low` is the smallest stack index
    // a cyclic reference inside the current expansion pointed back to.
    struct Expanding {
        std::vector<std::string> ids{};
        size_t low = kNoCycle;
    };

    void warn_once_(diag::Code code, std::string subject, std::string message);

    ast::NodePtr resolve_locked_(std::string_view id, Expanding& expanding);
    ast::NodePtr parse_expression_locked_(std::string_view expr,
                                          std::string_view subject,
                                          Expanding& expanding);
    ast::NodePtr parse_any_group_(std::string_view expr,
                                  std::string_view subject,
                                  Expanding& expanding,
                                  bool& vacuous);
    Operand parse_operand_(std::string_view token,
                           std::string_view subject,
                           Expanding& expanding);

    const catalog::Catalog& catalog_;
    diag::Bag& diags_;

    mutable std::shared_mutex mu_{};
    std::unordered_map<std::string, Entry> cache_{};
    std::unordered_set<std::string> reported_{};
};

} // namespace planwise::parse
