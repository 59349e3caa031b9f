#include <planwise/parse/Resolver.hpp>

#include <algorithm>
#include <cctype>
#include <mutex>

namespace planwise::parse {

namespace {

std::string_view trim(std::string_view s) {
    size_t b = 0;
    while (b < s.size() && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    size_t e = s.size();
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return s.substr(b, e - b);
}

std::vector<std::string_view> split(std::string_view s, std::string_view delim) {
    std::vector<std::string_view> out{};
    size_t begin = 0;
    while (true) {
        const size_t pos = s.find(delim, begin);
        if (pos == std::string_view::npos) {
            out.push_back(s.substr(begin));
            break;
        }
        out.push_back(s.substr(begin, pos - begin));
        begin = pos + delim.size();
    }
    return out;
}

bool contains(std::string_view s, std::string_view needle) {
    return s.find(needle) != std::string_view::npos;
}

bool is_upper(char c) { return c >= 'A' && c <= 'Z'; }
bool is_digit(char c) { return c >= '0' && c <= '9'; }

std::string cycle_path(const std::vector<std::string>& expanding, std::string_view repeat) {
    std::string out{};
    const auto start = std::find(expanding.begin(), expanding.end(), repeat);
    for (auto it = start; it != expanding.end(); ++it) {
        out += *it;
        out += " -> ";
    }
    out += repeat;
    return out;
}

} // namespace

bool is_courseset_id(std::string_view t) {
    size_t i = 0;
    while (i < t.size() && is_upper(t[i])) ++i;
    if (i < 2 || i > 4) return false;

    for (int k = 0; k < 3; ++k, ++i) {
        if (i >= t.size() || !is_digit(t[i])) return false;
    }
    if (i >= t.size() || (t[i] != 'H' && t[i] != 'Y')) return false;
    ++i;
    if (i >= t.size() || !is_digit(t[i])) return false;
    ++i;
    if (i >= t.size() || t[i] != '_') return false;
    ++i;
    if (i >= t.size() || (t[i] != 'p' && t[i] != 'c' && t[i] != 'e')) return false;
    ++i;

    const size_t digits_begin = i;
    while (i < t.size() && is_digit(t[i])) ++i;
    return i > digits_begin && i == t.size();
}

ast::NodePtr Resolver::resolve(std::string_view courseset_id) {
    const std::string_view id = trim(courseset_id);
    if (id.empty()) return nullptr;

    {
        std::shared_lock lock(mu_);
        const auto it = cache_.find(std::string(id));
        if (it != cache_.end()) return it->second.node;
    }

    std::unique_lock lock(mu_);
    Expanding expanding{};
    return resolve_locked_(id, expanding);
}

ast::NodePtr Resolver::resolve_field(std::string_view field) {
    const std::string_view text = trim(field);
    if (text.empty()) return nullptr;
    if (is_courseset_id(text)) return resolve(text);

    {
        std::shared_lock lock(mu_);
        const auto it = cache_.find(std::string(text));
        if (it != cache_.end()) return it->second.node;
    }

    std::unique_lock lock(mu_);
    const auto it = cache_.find(std::string(text));
    if (it != cache_.end()) return it->second.node;

    Expanding expanding{};
    auto node = parse_expression_locked_(text, text, expanding);
    cache_.emplace(std::string(text), Entry{node, false});
    return node;
}

size_t Resolver::prime(const std::vector<std::string>& ids) {
    size_t n = 0;
    for (const auto& id : ids) {
        if (resolve(id) != nullptr) ++n;
    }
    return n;
}

size_t Resolver::cache_size() const {
    std::shared_lock lock(mu_);
    return cache_.size();
}

void Resolver::warn_once_(diag::Code code, std::string subject, std::string message) {
    std::string key = std::string(diag::code_name(code)) + "\n" + subject + "\n" + message;
    if (!reported_.insert(std::move(key)).second) return;
    diags_.warn(code, std::move(subject), std::move(message));
}

ast::NodePtr Resolver::resolve_locked_(std::string_view id, Expanding& expanding) {
    const std::string key(id);
    const auto hit = cache_.find(key);
    // A cycle member's cached tree was built with itself outermost; reached
    // from another id it has to be expanded under the current stack.
    if (hit != cache_.end() && (!hit->second.on_cycle || expanding.ids.empty())) return hit->second.node;

    const auto on_stack = std::find(expanding.ids.begin(), expanding.ids.end(), key);
    if (on_stack != expanding.ids.end()) {
        warn_once_(diag::Code::P_CYCLIC_COURSESET, key,
                   "courseset refers back to itself (" + cycle_path(expanding.ids, key) +
                       "); the cyclic reference is ignored");
        expanding.low = std::min(expanding.low, static_cast<size_t>(on_stack - expanding.ids.begin()));
        return nullptr;
    }

    const auto expr = catalog_.courseset_expression(id);
    if (!expr.has_value()) {
        warn_once_(diag::Code::P_UNRESOLVED_COURSESET, key,
                   "courseset is not in the catalog; treated as no requirement");
        cache_.emplace(key, Entry{nullptr, false});
        return nullptr;
    }

    const size_t depth = expanding.ids.size();
    const size_t outer_low = expanding.low;
    expanding.low = kNoCycle;
    expanding.ids.push_back(key);
    auto node = parse_expression_locked_(*expr, key, expanding);
    expanding.ids.pop_back();
    const size_t low = expanding.low;
    expanding.low = std::min(outer_low, low);

    // Cut short by an id further out: the tree depends on how it was reached.
    if (low < depth) return node;

    cache_.emplace(key, Entry{node, low == depth});
    return node;
}

ast::NodePtr Resolver::parse_expression_locked_(std::string_view expr,
                                                std::string_view subject,
                                                Expanding& expanding) {
    const std::string_view text = trim(expr);
    if (text.empty()) {
        warn_once_(diag::Code::P_MALFORMED_EXPRESSION, std::string(subject), "empty requirement expression");
        return nullptr;
    }

    const bool has_and = contains(text, kAndDelimiter);
    const bool has_or = contains(text, kOrDelimiter);

    if (has_and && has_or) {
        warn_once_(diag::Code::P_MALFORMED_EXPRESSION, std::string(subject),
                   "expression mixes '&' and '/' at one level: \"" + std::string(text) +
                       "\"; read as an AND of OR groups");
    }

    if (has_and) {
        std::vector<ast::NodePtr> children{};
        for (const auto tok : split(text, kAndDelimiter)) {
            if (has_or && contains(tok, kOrDelimiter)) {
                bool vacuous = false;
                auto group = parse_any_group_(tok, subject, expanding, vacuous);
                if (group) children.push_back(std::move(group));
                continue;
            }
            auto op = parse_operand_(tok, subject, expanding);
            if (op.node) children.push_back(std::move(op.node));
        }
        if (children.empty()) return nullptr;
        return ast::make_all_of(std::move(children));
    }

    if (has_or) {
        bool vacuous = false;
        return parse_any_group_(text, subject, expanding, vacuous);
    }

    return parse_operand_(text, subject, expanding).node;
}

ast::NodePtr Resolver::parse_any_group_(std::string_view expr,
                                        std::string_view subject,
                                        Expanding& expanding,
                                        bool& vacuous) {
    std::vector<ast::NodePtr> children{};
    vacuous = false;
    // Every operand is parsed even after a vacuous one so its anomalies
    // are still reported.
    for (const auto tok : split(expr, kOrDelimiter)) {
        auto op = parse_operand_(tok, subject, expanding);
        if (op.vacuous) vacuous = true;
        if (op.node) children.push_back(std::move(op.node));
    }
    if (vacuous || children.empty()) return nullptr;
    return ast::make_any_of(std::move(children));
}

Resolver::Operand Resolver::parse_operand_(std::string_view token,
                                           std::string_view subject,
                                           Expanding& expanding) {
    const std::string_view t = trim(token);
    if (t.empty()) {
        warn_once_(diag::Code::P_MALFORMED_EXPRESSION, std::string(subject),
                   "empty operand between delimiters; dropped");
        return {};
    }

    if (is_courseset_id(t)) {
        auto node = resolve_locked_(t, expanding);
        const bool vacuous = (node == nullptr);
        return Operand{std::move(node), vacuous};
    }

    if (catalog_.course(t) == nullptr) {
        warn_once_(diag::Code::P_UNKNOWN_COURSE, std::string(subject),
                   "'" + std::string(t) + "' is neither a courseset id nor a known course code");
    }
    return Operand{ast::make_course(std::string(t)), false};
}

} // namespace planwise::parse
