#pragma once

#include <planwise/diag/DiagCode.hpp>

#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace planwise::catalog {

enum class Session : uint8_t {
    kFall,
    kWinter,
    kBoth,
};

/// Accepts the catalog's short forms (F, S, B) and the long forms
/// (Fall, Winter, Both), case-insensitively.
std::optional<Session> parse_session(std::string_view text);
const char* session_name(Session s);
const char* session_label(Session s);

struct Course {
    std::string code{};
    std::string title{};
    Session session = Session::kBoth;
    std::optional<std::string> group{};
    std::optional<std::string> url{};
    std::optional<std::string> description{};

    std::optional<std::string> prerequisites{};
    std::optional<std::string> corequisites{};
    std::optional<std::string> exclusions{};
};

/// Read side of the course database consumed by the resolver and validator.
class Catalog {
public:
    virtual ~Catalog() = default;

    virtual const Course* course(std::string_view code) const = 0;
    virtual std::optional<std::string_view> courseset_expression(std::string_view id) const = 0;
};

class CatalogStore final : public Catalog {
public:
    const Course* course(std::string_view code) const override;
    std::optional<std::string_view> courseset_expression(std::string_view id) const override;

    /// Returns false when a course with the same code is already present;
    /// the first entry is kept.
    bool add_course(Course c);
    void add_courseset(std::string id, std::string expression);

    const std::vector<Course>& courses() const { return courses_; }
    std::vector<std::string> groups() const;
    std::vector<std::string> courseset_ids() const;

    size_t courseset_count() const { return coursesets_.size(); }

private:
    std::vector<Course> courses_{};
    std::map<std::string, size_t, std::less<>> index_{};
    std::map<std::string, std::string, std::less<>> coursesets_{};
};

/// Loads a course database document: `{ "courses": [...], "coursesets":
/// { "<id>": { "courses": "<expr>" } } }`. Entry-level problems become
/// warnings and the entry is skipped; only an unreadable document fails.
bool load_json(std::string_view text,
               std::string_view source_name,
               CatalogStore& out,
               diag::Bag& diags);

bool load_json_file(const std::filesystem::path& path, CatalogStore& out, diag::Bag& diags);

} // namespace planwise::catalog
