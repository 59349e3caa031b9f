#include <planwise/catalog/Catalog.hpp>

#include <planwise/json/Json.hpp>
#include <planwise/os/File.hpp>

#include <algorithm>
#include <cctype>

namespace planwise::catalog {

namespace {

std::string to_lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return out;
}

std::optional<std::string> optional_field(const json::Value& obj, std::string_view key) {
    auto v = json::get_string(obj, key);
    if (!v.has_value() || v->empty()) return std::nullopt;
    return v;
}

bool read_course(const json::Value& entry,
                 size_t index,
                 std::string_view source_name,
                 Course& out,
                 diag::Bag& diags) {
    const std::string where = std::string(source_name) + ": courses[" + std::to_string(index) + "]";
    if (!entry.is_object()) {
        diags.warn(diag::Code::C_CATALOG_SHAPE, where, "course entry is not an object; skipped");
        return false;
    }

    auto code = json::get_string(entry, "code");
    if (!code.has_value() || code->empty()) {
        diags.warn(diag::Code::C_CATALOG_SHAPE, where, "course entry has no code; skipped");
        return false;
    }

    out = Course{};
    out.code = std::move(*code);
    out.title = json::get_string(entry, "title").value_or("");
    out.group = optional_field(entry, "group");
    out.url = optional_field(entry, "url");
    out.description = optional_field(entry, "description");
    out.prerequisites = optional_field(entry, "prerequisites");
    out.corequisites = optional_field(entry, "corequisites");
    out.exclusions = optional_field(entry, "exclusions");

    const auto session_text = json::get_string(entry, "session");
    const auto session = session_text.has_value() ? parse_session(*session_text) : std::nullopt;
    if (session.has_value()) {
        out.session = *session;
    } else {
        out.session = Session::kBoth;
        diags.warn(diag::Code::C_CATALOG_SHAPE, out.code,
                   "course has no recognizable session ('" + session_text.value_or("") +
                       "'); treated as offered in both terms");
    }
    return true;
}

} // namespace

std::optional<Session> parse_session(std::string_view text) {
    const std::string s = to_lower(text);
    if (s == "f" || s == "fall") return Session::kFall;
    if (s == "s" || s == "winter") return Session::kWinter;
    if (s == "b" || s == "both") return Session::kBoth;
    return std::nullopt;
}

const char* session_name(Session s) {
    switch (s) {
        case Session::kFall: return "Fall";
        case Session::kWinter: return "Winter";
        case Session::kBoth: return "Both";
    }
    return "Both";
}

const char* session_label(Session s) {
    switch (s) {
        case Session::kFall: return "Fall";
        case Session::kWinter: return "Winter";
        case Session::kBoth: return "Fall & Winter";
    }
    return "Fall & Winter";
}

const Course* CatalogStore::course(std::string_view code) const {
    const auto it = index_.find(code);
    if (it == index_.end()) return nullptr;
    return &courses_[it->second];
}

std::optional<std::string_view> CatalogStore::courseset_expression(std::string_view id) const {
    const auto it = coursesets_.find(id);
    if (it == coursesets_.end()) return std::nullopt;
    return std::string_view(it->second);
}

bool CatalogStore::add_course(Course c) {
    if (index_.find(c.code) != index_.end()) return false;
    index_.emplace(c.code, courses_.size());
    courses_.push_back(std::move(c));
    return true;
}

void CatalogStore::add_courseset(std::string id, std::string expression) {
    coursesets_.insert_or_assign(std::move(id), std::move(expression));
}

std::vector<std::string> CatalogStore::groups() const {
    std::set<std::string> uniq{};
    for (const auto& c : courses_) {
        if (c.group.has_value()) uniq.insert(*c.group);
    }
    return std::vector<std::string>(uniq.begin(), uniq.end());
}

std::vector<std::string> CatalogStore::courseset_ids() const {
    std::vector<std::string> out{};
    out.reserve(coursesets_.size());
    for (const auto& [id, _] : coursesets_) out.push_back(id);
    return out;
}

bool load_json(std::string_view text,
               std::string_view source_name,
               CatalogStore& out,
               diag::Bag& diags) {
    const auto parsed = json::parse(text);
    if (!parsed.ok) {
        diags.error(diag::Code::C_JSON_INVALID, std::string(source_name),
                    "invalid JSON near offset " + std::to_string(parsed.error_offset));
        return false;
    }

    const json::Value& root = parsed.value;
    if (!root.is_object()) {
        diags.error(diag::Code::C_CATALOG_SHAPE, std::string(source_name), "course database must be a JSON object");
        return false;
    }

    const json::Value* courses = json::get(root, "courses");
    if (courses == nullptr || !courses->is_array()) {
        diags.error(diag::Code::C_CATALOG_SHAPE, std::string(source_name), "missing 'courses' array");
        return false;
    }

    for (size_t i = 0; i < courses->array_v.size(); ++i) {
        Course c{};
        if (!read_course(courses->array_v[i], i, source_name, c, diags)) continue;
        const std::string code = c.code;
        if (!out.add_course(std::move(c))) {
            diags.warn(diag::Code::C_DUPLICATE_COURSE, code, "duplicate course entry ignored; first entry kept");
        }
    }

    const json::Value* sets = json::get(root, "coursesets");
    if (sets == nullptr || sets->is_null()) return true;
    if (!sets->is_object()) {
        diags.warn(diag::Code::C_CATALOG_SHAPE, std::string(source_name), "'coursesets' is not an object; ignored");
        return true;
    }

    for (const auto& [id, entry] : sets->object_v) {
        if (entry.is_string()) {
            out.add_courseset(id, entry.string_v);
            continue;
        }
        auto expr = json::get_string(entry, "courses");
        if (!expr.has_value()) {
            diags.warn(diag::Code::C_CATALOG_SHAPE, id, "courseset has no 'courses' string; ignored");
            continue;
        }
        out.add_courseset(id, std::move(*expr));
    }
    return true;
}

bool load_json_file(const std::filesystem::path& path, CatalogStore& out, diag::Bag& diags) {
    const auto r = os::read_text_file(path);
    if (!r.ok) {
        diags.error(diag::Code::C_FILE_READ_FAILED, path.string(), r.err);
        return false;
    }
    return load_json(r.text, path.string(), out, diags);
}

} // namespace planwise::catalog
