#pragma once

#include <cstdint>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace planwise::diag {

enum class Code : uint16_t {
    P_UNRESOLVED_COURSESET = 1,
    P_CYCLIC_COURSESET,
    P_MALFORMED_EXPRESSION,
    P_UNKNOWN_COURSE,

    C_JSON_INVALID = 100,
    C_CATALOG_SHAPE,
    C_DUPLICATE_COURSE,
    C_FILE_READ_FAILED,
    C_CONFIG_INVALID,

    G_UNKNOWN_SEMESTER = 200,
    G_SLOT_OUT_OF_RANGE,
    G_SLOT_OCCUPIED,
    G_DUPLICATE_PLACEMENT,

    V_UNKNOWN_COURSE = 300,
    V_UNKNOWN_SEMESTER,
    V_UNKNOWN_TERM,
};

enum class Severity : uint8_t {
    kWarning,
    kError,
};

inline const char* code_name(Code c) {
    switch (c) {
        case Code::P_UNRESOLVED_COURSESET: return "P_UNRESOLVED_COURSESET";
        case Code::P_CYCLIC_COURSESET: return "P_CYCLIC_COURSESET";
        case Code::P_MALFORMED_EXPRESSION: return "P_MALFORMED_EXPRESSION";
        case Code::P_UNKNOWN_COURSE: return "P_UNKNOWN_COURSE";
        case Code::C_JSON_INVALID: return "C_JSON_INVALID";
        case Code::C_CATALOG_SHAPE: return "C_CATALOG_SHAPE";
        case Code::C_DUPLICATE_COURSE: return "C_DUPLICATE_COURSE";
        case Code::C_FILE_READ_FAILED: return "C_FILE_READ_FAILED";
        case Code::C_CONFIG_INVALID: return "C_CONFIG_INVALID";
        case Code::G_UNKNOWN_SEMESTER: return "G_UNKNOWN_SEMESTER";
        case Code::G_SLOT_OUT_OF_RANGE: return "G_SLOT_OUT_OF_RANGE";
        case Code::G_SLOT_OCCUPIED: return "G_SLOT_OCCUPIED";
        case Code::G_DUPLICATE_PLACEMENT: return "G_DUPLICATE_PLACEMENT";
        case Code::V_UNKNOWN_COURSE: return "V_UNKNOWN_COURSE";
        case Code::V_UNKNOWN_SEMESTER: return "V_UNKNOWN_SEMESTER";
        case Code::V_UNKNOWN_TERM: return "V_UNKNOWN_TERM";
    }
    return "UNKNOWN";
}

inline const char* severity_name(Severity s) {
    return s == Severity::kError ? "error" : "warning";
}

/// One anomaly. `subject` names what it is about: a courseset id, a course
/// code, a semester id or a file path.
struct Diagnostic {
    Code code{};
    Severity severity = Severity::kWarning;
    std::string subject;
    std::string message;
};

class Bag {
public:
    void add(Code code, Severity severity, std::string subject, std::string message) {
        if (severity == Severity::kError) ++error_count_;
        diagnostics_.push_back(Diagnostic{code, severity, std::move(subject), std::move(message)});
    }

    void warn(Code code, std::string subject, std::string message) {
        add(code, Severity::kWarning, std::move(subject), std::move(message));
    }

    void error(Code code, std::string subject, std::string message) {
        add(code, Severity::kError, std::move(subject), std::move(message));
    }

    bool has_error() const { return error_count_ != 0; }
    bool empty() const { return diagnostics_.empty(); }

    bool has_code(Code c) const {
        for (const auto& d : diagnostics_) {
            if (d.code == c) return true;
        }
        return false;
    }

    size_t count_code(Code c) const {
        size_t n = 0;
        for (const auto& d : diagnostics_) {
            if (d.code == c) ++n;
        }
        return n;
    }

    const std::vector<Diagnostic>& all() const { return diagnostics_; }
    uint32_t error_count() const { return error_count_; }

    void clear() {
        diagnostics_.clear();
        error_count_ = 0;
    }

    std::string render_text() const {
        std::ostringstream oss;
        for (const auto& d : diagnostics_) {
            oss << severity_name(d.severity) << "[" << code_name(d.code) << "]: " << d.message << "\n";
            if (!d.subject.empty()) oss << " --> " << d.subject << "\n";
        }
        return oss.str();
    }

private:
    std::vector<Diagnostic> diagnostics_{};
    uint32_t error_count_ = 0;
};

} // namespace planwise::diag
