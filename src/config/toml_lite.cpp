#include <planwise/config/TomlLite.hpp>

#include <planwise/os/File.hpp>

#include <cctype>
#include <charconv>

namespace planwise::config::toml_lite {

namespace {

bool is_key_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-' || c == '.';
}

/// Reads one line left to right. Comments are only recognized outside
/// string literals.
class LineCursor {
public:
    explicit LineCursor(std::string_view line) : s_(line) {}

    void skip_ws() {
        while (pos_ < s_.size() && (s_[pos_] == ' ' || s_[pos_] == '\t')) ++pos_;
    }

    bool done() {
        skip_ws();
        return pos_ >= s_.size() || s_[pos_] == '#';
    }

    char peek() const { return pos_ < s_.size() ? s_[pos_] : '\0'; }

    bool eat(char c) {
        skip_ws();
        if (peek() != c) return false;
        ++pos_;
        return true;
    }

    std::string_view read_key() {
        skip_ws();
        const size_t begin = pos_;
        while (pos_ < s_.size() && is_key_char(s_[pos_])) ++pos_;
        return s_.substr(begin, pos_ - begin);
    }

    bool read_value(Value& out, std::string& err) {
        skip_ws();
        if (peek() == '"') {
            std::string sv{};
            if (!read_string_(sv, err)) return false;
            out = std::move(sv);
            return true;
        }
        if (peek() == '[') {
            std::vector<std::string> items{};
            if (!read_array_(items, err)) return false;
            out = std::move(items);
            return true;
        }
        return read_bare_(out, err);
    }

private:
    bool read_string_(std::string& out, std::string& err) {
        ++pos_;
        while (pos_ < s_.size()) {
            const char c = s_[pos_++];
            if (c == '"') return true;
            if (c != '\\') {
                out.push_back(c);
                continue;
            }
            if (pos_ >= s_.size()) break;
            const char esc = s_[pos_++];
            switch (esc) {
                case 'n': out.push_back('\n'); break;
                case 't': out.push_back('\t'); break;
                default: out.push_back(esc); break;
            }
        }
        err = "unterminated string literal";
        return false;
    }

    bool read_array_(std::vector<std::string>& out, std::string& err) {
        ++pos_;
        if (eat(']')) return true;
        while (true) {
            skip_ws();
            if (peek() != '"') {
                err = "array values must be strings";
                return false;
            }
            std::string item{};
            if (!read_string_(item, err)) return false;
            out.push_back(std::move(item));

            if (eat(',')) {
                if (eat(']')) return true;
                continue;
            }
            if (eat(']')) return true;
            err = "expected ',' or ']' in array";
            return false;
        }
    }

    bool read_bare_(Value& out, std::string& err) {
        const size_t begin = pos_;
        while (pos_ < s_.size() && s_[pos_] != ' ' && s_[pos_] != '\t' && s_[pos_] != '#') ++pos_;
        const std::string_view word = s_.substr(begin, pos_ - begin);

        if (word == "true" || word == "false") {
            out = (word == "true");
            return true;
        }

        const char* first = word.data();
        const char* last = word.data() + word.size();
        if (!word.empty() && *first == '+') ++first;
        int64_t iv = 0;
        const auto [ptr, ec] = std::from_chars(first, last, iv);
        if (first != last && ec == std::errc{} && ptr == last) {
            out = iv;
            return true;
        }

        err = word.empty() ? "empty value" : "unsupported TOML value '" + std::string(word) + "'";
        return false;
    }

    std::string_view s_{};
    size_t pos_ = 0;
};

} // namespace

bool parse_text(std::string_view text,
                std::string_view source_name,
                FlatMap& out,
                std::vector<std::string>& warnings,
                std::string& err) {
    out.clear();
    err.clear();

    std::string section{};
    size_t line_no = 0;
    size_t begin = 0;
    while (begin <= text.size()) {
        size_t end = text.find('\n', begin);
        if (end == std::string_view::npos) end = text.size();
        const std::string_view line = text.substr(begin, end - begin);
        begin = end + 1;
        ++line_no;

        const std::string where = std::string(source_name) + ":" + std::to_string(line_no);
        LineCursor cur(line);
        if (cur.done()) continue;

        if (cur.eat('[')) {
            const auto name = cur.read_key();
            if (!cur.eat(']')) {
                err = where + ": invalid section header";
                return false;
            }
            if (name.empty() || !cur.done()) {
                err = where + ": invalid section name";
                return false;
            }
            section = std::string(name);
            continue;
        }

        const auto key = cur.read_key();
        if (key.empty()) {
            err = where + ": invalid key";
            return false;
        }
        if (!cur.eat('=')) {
            err = where + ": expected '='";
            return false;
        }

        Value value{};
        std::string value_err{};
        if (!cur.read_value(value, value_err)) {
            err = where + ": " + value_err;
            return false;
        }
        if (!cur.done()) {
            err = where + ": unexpected text after value";
            return false;
        }

        std::string full = section.empty() ? std::string(key) : section + "." + std::string(key);
        if (out.contains(full)) warnings.push_back(where + ": duplicate key '" + full + "', overriding");
        out[std::move(full)] = std::move(value);
    }
    return true;
}

bool parse_file(const std::filesystem::path& path,
                FlatMap& out,
                std::vector<std::string>& warnings,
                std::string& err) {
    out.clear();
    err.clear();
    if (path.empty()) return true;

    std::error_code ec{};
    if (!std::filesystem::exists(path, ec)) return true;
    if (!std::filesystem::is_regular_file(path, ec)) {
        err = "not a regular file: " + path.string();
        return false;
    }

    const auto r = os::read_text_file(path);
    if (!r.ok) {
        err = r.err;
        return false;
    }
    return parse_text(r.text, path.string(), out, warnings, err);
}

} // namespace planwise::config::toml_lite
