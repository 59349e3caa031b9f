#include <planwise/json/Json.hpp>

#include <cstdio>
#include <cstdlib>

namespace planwise::json {

namespace {

bool is_space(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r';
}

bool is_digit(char c) {
    return c >= '0' && c <= '9';
}

int hex_digit(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

void put_utf8(std::string& out, uint32_t cp) {
    if (cp < 0x80) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

/// Single-pass reader over a whole document. On failure `pos()` is the
/// offset where reading stopped.
class Reader {
public:
    explicit Reader(std::string_view src) : src_(src) {}

    bool document(Value& out) {
        if (!value_(out)) return false;
        skip_();
        return pos_ == src_.size();
    }

    size_t pos() const { return pos_; }

private:
    void skip_() {
        while (pos_ < src_.size() && is_space(src_[pos_])) ++pos_;
    }

    bool at_(char c) {
        skip_();
        return pos_ < src_.size() && src_[pos_] == c;
    }

    bool take_(std::string_view word) {
        if (src_.substr(pos_, word.size()) != word) return false;
        pos_ += word.size();
        return true;
    }

    bool value_(Value& out) {
        skip_();
        if (pos_ >= src_.size()) return false;

        out = Value{};
        switch (src_[pos_]) {
            case '{': return object_(out);
            case '[': return array_(out);
            case '"':
                out.kind = Value::Kind::kString;
                return string_(out.string_v);
            case 't':
                out.kind = Value::Kind::kBool;
                out.bool_v = true;
                return take_("true");
            case 'f':
                out.kind = Value::Kind::kBool;
                return take_("false");
            case 'n':
                return take_("null");
            default:
                out.kind = Value::Kind::kNumber;
                return number_(out.number_v);
        }
    }

    bool skip_if_(char c) {
        if (pos_ >= src_.size() || src_[pos_] != c) return false;
        ++pos_;
        return true;
    }

    bool number_(double& out) {
        const size_t begin = pos_;
        auto digits = [&] {
            const size_t from = pos_;
            while (pos_ < src_.size() && is_digit(src_[pos_])) ++pos_;
            return pos_ > from;
        };

        skip_if_('-');
        if (!skip_if_('0') && !digits()) return false;
        if (skip_if_('.') && !digits()) return false;
        if (skip_if_('e') || skip_if_('E')) {
            if (!skip_if_('+')) skip_if_('-');
            if (!digits()) return false;
        }

        const std::string text(src_.substr(begin, pos_ - begin));
        out = std::strtod(text.c_str(), nullptr);
        return true;
    }

    bool hex4_(uint32_t& out) {
        if (pos_ + 4 > src_.size()) return false;
        out = 0;
        for (size_t i = 0; i < 4; ++i) {
            const int d = hex_digit(src_[pos_ + i]);
            if (d < 0) return false;
            out = out * 16 + static_cast<uint32_t>(d);
        }
        pos_ += 4;
        return true;
    }

    bool escape_(std::string& out) {
        if (pos_ >= src_.size()) return false;
        const char e = src_[pos_++];
        switch (e) {
            case '"':
            case '\\':
            case '/': out.push_back(e); return true;
            case 'b': out.push_back('\b'); return true;
            case 'f': out.push_back('\f'); return true;
            case 'n': out.push_back('\n'); return true;
            case 'r': out.push_back('\r'); return true;
            case 't': out.push_back('\t'); return true;
            case 'u': break;
            default: return false;
        }

        uint32_t cp = 0;
        if (!hex4_(cp)) return false;
        // Surrogates are only valid as a high/low pair.
        if (cp >= 0xDC00 && cp <= 0xDFFF) return false;
        if (cp >= 0xD800 && cp <= 0xDBFF) {
            uint32_t lo = 0;
            if (!take_("\\u") || !hex4_(lo)) return false;
            if (lo < 0xDC00 || lo > 0xDFFF) return false;
            cp = 0x10000 + ((cp - 0xD800) << 10) + (lo - 0xDC00);
        }
        put_utf8(out, cp);
        return true;
    }

    bool string_(std::string& out) {
        if (!take_("\"")) return false;
        while (pos_ < src_.size()) {
            const char c = src_[pos_++];
            if (c == '"') return true;
            if (c == '\\') {
                if (!escape_(out)) return false;
            } else {
                out.push_back(c);
            }
        }
        return false;
    }

    // Shared body of arrays and objects: `open item (, item)* close`.
    template <typename Item>
    bool sequence_(char open, char close, Item item) {
        if (!at_(open)) return false;
        ++pos_;
        if (at_(close)) {
            ++pos_;
            return true;
        }
        while (true) {
            if (!item()) return false;
            if (at_(',')) {
                ++pos_;
                continue;
            }
            if (at_(close)) {
                ++pos_;
                return true;
            }
            return false;
        }
    }

    bool array_(Value& out) {
        out.kind = Value::Kind::kArray;
        return sequence_('[', ']', [&] {
            Value elem{};
            if (!value_(elem)) return false;
            out.array_v.push_back(std::move(elem));
            return true;
        });
    }

    bool object_(Value& out) {
        out.kind = Value::Kind::kObject;
        return sequence_('{', '}', [&] {
            std::string key{};
            skip_();
            if (!string_(key) || !at_(':')) return false;
            ++pos_;
            Value member{};
            if (!value_(member)) return false;
            out.object_v.insert_or_assign(std::move(key), std::move(member));
            return true;
        });
    }

    std::string_view src_{};
    size_t pos_ = 0;
};

} // namespace

ParseResult parse(std::string_view src) {
    ParseResult r{};
    Reader reader(src);
    r.ok = reader.document(r.value);
    if (!r.ok) {
        r.value = Value{};
        r.error_offset = reader.pos();
    }
    return r;
}

const Value* get(const Value& obj, std::string_view key) {
    if (!obj.is_object()) return nullptr;
    const auto it = obj.object_v.find(std::string(key));
    return it == obj.object_v.end() ? nullptr : &it->second;
}

std::optional<std::string_view> as_string(const Value* v) {
    if (v == nullptr || !v->is_string()) return std::nullopt;
    return std::string_view(v->string_v);
}

std::optional<std::string> get_string(const Value& obj, std::string_view key) {
    const auto s = as_string(get(obj, key));
    if (!s) return std::nullopt;
    return std::string(*s);
}

std::string escape(std::string_view s) {
    std::string out{};
    out.reserve(s.size() + 8);
    for (const char c : s) {
        switch (c) {
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8]{};
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(static_cast<unsigned char>(c)));
                    out += buf;
                } else {
                    out.push_back(c);
                }
                break;
        }
    }
    return out;
}

} // namespace planwise::json
