#include <chatgate/core/json.hpp>
#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <cmath>

namespace chatgate {

namespace {

const Json& null_json() {
    static const Json null_value;
    return null_value;
}

const int MAX_DEPTH = 64;

} // namespace

// ============ Accessors ============

bool Json::as_bool(bool def) const {
    return type_ == BOOL ? bool_ : def;
}

double Json::as_number(double def) const {
    if (type_ == INTEGER) return static_cast<double>(int_);
    return type_ == NUMBER ? number_ : def;
}

int64_t Json::as_int(int64_t def) const {
    if (type_ == INTEGER) return int_;
    return type_ == NUMBER ? static_cast<int64_t>(number_) : def;
}

std::string Json::as_string(const std::string& def) const {
    return type_ == STRING ? string_ : def;
}

const Json::Array& Json::as_array() const {
    static const Array empty;
    return type_ == ARRAY ? array_ : empty;
}

const Json::Object& Json::as_object() const {
    static const Object empty;
    return type_ == OBJECT ? object_ : empty;
}

const Json& Json::operator[](const std::string& key) const {
    if (type_ != OBJECT) return null_json();
    Object::const_iterator it = object_.find(key);
    return it != object_.end() ? it->second : null_json();
}

const Json& Json::operator[](size_t idx) const {
    if (type_ != ARRAY || idx >= array_.size()) return null_json();
    return array_[idx];
}

Json& Json::operator[](const std::string& key) {
    if (type_ == NUL) {
        type_ = OBJECT;
    }
    if (type_ != OBJECT) {
        throw std::logic_error("Json: key access on non-object value");
    }
    return object_[key];
}

bool Json::contains(const std::string& key) const {
    return type_ == OBJECT && object_.find(key) != object_.end();
}

size_t Json::size() const {
    if (type_ == ARRAY) return array_.size();
    if (type_ == OBJECT) return object_.size();
    return 0;
}

// ============ Modifiers ============

void Json::push_back(const Json& value) {
    if (type_ != ARRAY) {
        type_ = ARRAY;
        array_.clear();
    }
    array_.push_back(value);
}

bool Json::erase(const std::string& key) {
    if (type_ != OBJECT) return false;
    return object_.erase(key) > 0;
}

// ============ Typed lookups ============

std::string Json::value(const std::string& key, const std::string& def) const {
    const Json& v = (*this)[key];
    return v.is_string() ? v.string_ : def;
}

std::string Json::value(const std::string& key, const char* def) const {
    return value(key, std::string(def ? def : ""));
}

int Json::value(const std::string& key, int def) const {
    const Json& v = (*this)[key];
    return v.is_number() ? static_cast<int>(v.as_int()) : def;
}

int64_t Json::value(const std::string& key, int64_t def) const {
    const Json& v = (*this)[key];
    return v.is_number() ? v.as_int() : def;
}

double Json::value(const std::string& key, double def) const {
    const Json& v = (*this)[key];
    return v.is_number() ? v.as_number() : def;
}

bool Json::value(const std::string& key, bool def) const {
    const Json& v = (*this)[key];
    return v.is_bool() ? v.bool_ : def;
}

Json Json::object() {
    Json j;
    j.type_ = OBJECT;
    return j;
}

Json Json::array() {
    Json j;
    j.type_ = ARRAY;
    return j;
}

// ============ Serialization ============

std::string Json::dump() const {
    std::ostringstream ss;
    dump_impl(ss);
    return ss.str();
}

void Json::dump_impl(std::ostringstream& ss) const {
    switch (type_) {
        case NUL:
            ss << "null";
            break;
        case BOOL:
            ss << (bool_ ? "true" : "false");
            break;
        case INTEGER:
            ss << int_;
            break;
        case NUMBER: {
            if (!std::isfinite(number_)) {
                ss << "null";
                break;
            }
            char buf[32];
            snprintf(buf, sizeof(buf), "%.17g", number_);
            ss << buf;
            break;
        }
        case STRING:
            ss << '"';
            escape_string(ss, string_);
            ss << '"';
            break;
        case ARRAY:
            ss << '[';
            for (size_t i = 0; i < array_.size(); ++i) {
                if (i > 0) ss << ',';
                array_[i].dump_impl(ss);
            }
            ss << ']';
            break;
        case OBJECT: {
            ss << '{';
            bool first = true;
            for (Object::const_iterator it = object_.begin(); it != object_.end(); ++it) {
                if (!first) ss << ',';
                first = false;
                ss << '"';
                escape_string(ss, it->first);
                ss << "\":";
                it->second.dump_impl(ss);
            }
            ss << '}';
            break;
        }
    }
}

void Json::escape_string(std::ostringstream& ss, const std::string& s) {
    for (size_t i = 0; i < s.size(); ++i) {
        char c = s[i];
        switch (c) {
            case '"': ss << "\\\""; break;
            case '\\': ss << "\\\\"; break;
            case '\b': ss << "\\b"; break;
            case '\f': ss << "\\f"; break;
            case '\n': ss << "\\n"; break;
            case '\r': ss << "\\r"; break;
            case '\t': ss << "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned char>(c));
                    ss << buf;
                } else {
                    ss << c;
                }
        }
    }
}

void Json::append_utf8(std::string& out, unsigned long cp) {
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

// ============ Parsing ============

Json Json::parse(const std::string& str) {
    size_t pos = 0;
    Json result = parse_value(str, pos, 0);
    skip_ws(str, pos);
    if (pos != str.size()) {
        throw JsonParseError("Unexpected trailing characters", pos);
    }
    return result;
}

void Json::skip_ws(const std::string& s, size_t& pos) {
    while (pos < s.size() && std::isspace(static_cast<unsigned char>(s[pos]))) pos++;
}

Json Json::parse_value(const std::string& s, size_t& pos, int depth) {
    if (depth > MAX_DEPTH) {
        throw JsonParseError("Nesting too deep", pos);
    }
    skip_ws(s, pos);
    if (pos >= s.size()) {
        throw JsonParseError("Unexpected end of input", pos);
    }

    char c = s[pos];
    if (c == 'n' || c == 't' || c == 'f') return parse_literal(s, pos);
    if (c == '"') return Json(parse_string(s, pos));
    if (c == '[') return parse_array(s, pos, depth + 1);
    if (c == '{') return parse_object(s, pos, depth + 1);
    if (c == '-' || std::isdigit(static_cast<unsigned char>(c))) return parse_number(s, pos);

    throw JsonParseError("Unexpected character", pos);
}

Json Json::parse_literal(const std::string& s, size_t& pos) {
    if (s.compare(pos, 4, "null") == 0) {
        pos += 4;
        return Json();
    }
    if (s.compare(pos, 4, "true") == 0) {
        pos += 4;
        return Json(true);
    }
    if (s.compare(pos, 5, "false") == 0) {
        pos += 5;
        return Json(false);
    }
    throw JsonParseError("Invalid literal", pos);
}

Json Json::parse_number(const std::string& s, size_t& pos) {
    size_t start = pos;
    bool is_float = false;
    if (s[pos] == '-') pos++;
    if (pos >= s.size() || !std::isdigit(static_cast<unsigned char>(s[pos]))) {
        throw JsonParseError("Invalid number", start);
    }
    while (pos < s.size() && std::isdigit(static_cast<unsigned char>(s[pos]))) pos++;
    if (pos < s.size() && s[pos] == '.') {
        is_float = true;
        pos++;
        while (pos < s.size() && std::isdigit(static_cast<unsigned char>(s[pos]))) pos++;
    }
    if (pos < s.size() && (s[pos] == 'e' || s[pos] == 'E')) {
        is_float = true;
        pos++;
        if (pos < s.size() && (s[pos] == '+' || s[pos] == '-')) pos++;
        while (pos < s.size() && std::isdigit(static_cast<unsigned char>(s[pos]))) pos++;
    }

    std::string text = s.substr(start, pos - start);
    if (!is_float && text.size() < 19) {
        return Json(static_cast<int64_t>(std::strtoll(text.c_str(), NULL, 10)));
    }
    return Json(std::strtod(text.c_str(), NULL));
}

std::string Json::parse_string(const std::string& s, size_t& pos) {
    size_t start = pos;
    pos++; // opening quote
    std::string result;
    while (pos < s.size() && s[pos] != '"') {
        if (s[pos] != '\\') {
            result += s[pos++];
            continue;
        }
        if (++pos >= s.size()) break;
        switch (s[pos]) {
            case '"': result += '"'; break;
            case '\\': result += '\\'; break;
            case '/': result += '/'; break;
            case 'b': result += '\b'; break;
            case 'f': result += '\f'; break;
            case 'n': result += '\n'; break;
            case 'r': result += '\r'; break;
            case 't': result += '\t'; break;
            case 'u': {
                if (pos + 4 >= s.size()) {
                    throw JsonParseError("Truncated unicode escape", pos);
                }
                unsigned long cp = std::strtoul(s.substr(pos + 1, 4).c_str(), NULL, 16);
                pos += 4;
                // Surrogate pair
                if (cp >= 0xD800 && cp <= 0xDBFF && pos + 6 < s.size() &&
                    s[pos + 1] == '\\' && s[pos + 2] == 'u') {
                    unsigned long low = std::strtoul(s.substr(pos + 3, 4).c_str(), NULL, 16);
                    if (low >= 0xDC00 && low <= 0xDFFF) {
                        cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
                        pos += 6;
                    }
                }
                append_utf8(result, cp);
                break;
            }
            default:
                throw JsonParseError("Invalid escape", pos);
        }
        pos++;
    }
    if (pos >= s.size()) {
        throw JsonParseError("Unterminated string", start);
    }
    pos++; // closing quote
    return result;
}

Json Json::parse_array(const std::string& s, size_t& pos, int depth) {
    pos++; // [
    Json arr = Json::array();
    skip_ws(s, pos);
    if (pos < s.size() && s[pos] == ']') {
        pos++;
        return arr;
    }
    while (true) {
        arr.array_.push_back(parse_value(s, pos, depth));
        skip_ws(s, pos);
        if (pos >= s.size()) {
            throw JsonParseError("Unterminated array", pos);
        }
        if (s[pos] == ']') {
            pos++;
            return arr;
        }
        if (s[pos] != ',') {
            throw JsonParseError("Expected ',' in array", pos);
        }
        pos++;
    }
}

Json Json::parse_object(const std::string& s, size_t& pos, int depth) {
    pos++; // {
    Json obj = Json::object();
    skip_ws(s, pos);
    if (pos < s.size() && s[pos] == '}') {
        pos++;
        return obj;
    }
    while (true) {
        skip_ws(s, pos);
        if (pos >= s.size() || s[pos] != '"') {
            throw JsonParseError("Expected object key", pos);
        }
        std::string key = parse_string(s, pos);
        skip_ws(s, pos);
        if (pos >= s.size() || s[pos] != ':') {
            throw JsonParseError("Expected ':' after key", pos);
        }
        pos++;
        obj.object_[key] = parse_value(s, pos, depth);
        skip_ws(s, pos);
        if (pos >= s.size()) {
            throw JsonParseError("Unterminated object", pos);
        }
        if (s[pos] == '}') {
            pos++;
            return obj;
        }
        if (s[pos] != ',') {
            throw JsonParseError("Expected ',' in object", pos);
        }
        pos++;
    }
}

} // namespace chatgate
