#ifndef CHATGATE_CORE_JSON_HPP
#define CHATGATE_CORE_JSON_HPP

// Small JSON value type used for payloads, config and HTTP bodies.
// Integers are kept exact (int64) so that sequence numbers and
// millisecond timestamps survive a dump/parse cycle.

#include <string>
#include <vector>
#include <map>
#include <sstream>
#include <stdexcept>
#include <cstdint>

namespace chatgate {

class JsonParseError : public std::runtime_error {
public:
    JsonParseError(const std::string& what, size_t pos)
        : std::runtime_error(what + " at position " + std::to_string(pos)), pos_(pos) {}
    size_t position() const { return pos_; }
private:
    size_t pos_;
};

class Json {
public:
    enum Type { NUL, BOOL, INTEGER, NUMBER, STRING, ARRAY, OBJECT };

    typedef std::vector<Json> Array;
    typedef std::map<std::string, Json> Object;

    Json() : type_(NUL), bool_(false), int_(0), number_(0) {}
    Json(bool b) : type_(BOOL), bool_(b), int_(0), number_(0) {}
    Json(int n) : type_(INTEGER), bool_(false), int_(n), number_(n) {}
    Json(int64_t n) : type_(INTEGER), bool_(false), int_(n), number_(static_cast<double>(n)) {}
    Json(double n) : type_(NUMBER), bool_(false), int_(static_cast<int64_t>(n)), number_(n) {}
    Json(const char* s) : type_(STRING), bool_(false), int_(0), number_(0), string_(s) {}
    Json(const std::string& s) : type_(STRING), bool_(false), int_(0), number_(0), string_(s) {}
    Json(const Array& arr) : type_(ARRAY), bool_(false), int_(0), number_(0), array_(arr) {}
    Json(const Object& obj) : type_(OBJECT), bool_(false), int_(0), number_(0), object_(obj) {}

    Type type() const { return type_; }
    bool is_null() const { return type_ == NUL; }
    bool is_bool() const { return type_ == BOOL; }
    bool is_number() const { return type_ == INTEGER || type_ == NUMBER; }
    bool is_integer() const { return type_ == INTEGER; }
    bool is_string() const { return type_ == STRING; }
    bool is_array() const { return type_ == ARRAY; }
    bool is_object() const { return type_ == OBJECT; }

    bool as_bool(bool def = false) const;
    double as_number(double def = 0) const;
    int64_t as_int(int64_t def = 0) const;
    std::string as_string(const std::string& def = "") const;
    const Array& as_array() const;
    const Object& as_object() const;

    // Lookups on a missing key or index yield a shared null value
    const Json& operator[](const std::string& key) const;
    const Json& operator[](const char* key) const { return (*this)[std::string(key)]; }
    const Json& operator[](size_t idx) const;

    // Turns a null value into an object and inserts the key if absent
    Json& operator[](const std::string& key);
    Json& operator[](const char* key) { return (*this)[std::string(key)]; }

    bool contains(const std::string& key) const;
    size_t size() const;
    bool empty() const { return size() == 0; }

    void push_back(const Json& value);
    bool erase(const std::string& key);

    // Typed lookups with a fallback when the key is absent or of another type
    std::string value(const std::string& key, const std::string& def) const;
    std::string value(const std::string& key, const char* def) const;
    int value(const std::string& key, int def) const;
    int64_t value(const std::string& key, int64_t def) const;
    double value(const std::string& key, double def) const;
    bool value(const std::string& key, bool def) const;

    static Json object();
    static Json array();

    std::string dump() const;

    // Throws JsonParseError on malformed input or trailing garbage
    static Json parse(const std::string& str);

private:
    Type type_;
    bool bool_;
    int64_t int_;
    double number_;
    std::string string_;
    Array array_;
    Object object_;

    void dump_impl(std::ostringstream& ss) const;
    static void escape_string(std::ostringstream& ss, const std::string& s);
    static void append_utf8(std::string& out, unsigned long cp);

    static void skip_ws(const std::string& s, size_t& pos);
    static Json parse_value(const std::string& s, size_t& pos, int depth);
    static Json parse_literal(const std::string& s, size_t& pos);
    static Json parse_number(const std::string& s, size_t& pos);
    static std::string parse_string(const std::string& s, size_t& pos);
    static Json parse_array(const std::string& s, size_t& pos, int depth);
    static Json parse_object(const std::string& s, size_t& pos, int depth);
};

} // namespace chatgate

#endif // CHATGATE_CORE_JSON_HPP
