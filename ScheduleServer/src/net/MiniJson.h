#pragma once

#include <cstdint>
#include <limits>
#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

// Small JSON document model for request bodies. Parse errors throw JsonError.

class JsonError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class JsonValue {
public:
    enum class Kind { Null, Bool, Number, String, Array, Object };
    using Array = std::vector<JsonValue>;
    using Object = std::map<std::string, JsonValue>;

    JsonValue() = default;
    static JsonValue make_bool(bool b);
    static JsonValue make_number(std::string literal);
    static JsonValue make_string(std::string s);
    static JsonValue make_array(Array a);
    static JsonValue make_object(Object o);

    Kind kind() const { return kind_; }
    bool is_null() const { return kind_ == Kind::Null; }
    bool is_object() const { return kind_ == Kind::Object; }
    bool is_array() const { return kind_ == Kind::Array; }
    bool is_string() const { return kind_ == Kind::String; }

    // typed accessors throw JsonError naming `what` on a type mismatch
    bool as_bool(const std::string& what) const;
    int64_t as_int(const std::string& what) const;
    const std::string& as_string(const std::string& what) const;
    const Array& as_array(const std::string& what) const;
    const Object& as_object(const std::string& what) const;

    // member lookup on an object; nullptr when absent
    const JsonValue* find(const std::string& key) const;

private:
    Kind kind_ = Kind::Null;
    bool bool_ = false;
    std::string text_; // string value or number literal
    std::shared_ptr<Array> array_;
    std::shared_ptr<Object> object_;
};

JsonValue json_parse(std::string_view js);

std::string json_escape_resp(const std::string& s);
std::string json_quote(const std::string& s);

inline std::optional<int64_t> parse_int64_strict_sv(std::string_view s) {
    if (s.empty()) return std::nullopt;
    size_t i = 0;
    bool neg = false;
    if (s[i] == '-') { neg = true; ++i; }
    if (i >= s.size()) return std::nullopt;

    const uint64_t maxAbs = neg ? (uint64_t(std::numeric_limits<int64_t>::max()) + 1ULL) : uint64_t(std::numeric_limits<int64_t>::max());
    uint64_t v = 0;
    for (; i < s.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(s[i]);
        if (c < '0' || c > '9') return std::nullopt;
        uint64_t d = uint64_t(c - '0');
        if (v > (maxAbs - d) / 10) return std::nullopt;
        v = v * 10 + d;
    }

    if (!neg) return static_cast<int64_t>(v);
    if (v == (uint64_t(std::numeric_limits<int64_t>::max()) + 1ULL)) return std::numeric_limits<int64_t>::min();
    return -static_cast<int64_t>(v);
}

inline std::optional<int> parse_int_strict_sv(std::string_view s) {
    auto v = parse_int64_strict_sv(s);
    if (!v.has_value()) return std::nullopt;
    if (*v < std::numeric_limits<int>::min() || *v > std::numeric_limits<int>::max()) return std::nullopt;
    return static_cast<int>(*v);
}
