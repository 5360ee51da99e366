#include "MiniJson.h"
#include <cctype>

namespace {

class Parser {
public:
    explicit Parser(std::string_view js) : js_(js) {}

    JsonValue parse_document() {
        JsonValue v = parse_value(0);
        skip_ws();
        if (pos_ != js_.size()) throw JsonError("trailing characters after json value");
        return v;
    }

private:
    static constexpr int kMaxDepth = 32;

    void skip_ws() {
        while (pos_ < js_.size() && std::isspace(static_cast<unsigned char>(js_[pos_]))) ++pos_;
    }

    char peek() {
        skip_ws();
        if (pos_ >= js_.size()) throw JsonError("unexpected end of json");
        return js_[pos_];
    }

    void expect(char c) {
        if (peek() != c) throw JsonError(std::string("expected '") + c + "' in json");
        ++pos_;
    }

    bool consume_literal(std::string_view lit) {
        if (js_.substr(pos_, lit.size()) != lit) return false;
        pos_ += lit.size();
        return true;
    }

    JsonValue parse_value(int depth) {
        if (depth > kMaxDepth) throw JsonError("json nested too deeply");
        char c = peek();
        if (c == '{') return parse_object(depth);
        if (c == '[') return parse_array(depth);
        if (c == '"') return JsonValue::make_string(parse_string());
        if (consume_literal("null")) return JsonValue();
        if (consume_literal("true")) return JsonValue::make_bool(true);
        if (consume_literal("false")) return JsonValue::make_bool(false);
        if (c == '-' || (c >= '0' && c <= '9')) return parse_number();
        throw JsonError("unexpected character in json");
    }

    JsonValue parse_object(int depth) {
        expect('{');
        JsonValue::Object obj;
        if (peek() == '}') { ++pos_; return JsonValue::make_object(std::move(obj)); }
        for (;;) {
            if (peek() != '"') throw JsonError("expected string key in json object");
            std::string key = parse_string();
            expect(':');
            obj[key] = parse_value(depth + 1);
            char c = peek();
            ++pos_;
            if (c == '}') break;
            if (c != ',') throw JsonError("expected ',' or '}' in json object");
        }
        return JsonValue::make_object(std::move(obj));
    }

    JsonValue parse_array(int depth) {
        expect('[');
        JsonValue::Array arr;
        if (peek() == ']') { ++pos_; return JsonValue::make_array(std::move(arr)); }
        for (;;) {
            arr.push_back(parse_value(depth + 1));
            char c = peek();
            ++pos_;
            if (c == ']') break;
            if (c != ',') throw JsonError("expected ',' or ']' in json array");
        }
        return JsonValue::make_array(std::move(arr));
    }

    JsonValue parse_number() {
        size_t start = pos_;
        if (js_[pos_] == '-') ++pos_;
        while (pos_ < js_.size()) {
            char c = js_[pos_];
            if ((c >= '0' && c <= '9') || c == '.' || c == 'e' || c == 'E' || c == '+' || c == '-') ++pos_;
            else break;
        }
        if (pos_ == start || (pos_ == start + 1 && js_[start] == '-')) throw JsonError("invalid json number");
        return JsonValue::make_number(std::string(js_.substr(start, pos_ - start)));
    }

    static int hex_digit(char ch) {
        if (ch >= '0' && ch <= '9') return ch - '0';
        if (ch >= 'a' && ch <= 'f') return 10 + (ch - 'a');
        if (ch >= 'A' && ch <= 'F') return 10 + (ch - 'A');
        throw JsonError("invalid hex in unicode escape");
    }

    std::string parse_string() {
        ++pos_; // opening quote
        std::string out;
        for (;;) {
            if (pos_ >= js_.size()) throw JsonError("unterminated json string");
            char c = js_[pos_++];
            if (c == '"') return out;
            if (static_cast<unsigned char>(c) < 0x20) throw JsonError("control character in json string");
            if (c != '\\') { out.push_back(c); continue; }
            if (pos_ >= js_.size()) throw JsonError("unterminated escape in json string");
            char e = js_[pos_++];
            switch (e) {
                case '"': out.push_back('"'); break;
                case '\\': out.push_back('\\'); break;
                case '/': out.push_back('/'); break;
                case 'n': out.push_back('\n'); break;
                case 'r': out.push_back('\r'); break;
                case 't': out.push_back('\t'); break;
                case 'b': out.push_back('\b'); break;
                case 'f': out.push_back('\f'); break;
                case 'u': {
                    // BMP only
                    if (pos_ + 4 > js_.size()) throw JsonError("invalid unicode escape in json string");
                    int code = 0;
                    for (size_t k = 0; k < 4; ++k) code = (code << 4) | hex_digit(js_[pos_ + k]);
                    pos_ += 4;
                    if (code <= 0x7f) out.push_back(static_cast<char>(code));
                    else if (code <= 0x7ff) {
                        out.push_back(static_cast<char>(0xc0 | ((code >> 6) & 0x1f)));
                        out.push_back(static_cast<char>(0x80 | (code & 0x3f)));
                    } else {
                        out.push_back(static_cast<char>(0xe0 | ((code >> 12) & 0x0f)));
                        out.push_back(static_cast<char>(0x80 | ((code >> 6) & 0x3f)));
                        out.push_back(static_cast<char>(0x80 | (code & 0x3f)));
                    }
                    break;
                }
                default: throw JsonError("unsupported escape in json string");
            }
        }
    }

    std::string_view js_;
    size_t pos_ = 0;
};

const char* kind_name(JsonValue::Kind k) {
    switch (k) {
        case JsonValue::Kind::Null: return "null";
        case JsonValue::Kind::Bool: return "boolean";
        case JsonValue::Kind::Number: return "number";
        case JsonValue::Kind::String: return "string";
        case JsonValue::Kind::Array: return "array";
        default: return "object";
    }
}

[[noreturn]] void type_error(const std::string& what, const char* expected, JsonValue::Kind got) {
    throw JsonError(what + ": expected " + expected + ", got " + kind_name(got));
}

}

JsonValue JsonValue::make_bool(bool b) {
    JsonValue v;
    v.kind_ = Kind::Bool;
    v.bool_ = b;
    return v;
}

JsonValue JsonValue::make_number(std::string literal) {
    JsonValue v;
    v.kind_ = Kind::Number;
    v.text_ = std::move(literal);
    return v;
}

JsonValue JsonValue::make_string(std::string s) {
    JsonValue v;
    v.kind_ = Kind::String;
    v.text_ = std::move(s);
    return v;
}

JsonValue JsonValue::make_array(Array a) {
    JsonValue v;
    v.kind_ = Kind::Array;
    v.array_ = std::make_shared<Array>(std::move(a));
    return v;
}

JsonValue JsonValue::make_object(Object o) {
    JsonValue v;
    v.kind_ = Kind::Object;
    v.object_ = std::make_shared<Object>(std::move(o));
    return v;
}

bool JsonValue::as_bool(const std::string& what) const {
    if (kind_ != Kind::Bool) type_error(what, "boolean", kind_);
    return bool_;
}

int64_t JsonValue::as_int(const std::string& what) const {
    if (kind_ != Kind::Number) type_error(what, "integer", kind_);
    auto v = parse_int64_strict_sv(text_);
    if (!v.has_value()) throw JsonError(what + ": expected integer, got " + text_);
    return *v;
}

const std::string& JsonValue::as_string(const std::string& what) const {
    if (kind_ != Kind::String) type_error(what, "string", kind_);
    return text_;
}

const JsonValue::Array& JsonValue::as_array(const std::string& what) const {
    if (kind_ != Kind::Array) type_error(what, "array", kind_);
    return *array_;
}

const JsonValue::Object& JsonValue::as_object(const std::string& what) const {
    if (kind_ != Kind::Object) type_error(what, "object", kind_);
    return *object_;
}

const JsonValue* JsonValue::find(const std::string& key) const {
    if (kind_ != Kind::Object) return nullptr;
    auto it = object_->find(key);
    return it == object_->end() ? nullptr : &it->second;
}

JsonValue json_parse(std::string_view js) {
    return Parser(js).parse_document();
}

std::string json_escape_resp(const std::string& s) {
    std::string out;
    out.reserve(s.size() + 8);
    for (unsigned char c : s) {
        switch (c) {
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            case '\b': out += "\\b"; break;
            case '\f': out += "\\f"; break;
            default:
                if (c < 0x20) {
                    static const char* hex = "0123456789abcdef";
                    out += "\\u00";
                    out.push_back(hex[c >> 4]);
                    out.push_back(hex[c & 0xf]);
                } else {
                    out.push_back(static_cast<char>(c));
                }
        }
    }
    return out;
}

std::string json_quote(const std::string& s) {
    return "\"" + json_escape_resp(s) + "\"";
}
