#include <iostream>
#include <limits>
#include <string>
#include "net/MiniJson.h"

template <typename Fn>
static bool throws_json_error(Fn fn) {
    try {
        fn();
    } catch (const JsonError&) {
        return true;
    }
    return false;
}

int main() {
    if (json_escape_resp("a\"b\\c") != "a\\\"b\\\\c") { std::cerr << "quote/backslash escape\n"; return 1; }
    if (json_escape_resp("\n\t\r") != "\\n\\t\\r") { std::cerr << "control escape\n"; return 1; }
    if (json_escape_resp(std::string("\x01", 1)) != "\\u0001") { std::cerr << "low control escape\n"; return 1; }
    if (json_escape_resp("привет") != "привет") { std::cerr << "utf-8 must pass through\n"; return 1; }
    if (json_quote("x") != "\"x\"") { std::cerr << "json_quote\n"; return 1; }

    {
        auto doc = json_parse(R"( {"title":"standup","count":5,"neg":-3,"on":true,"none":null,
            "days":["mon",2],"nested":{"id":"T-1"}} )");
        if (!doc.is_object()) { std::cerr << "document not an object\n"; return 1; }
        if (doc.find("title")->as_string("title") != "standup") { std::cerr << "string member\n"; return 1; }
        if (doc.find("count")->as_int("count") != 5 || doc.find("neg")->as_int("neg") != -3) { std::cerr << "int members\n"; return 1; }
        if (!doc.find("on")->as_bool("on") || !doc.find("none")->is_null()) { std::cerr << "literal members\n"; return 1; }
        const auto& days = doc.find("days")->as_array("days");
        if (days.size() != 2 || days[0].as_string("d") != "mon" || days[1].as_int("d") != 2) { std::cerr << "array member\n"; return 1; }
        if (doc.find("nested")->find("id")->as_string("id") != "T-1") { std::cerr << "nested object\n"; return 1; }
        if (doc.find("missing") != nullptr || days[0].find("x") != nullptr) { std::cerr << "find on absent key\n"; return 1; }
    }
    {
        auto s = json_parse(R"("a\"b\\c\/d\n\u00e9\u20ac")");
        if (s.as_string("s") != "a\"b\\c/d\n\xc3\xa9\xe2\x82\xac") { std::cerr << "string escapes decoded wrong\n"; return 1; }
    }
    if (!json_parse("[]").as_array("a").empty() || !json_parse("{}").as_object("o").empty()) { std::cerr << "empty containers\n"; return 1; }

    // type mismatches name the member
    {
        auto doc = json_parse(R"({"interval":"two","big":99999999999999999999,"ratio":1.5})");
        try {
            doc.find("interval")->as_int("interval");
            std::cerr << "string accepted as int\n"; return 1;
        } catch (const JsonError& e) {
            if (std::string(e.what()).find("interval") == std::string::npos) { std::cerr << "error lacks member name\n"; return 1; }
        }
        if (!throws_json_error([&] { doc.find("big")->as_int("big"); })) { std::cerr << "overflow accepted\n"; return 1; }
        if (!throws_json_error([&] { doc.find("ratio")->as_int("ratio"); })) { std::cerr << "fraction accepted as int\n"; return 1; }
        if (!throws_json_error([&] { doc.as_array("doc"); })) { std::cerr << "object accepted as array\n"; return 1; }
    }

    const char* bad[] = {"", "{", "[1,", "{\"a\" 1}", "{a:1}", "{\"a\":1,}", "[1 2]", "\"open", "tru", "-",
                         "{\"a\":1} x", "\"\\x\"", "\"\\u12g4\"", "\"tab\there\""};
    for (const char* b : bad) {
        if (!throws_json_error([&] { json_parse(b); })) { std::cerr << "accepted malformed json: " << b << "\n"; return 1; }
    }
    {
        std::string deep(40, '[');
        deep += std::string(40, ']');
        if (!throws_json_error([&] { json_parse(deep); })) { std::cerr << "unbounded nesting\n"; return 1; }
        std::string ok(20, '[');
        ok += std::string(20, ']');
        json_parse(ok);
    }

    if (parse_int64_strict_sv("42").value_or(0) != 42) { std::cerr << "parse_int64_strict_sv 42\n"; return 1; }
    if (parse_int64_strict_sv("-9223372036854775808") != std::numeric_limits<int64_t>::min()) { std::cerr << "int64 min\n"; return 1; }
    if (parse_int64_strict_sv("9223372036854775808").has_value()) { std::cerr << "int64 overflow\n"; return 1; }
    if (parse_int64_strict_sv("").has_value() || parse_int64_strict_sv("-").has_value() || parse_int64_strict_sv("1a").has_value()) {
        std::cerr << "int64 garbage\n"; return 1;
    }
    if (parse_int_strict_sv("3000000000").has_value()) { std::cerr << "int overflow\n"; return 1; }

    std::cout << "minijson_unit ok\n";
    return 0;
}
