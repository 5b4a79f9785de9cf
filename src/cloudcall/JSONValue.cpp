//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: JSONValue.cpp
// Purpose: Minimalistic recursive JSON parser, serializer and lookup helpers
//==========================================================================================================

#include <cctype>
#include <cmath>
#include <iomanip>
#include <sstream>
#include <stdexcept>

#include "cloudcall/JSONValue.h"

namespace cloudcall {

//----------------------------------------------------------------------------------------------------------
// JSONValue special members (out-of-line definitions)
//----------------------------------------------------------------------------------------------------------
JSONValue::JSONValue() : value(nullptr) {}
JSONValue::JSONValue(const JSONValue&) = default;
JSONValue::JSONValue(JSONValue&&) = default;
JSONValue& JSONValue::operator=(const JSONValue&) = default;
JSONValue& JSONValue::operator=(JSONValue&&) = default;
JSONValue::~JSONValue() {}

JSONValue::JSONValue(std::nullptr_t) : value(nullptr) {}
JSONValue::JSONValue(bool v) : value(v) {}
JSONValue::JSONValue(int64_t v) : value(v) {}
JSONValue::JSONValue(double v) : value(v) {}
JSONValue::JSONValue(const char* s) : value(std::string(s ? s : "")) {}
JSONValue::JSONValue(const std::string& s) : value(s) {}
JSONValue::JSONValue(std::string&& s) : value(std::move(s)) {}
JSONValue::JSONValue(const Array& a) : value(a) {}
JSONValue::JSONValue(Array&& a) : value(std::move(a)) {}
JSONValue::JSONValue(const Object& o) : value(o) {}
JSONValue::JSONValue(Object&& o) : value(std::move(o)) {}

namespace {

struct JsonParser {
    const std::string& s;
    std::size_t i{0};

    explicit JsonParser(const std::string& str) : s(str) {}

    void skipWs() {
        while (i < s.size()) {
            char c = s[i];
            if (c == ' ' || c == '\t' || c == '\r' || c == '\n') { ++i; } else { break; }
        }
    }

    bool match(char c) {
        skipWs();
        if (i < s.size() && s[i] == c) { ++i; return true; }
        return false;
    }

    static void appendUtf8(std::string& out, unsigned int code) {
        if (code <= 0x7F) {
            out.push_back(static_cast<char>(code));
        } else if (code <= 0x7FF) {
            out.push_back(static_cast<char>(0xC0 | ((code >> 6) & 0x1F)));
            out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
        } else if (code <= 0xFFFF) {
            out.push_back(static_cast<char>(0xE0 | ((code >> 12) & 0x0F)));
            out.push_back(static_cast<char>(0x80 | ((code >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
        } else {
            out.push_back(static_cast<char>(0xF0 | ((code >> 18) & 0x07)));
            out.push_back(static_cast<char>(0x80 | ((code >> 12) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | ((code >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
        }
    }

    unsigned int parseHex4() {
        if (i + 4 > s.size()) throw std::runtime_error("Invalid unicode escape");
        unsigned int code = 0;
        for (std::size_t k = 0; k < 4; ++k) {
            char h = s[i++];
            code <<= 4;
            if (h >= '0' && h <= '9') code += static_cast<unsigned int>(h - '0');
            else if (h >= 'a' && h <= 'f') code += 10u + static_cast<unsigned int>(h - 'a');
            else if (h >= 'A' && h <= 'F') code += 10u + static_cast<unsigned int>(h - 'A');
            else throw std::runtime_error("Invalid hex in unicode escape");
        }
        return code;
    }

    std::string parseString() {
        skipWs();
        if (i >= s.size() || s[i] != '"') throw std::runtime_error("Expected '\"' at string start");
        ++i;
        std::string out;
        while (true) {
            if (i >= s.size()) throw std::runtime_error("Unterminated string");
            char c = s[i++];
            if (c == '"') break;
            if (c != '\\') { out.push_back(c); continue; }
            if (i >= s.size()) throw std::runtime_error("Invalid escape");
            char e = s[i++];
            switch (e) {
                case '"': out.push_back('"'); break;
                case '\\': out.push_back('\\'); break;
                case '/': out.push_back('/'); break;
                case 'b': out.push_back('\b'); break;
                case 'f': out.push_back('\f'); break;
                case 'n': out.push_back('\n'); break;
                case 'r': out.push_back('\r'); break;
                case 't': out.push_back('\t'); break;
                case 'u': {
                    unsigned int code = parseHex4();
                    // Surrogate pair
                    if (code >= 0xD800 && code <= 0xDBFF && i + 6 <= s.size() && s[i] == '\\' && s[i + 1] == 'u') {
                        i += 2;
                        unsigned int low = parseHex4();
                        code = 0x10000 + ((code - 0xD800) << 10) + (low - 0xDC00);
                    }
                    appendUtf8(out, code);
                    break;
                }
                default: throw std::runtime_error("Unknown escape");
            }
        }
        return out;
    }

    JSONValue parseNumber() {
        skipWs();
        std::size_t start = i;
        if (i < s.size() && s[i] == '-') ++i;
        while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
        bool isFloat = false;
        if (i < s.size() && s[i] == '.') {
            isFloat = true; ++i;
            while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
        }
        if (i < s.size() && (s[i] == 'e' || s[i] == 'E')) {
            isFloat = true; ++i;
            if (i < s.size() && (s[i] == '-' || s[i] == '+')) ++i;
            while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
        }
        std::string num = s.substr(start, i - start);
        if (num.empty() || num == "-") throw std::runtime_error("Invalid JSON value");
        try {
            if (!isFloat) {
                return JSONValue(static_cast<int64_t>(std::stoll(num)));
            }
            return JSONValue(std::stod(num));
        } catch (const std::out_of_range&) {
            return JSONValue(std::stod(num));
        }
    }

    JSONValue parseArray() {
        if (!match('[')) throw std::runtime_error("Expected '['");
        JSONValue::Array arr;
        if (match(']')) return JSONValue(std::move(arr));
        while (true) {
            arr.push_back(std::make_shared<JSONValue>(parseValue()));
            if (match(']')) break;
            if (!match(',')) throw std::runtime_error("Expected ',' in array");
        }
        return JSONValue(std::move(arr));
    }

    JSONValue parseObject() {
        if (!match('{')) throw std::runtime_error("Expected '{'");
        JSONValue::Object obj;
        if (match('}')) return JSONValue(std::move(obj));
        while (true) {
            std::string key = parseString();
            if (!match(':')) throw std::runtime_error("Expected ':' after key");
            obj[key] = std::make_shared<JSONValue>(parseValue());
            if (match('}')) break;
            if (!match(',')) throw std::runtime_error("Expected ',' in object");
        }
        return JSONValue(std::move(obj));
    }

    JSONValue parseValue() {
        skipWs();
        if (i >= s.size()) throw std::runtime_error("Unexpected end of JSON");
        char c = s[i];
        if (c == '"') return JSONValue(parseString());
        if (c == '{') return parseObject();
        if (c == '[') return parseArray();
        if (s.compare(i, 4, "true") == 0) { i += 4; return JSONValue(true); }
        if (s.compare(i, 5, "false") == 0) { i += 5; return JSONValue(false); }
        if (s.compare(i, 4, "null") == 0) { i += 4; return JSONValue(nullptr); }
        return parseNumber();
    }
};

void writeString(std::ostringstream& oss, const std::string& v) {
    oss << '"';
    for (char c : v) {
        switch (c) {
            case '"': oss << "\\\""; break;
            case '\\': oss << "\\\\"; break;
            case '\b': oss << "\\b"; break;
            case '\f': oss << "\\f"; break;
            case '\n': oss << "\\n"; break;
            case '\r': oss << "\\r"; break;
            case '\t': oss << "\\t"; break;
            default:
                if (c >= 0 && c < 32) {
                    oss << "\\u" << std::hex << std::setw(4) << std::setfill('0') << static_cast<int>(c) << std::dec;
                } else {
                    oss << c;
                }
                break;
        }
    }
    oss << '"';
}

void writeValue(std::ostringstream& oss, const JSONValue& value) {
    std::visit([&oss](const auto& v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::nullptr_t>) {
            oss << "null";
        } else if constexpr (std::is_same_v<T, bool>) {
            oss << (v ? "true" : "false");
        } else if constexpr (std::is_same_v<T, int64_t>) {
            oss << v;
        } else if constexpr (std::is_same_v<T, double>) {
            if (!std::isfinite(v)) { oss << "null"; return; }
            std::ostringstream num;
            num << std::setprecision(17) << v;
            oss << num.str();
        } else if constexpr (std::is_same_v<T, std::string>) {
            writeString(oss, v);
        } else if constexpr (std::is_same_v<T, JSONValue::Array>) {
            oss << '[';
            for (std::size_t k = 0; k < v.size(); ++k) {
                if (k > 0) oss << ',';
                if (v[k]) { writeValue(oss, *v[k]); } else { oss << "null"; }
            }
            oss << ']';
        } else if constexpr (std::is_same_v<T, JSONValue::Object>) {
            oss << '{';
            bool first = true;
            for (const auto& [key, member] : v) {
                if (!first) oss << ',';
                first = false;
                writeString(oss, key);
                oss << ':';
                if (member) { writeValue(oss, *member); } else { oss << "null"; }
            }
            oss << '}';
        }
    }, value.get());
}

} // namespace

JSONValue ParseJSON(const std::string& text) {
    JsonParser p(text);
    JSONValue v = p.parseValue();
    p.skipWs();
    if (p.i != text.size()) {
        throw std::runtime_error("Trailing characters after JSON document");
    }
    return v;
}

std::string SerializeJSON(const JSONValue& value) {
    std::ostringstream oss;
    writeValue(oss, value);
    return oss.str();
}

const JSONValue* FindMember(const JSONValue& v, const std::string& key) {
    if (!v.IsObject()) return nullptr;
    const auto& obj = std::get<JSONValue::Object>(v.value);
    auto it = obj.find(key);
    if (it == obj.end() || !it->second) return nullptr;
    return it->second.get();
}

const JSONValue* FindPath(const JSONValue& v, const std::string& dottedPath) {
    const JSONValue* cur = &v;
    std::size_t start = 0;
    while (cur && start <= dottedPath.size()) {
        std::size_t dot = dottedPath.find('.', start);
        std::string seg = dottedPath.substr(start, dot == std::string::npos ? std::string::npos : dot - start);
        cur = FindMember(*cur, seg);
        if (dot == std::string::npos) break;
        start = dot + 1;
    }
    return cur;
}

std::optional<std::string> GetString(const JSONValue& v, const std::string& key) {
    const JSONValue* m = FindMember(v, key);
    if (!m || !m->IsString()) return std::nullopt;
    return std::get<std::string>(m->value);
}

std::optional<bool> GetBool(const JSONValue& v, const std::string& key) {
    const JSONValue* m = FindMember(v, key);
    if (!m || !std::holds_alternative<bool>(m->value)) return std::nullopt;
    return std::get<bool>(m->value);
}

void SetMember(JSONValue& obj, const std::string& key, JSONValue value) {
    if (!obj.IsObject()) {
        obj.value = JSONValue::Object{};
    }
    std::get<JSONValue::Object>(obj.value)[key] = std::make_shared<JSONValue>(std::move(value));
}

void SetPath(JSONValue& obj, const std::string& dottedPath, JSONValue value) {
    std::size_t dot = dottedPath.find('.');
    if (dot == std::string::npos) {
        SetMember(obj, dottedPath, std::move(value));
        return;
    }
    const std::string head = dottedPath.substr(0, dot);
    JSONValue child;
    if (const JSONValue* existing = FindMember(obj, head)) {
        child = *existing;
    }
    SetPath(child, dottedPath.substr(dot + 1), std::move(value));
    SetMember(obj, head, std::move(child));
}

const char* TypeName(const JSONValue& v) {
    switch (v.value.index()) {
        case 0: return "null";
        case 1: return "boolean";
        case 2: return "integer";
        case 3: return "float";
        case 4: return "string";
        case 5: return "list";
        case 6: return "object";
        default: return "unknown";
    }
}

bool operator==(const JSONValue& a, const JSONValue& b) {
    if (a.value.index() != b.value.index()) return false;
    if (a.IsArray()) {
        const auto& x = std::get<JSONValue::Array>(a.value);
        const auto& y = std::get<JSONValue::Array>(b.value);
        if (x.size() != y.size()) return false;
        for (std::size_t k = 0; k < x.size(); ++k) {
            if (!x[k] || !y[k]) {
                if (x[k] != y[k]) return false;
                continue;
            }
            if (!(*x[k] == *y[k])) return false;
        }
        return true;
    }
    if (a.IsObject()) {
        const auto& x = std::get<JSONValue::Object>(a.value);
        const auto& y = std::get<JSONValue::Object>(b.value);
        if (x.size() != y.size()) return false;
        for (const auto& [k, xv] : x) {
            auto it = y.find(k);
            if (it == y.end()) return false;
            if (!xv || !it->second) {
                if (xv != it->second) return false;
                continue;
            }
            if (!(*xv == *it->second)) return false;
        }
        return true;
    }
    return std::visit([&b](const auto& xv) -> bool {
        using T = std::decay_t<decltype(xv)>;
        if constexpr (std::is_same_v<T, JSONValue::Array> || std::is_same_v<T, JSONValue::Object>) {
            return false;
        } else {
            return xv == std::get<T>(b.value);
        }
    }, a.value);
}

} // namespace cloudcall
