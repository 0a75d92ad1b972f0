#pragma once
// Small JSON reader for config files and file manifests.
// Accepts objects, arrays, strings (with \uXXXX escapes), integers, bools and
// null. Fractional numbers are truncated to their integer part.

#include <string>
#include <unordered_map>
#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <vector>

namespace mini {

struct Value;
using Object = std::unordered_map<std::string, Value>;
using Array = std::vector<Value>;

struct Value {
    enum class Type { String, Number, Bool, Null, Object, Array } type{Type::Null};
    std::string str;
    int64_t number{0};
    bool boolean{false};
    Object object;
    Array array;
};

constexpr int kMaxDepth = 64;

inline void skip_ws(const std::string& s, size_t& i) {
    while (i < s.size() && std::isspace(static_cast<unsigned char>(s[i]))) i++;
}

inline void append_utf8(std::string& out, uint32_t cp) {
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

inline bool parse_hex4(const std::string& s, size_t& i, uint32_t& out) {
    if (i + 4 > s.size()) return false;
    out = 0;
    for (int k = 0; k < 4; ++k) {
        char c = s[i++];
        out <<= 4;
        if (c >= '0' && c <= '9') out |= static_cast<uint32_t>(c - '0');
        else if (c >= 'a' && c <= 'f') out |= static_cast<uint32_t>(c - 'a' + 10);
        else if (c >= 'A' && c <= 'F') out |= static_cast<uint32_t>(c - 'A' + 10);
        else return false;
    }
    return true;
}

inline bool parse_string(const std::string& s, size_t& i, std::string& out) {
    if (i >= s.size() || s[i] != '"') return false;
    i++; out.clear();
    while (i < s.size()) {
        char c = s[i++];
        if (c == '\\') {
            if (i >= s.size()) return false;
            char esc = s[i++];
            switch (esc) {
                case 'n': out.push_back('\n'); break;
                case 't': out.push_back('\t'); break;
                case 'r': out.push_back('\r'); break;
                case 'b': out.push_back('\b'); break;
                case 'f': out.push_back('\f'); break;
                case 'u': {
                    uint32_t cp = 0;
                    if (!parse_hex4(s, i, cp)) return false;
                    if (cp >= 0xD800 && cp <= 0xDBFF && i + 1 < s.size() && s[i] == '\\' && s[i + 1] == 'u') {
                        size_t save = i;
                        i += 2;
                        uint32_t lo = 0;
                        if (parse_hex4(s, i, lo) && lo >= 0xDC00 && lo <= 0xDFFF) {
                            cp = 0x10000 + ((cp - 0xD800) << 10) + (lo - 0xDC00);
                        } else {
                            i = save;
                        }
                    }
                    append_utf8(out, cp);
                    break;
                }
                default: out.push_back(esc); break; // \" \\ \/
            }
        } else if (c == '"') {
            return true;
        } else {
            out.push_back(c);
        }
    }
    return false;
}

inline bool parse_object(const std::string& s, size_t& i, Object& out, int depth); // fwd
inline bool parse_array(const std::string& s, size_t& i, Array& out, int depth);

inline bool parse_value(const std::string& s, size_t& i, Value& out, int depth = 0) {
    if (depth > kMaxDepth) return false;
    skip_ws(s, i);
    if (i >= s.size()) return false;
    if (s[i] == '"') {
        out.type = Value::Type::String;
        return parse_string(s, i, out.str);
    }
    if (std::isdigit(static_cast<unsigned char>(s[i])) || s[i] == '-') {
        size_t start = i;
        while (i < s.size()) {
            char c = s[i];
            if (std::isdigit(static_cast<unsigned char>(c)) || c=='-' || c=='+' || c=='.' || c=='e' || c=='E') {
                i++;
            } else break;
        }
        out.type = Value::Type::Number;
        out.number = std::strtoll(s.substr(start, i - start).c_str(), nullptr, 10);
        return true;
    }
    if (s.compare(i, 4, "true") == 0) {
        out.type = Value::Type::Bool; out.boolean = true; i += 4; return true;
    }
    if (s.compare(i, 5, "false") == 0) {
        out.type = Value::Type::Bool; out.boolean = false; i += 5; return true;
    }
    if (s.compare(i, 4, "null") == 0) {
        out.type = Value::Type::Null; i += 4; return true;
    }
    if (s[i] == '{') {
        out.type = Value::Type::Object;
        return parse_object(s, i, out.object, depth + 1);
    }
    if (s[i] == '[') {
        out.type = Value::Type::Array;
        return parse_array(s, i, out.array, depth + 1);
    }
    return false;
}

inline bool parse_object(const std::string& s, size_t& i, Object& out, int depth) {
    skip_ws(s, i);
    if (i >= s.size() || s[i] != '{') return false;
    i++;
    skip_ws(s, i);
    while (i < s.size() && s[i] != '}') {
        std::string key;
        if (!parse_string(s, i, key)) return false;
        skip_ws(s, i);
        if (i >= s.size() || s[i] != ':') return false;
        i++;
        Value v;
        if (!parse_value(s, i, v, depth)) return false;
        out[key] = std::move(v);
        skip_ws(s, i);
        if (i < s.size() && s[i] == ',') {
            i++;
            skip_ws(s, i);
        } else if (i < s.size() && s[i] != '}') {
            return false;
        }
    }
    if (i < s.size() && s[i] == '}') { i++; return true; }
    return false;
}

inline bool parse_array(const std::string& s, size_t& i, Array& out, int depth) {
    skip_ws(s, i);
    if (i >= s.size() || s[i] != '[') return false;
    i++;
    skip_ws(s, i);
    while (i < s.size() && s[i] != ']') {
        Value v;
        if (!parse_value(s, i, v, depth)) return false;
        out.push_back(std::move(v));
        skip_ws(s, i);
        if (i < s.size() && s[i] == ',') {
            i++;
            skip_ws(s, i);
        } else if (i < s.size() && s[i] != ']') {
            return false;
        }
    }
    if (i < s.size() && s[i] == ']') { i++; return true; }
    return false;
}

// Top-level object; anything but trailing whitespace after it is an error.
inline bool parse(const std::string& s, Object& out) {
    size_t i = 0;
    if (!parse_object(s, i, out, 0)) return false;
    skip_ws(s, i);
    return i == s.size();
}

inline bool parse(const std::string& s, Array& out) {
    size_t i = 0;
    if (!parse_array(s, i, out, 0)) return false;
    skip_ws(s, i);
    return i == s.size();
}

} // namespace mini
