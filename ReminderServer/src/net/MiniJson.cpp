#include "MiniJson.h"
#include <stdexcept>
#include <cctype>
#include <vector>

namespace {

// start points to the first character after the opening '"'; returns decoded value and closing index
std::pair<std::string,size_t> decode_string(const std::string& js, size_t start) {
    const size_t n = js.size();
    std::string out;
    size_t i = start;
    for (;; ++i) {
        if (i >= n) throw std::runtime_error("unterminated json string");
        char c = js[i];
        if (c == '"') return {out, i};
        if (c == '\\') {
            if (i + 1 >= n) throw std::runtime_error("unterminated escape in json string");
            char e = js[i+1];
            switch (e) {
                case '"': out.push_back('"'); break;
                case '\\': out.push_back('\\'); break;
                case 'n': out.push_back('\n'); break;
                case 'r': out.push_back('\r'); break;
                case 't': out.push_back('\t'); break;
                case '/': out.push_back('/'); break;
                case 'b': out.push_back('\b'); break;
                case 'f': out.push_back('\f'); break;
                case 'u': {
                    // BMP only
                    if (i + 5 >= n) throw std::runtime_error("invalid unicode escape in json string");
                    int code = 0;
                    for (size_t k = i+2; k <= i+5; ++k) {
                        char ch = js[k];
                        code <<= 4;
                        if (ch >= '0' && ch <= '9') code += ch - '0';
                        else if (ch >= 'a' && ch <= 'f') code += 10 + (ch - 'a');
                        else if (ch >= 'A' && ch <= 'F') code += 10 + (ch - 'A');
                        else throw std::runtime_error("invalid hex in unicode escape");
                    }
                    if (code <= 0x7f) out.push_back((char)code);
                    else if (code <= 0x7ff) {
                        out.push_back((char)(0xc0 | ((code >> 6) & 0x1f)));
                        out.push_back((char)(0x80 | (code & 0x3f)));
                    } else {
                        out.push_back((char)(0xe0 | ((code >> 12) & 0x0f)));
                        out.push_back((char)(0x80 | ((code >> 6) & 0x3f)));
                        out.push_back((char)(0x80 | (code & 0x3f)));
                    }
                    i += 4;
                    break;
                }
                default: throw std::runtime_error("unsupported escape in json string");
            }
            ++i;
            continue;
        }
        out.push_back(c);
    }
}

// Position of the first non-space character of the value for `key` in the top-level object,
// or npos when the key is absent.
size_t find_value(const std::string& js, const std::string& key) {
    const size_t n = js.size();
    std::vector<char> stack;
    for (size_t i = 0; i < n; ++i) {
        char c = js[i];
        if (c == '"') {
            auto dec = decode_string(js, i+1);
            size_t closing = dec.second;

            size_t before = i;
            while (before > 0 && isspace((unsigned char)js[before-1])) --before;
            bool prev_obj_or_comma = (before > 0 && (js[before-1] == '{' || js[before-1] == ','));

            size_t after = closing + 1;
            while (after < n && isspace((unsigned char)js[after])) ++after;

            bool top_object = (stack.size() == 1 && stack.back() == '{');
            if (top_object && prev_obj_or_comma) {
                if (after >= n || js[after] != ':') throw std::runtime_error("missing ':' after object key");
                if (dec.first == key) {
                    size_t valpos = after + 1;
                    while (valpos < n && isspace((unsigned char)js[valpos])) ++valpos;
                    if (valpos >= n) throw std::runtime_error("missing value for key");
                    return valpos;
                }
            }
            i = closing;
            continue;
        }
        if (c == '{' || c == '[') stack.push_back(c);
        else if (c == '}' || c == ']') { if (!stack.empty()) stack.pop_back(); }
    }
    return std::string::npos;
}

bool is_null_at(const std::string& js, size_t pos) {
    return js.compare(pos, 4, "null") == 0;
}

int64_t parse_int_at(const std::string& js, size_t valpos) {
    const size_t n = js.size();
    size_t end = valpos; if (end < n && js[end] == '-') ++end; while (end < n && js[end] >= '0' && js[end] <= '9') ++end;
    if (end == valpos || (end == valpos+1 && js[valpos] == '-')) throw std::runtime_error("invalid json int");
    size_t after_tok = end; while (after_tok < n && isspace((unsigned char)js[after_tok])) ++after_tok;
    if (after_tok >= n || (js[after_tok] != ',' && js[after_tok] != '}')) throw std::runtime_error("invalid json int terminator");
    auto parsed = parse_int64_strict_sv(std::string_view(js).substr(valpos, end - valpos));
    if (!parsed.has_value()) throw std::runtime_error("invalid json int value");
    return *parsed;
}

}

std::pair<bool, std::optional<std::string>> json_extract_string_opt_present(const std::string& js, const std::string& key) {
    size_t valpos = find_value(js, key);
    if (valpos == std::string::npos) return {false, std::nullopt};
    if (is_null_at(js, valpos)) return {true, std::nullopt};
    if (js[valpos] != '"') throw std::runtime_error("invalid type for json string field");
    return {true, decode_string(js, valpos+1).first};
}

std::pair<bool,std::string> json_extract_string_present(const std::string& js, const std::string& key) {
    auto p = json_extract_string_opt_present(js, key);
    if (!p.first) return {false, std::string()};
    if (!p.second.has_value()) return {true, std::string()};
    return {true, p.second.value()};
}

// empty string on not-found or explicit null
std::string json_extract_string(const std::string& js, const std::string& key) {
    auto pr = json_extract_string_opt_present(js, key);
    if (!pr.first || !pr.second.has_value()) return std::string();
    return pr.second.value();
}

std::pair<bool,int64_t> json_extract_int_present(const std::string& js, const std::string& key) {
    size_t valpos = find_value(js, key);
    if (valpos == std::string::npos) return {false, 0};
    if (is_null_at(js, valpos)) throw std::runtime_error("null not allowed for integer field");
    return {true, parse_int_at(js, valpos)};
}

std::optional<int64_t> json_extract_int_opt(const std::string& js, const std::string& key) {
    size_t valpos = find_value(js, key);
    if (valpos == std::string::npos || is_null_at(js, valpos)) return std::nullopt;
    return parse_int_at(js, valpos);
}

// escapes control chars < 0x20 with \u00XX
std::string json_escape_resp(const std::string& s) {
    static const char* hex = "0123456789ABCDEF";
    std::string out; out.reserve(s.size()+8);
    for (unsigned char uc : s) {
        if (uc == '"') { out += "\\\""; }
        else if (uc == '\\') { out += "\\\\"; }
        else if (uc == '\n') { out += "\\n"; }
        else if (uc == '\r') { out += "\\r"; }
        else if (uc == '\t') { out += "\\t"; }
        else if (uc < 0x20) {
            out.push_back('\\'); out.push_back('u'); out.push_back('0'); out.push_back('0');
            out.push_back(hex[(uc >> 4) & 0xF]); out.push_back(hex[uc & 0xF]);
        } else out.push_back((char)uc);
    }
    return out;
}

std::string json_quote(const std::string& s) {
    return "\"" + json_escape_resp(s) + "\"";
}
