#pragma once
#include <string>
#include <vector>
#include <algorithm>
#include <cctype>
#include <cstdint>
#include <initializer_list>

namespace hybrid_agent {

// Request scrubber: blanks stray control bytes (and DEL) that break JSON parsing.
// Tab/LF/CR and UTF-8 sequences pass through.
inline std::string scrub_json_string(const std::string& str) {
    std::string out;
    out.reserve(str.size());
    for (unsigned char c : str) {
        if (c == 0x09 || c == 0x0A || c == 0x0D || (c >= 32 && c != 127)) {
            out += (char)c;
            continue;
        }
        out += ' ';
    }
    return out;
}

inline std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return (char)std::tolower(c); });
    return s;
}

inline std::string trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace((unsigned char)s[start])) start++;
    size_t end = s.size();
    while (end > start && std::isspace((unsigned char)s[end - 1])) end--;
    return s.substr(start, end - start);
}

inline bool contains_any(const std::string& haystack, std::initializer_list<const char*> needles) {
    for (const char* n : needles) {
        if (haystack.find(n) != std::string::npos) return true;
    }
    return false;
}

// Whitespace split, same semantics as str.split() without arguments
inline std::vector<std::string> split_words(const std::string& s) {
    std::vector<std::string> words;
    std::string current;
    for (unsigned char c : s) {
        if (std::isspace(c)) {
            if (!current.empty()) words.push_back(std::move(current));
            current.clear();
        } else {
            current += (char)c;
        }
    }
    if (!current.empty()) words.push_back(std::move(current));
    return words;
}

// First `max_chars` code points of a UTF-8 string, never splitting a sequence
inline std::string utf8_truncate(const std::string& str, size_t max_chars) {
    size_t chars = 0;
    size_t i = 0;
    while (i < str.size() && chars < max_chars) {
        unsigned char c = str[i];
        size_t len = 1;
        if ((c & 0xE0) == 0xC0) len = 2;
        else if ((c & 0xF0) == 0xE0) len = 3;
        else if ((c & 0xF8) == 0xF0) len = 4;
        if (i + len > str.size()) break;
        i += len;
        chars++;
    }
    return str.substr(0, i);
}

inline size_t utf8_length(const std::string& str) {
    size_t n = 0;
    for (unsigned char c : str) {
        if ((c & 0xC0) != 0x80) n++;
    }
    return n;
}

// Length-independent comparison for credentials
inline bool constant_time_equals(const std::string& a, const std::string& b) {
    size_t n = std::max(a.size(), b.size());
    unsigned char diff = a.size() == b.size() ? 0 : 1;
    for (size_t i = 0; i < n; ++i) {
        unsigned char ca = i < a.size() ? (unsigned char)a[i] : 0;
        unsigned char cb = i < b.size() ? (unsigned char)b[i] : 0;
        diff |= (unsigned char)(ca ^ cb);
    }
    return diff == 0;
}

// Decodes standard base64; returns false on invalid input
inline bool base64_decode(const std::string& in, std::string& out) {
    auto value = [](unsigned char c) -> int {
        if (c >= 'A' && c <= 'Z') return c - 'A';
        if (c >= 'a' && c <= 'z') return c - 'a' + 26;
        if (c >= '0' && c <= '9') return c - '0' + 52;
        if (c == '+') return 62;
        if (c == '/') return 63;
        return -1;
    };
    out.clear();
    uint32_t buffer = 0;
    int bits = 0;
    size_t padding = 0;
    for (unsigned char c : in) {
        if (c == '=') { padding++; continue; }
        if (padding > 0) return false;
        int v = value(c);
        if (v < 0) return false;
        buffer = (buffer << 6) | (uint32_t)v;
        bits += 6;
        if (bits >= 8) {
            bits -= 8;
            out += (char)((buffer >> bits) & 0xFF);
        }
    }
    return padding <= 2;
}

}
