#include "parse_utils.hpp"
#include <algorithm>
#include <cctype>
#include <limits>
#include <stdexcept>

std::string trim(const std::string& value) {
    const char* ws = " \t\r\n\v\f";
    size_t begin = value.find_first_not_of(ws);
    if (begin == std::string::npos)
        return "";
    size_t end = value.find_last_not_of(ws);
    return value.substr(begin, end - begin + 1);
}

std::vector<std::string> split_list(const std::string& value) {
    std::vector<std::string> out;
    size_t start = 0;
    while (start <= value.size()) {
        size_t comma = value.find(',', start);
        if (comma == std::string::npos)
            comma = value.size();
        std::string item = trim(value.substr(start, comma - start));
        if (!item.empty())
            out.push_back(item);
        start = comma + 1;
    }
    return out;
}

bool parse_bool(const std::string& value, bool& ok) {
    std::string v = trim(value);
    std::transform(v.begin(), v.end(), v.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    ok = true;
    if (v.empty() || v == "1" || v == "true" || v == "yes" || v == "on")
        return true;
    if (v == "0" || v == "false" || v == "no" || v == "off")
        return false;
    ok = false;
    return false;
}

size_t parse_size_t(const std::string& value, size_t min, size_t max, bool& ok) {
    ok = false;
    if (value.empty() ||
        !std::all_of(value.begin(), value.end(), [](unsigned char c) { return std::isdigit(c); }))
        return 0;
    try {
        unsigned long long v = std::stoull(value);
        if (v < min || v > max)
            return 0;
        ok = true;
        return static_cast<size_t>(v);
    } catch (const std::out_of_range&) {
        return 0;
    }
}

size_t parse_bytes(const std::string& value, size_t min, size_t max, bool& ok) {
    ok = false;
    std::string val = trim(value);
    if (val.empty())
        return 0;
    std::transform(val.begin(), val.end(), val.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (val.back() == 'b')
        val.pop_back();
    unsigned long long mult = 1;
    if (!val.empty()) {
        switch (val.back()) {
        case 'k':
            mult = 1024ull;
            break;
        case 'm':
            mult = 1024ull * 1024;
            break;
        case 'g':
            mult = 1024ull * 1024 * 1024;
            break;
        default:
            break;
        }
        if (mult != 1)
            val.pop_back();
    }
    bool num_ok = false;
    size_t base = parse_size_t(val, 0, std::numeric_limits<size_t>::max(), num_ok);
    if (!num_ok)
        return 0;
    if (base > std::numeric_limits<size_t>::max() / mult)
        return 0;
    size_t bytes = static_cast<size_t>(base * mult);
    if (bytes < min || bytes > max)
        return 0;
    ok = true;
    return bytes;
}

bool is_valid_utf8(const std::string& value, size_t* bad_offset) {
    size_t i = 0;
    const size_t n = value.size();
    while (i < n) {
        unsigned char c = static_cast<unsigned char>(value[i]);
        size_t len = 0;
        unsigned char lo = 0x80, hi = 0xBF;
        if (c < 0x80) {
            ++i;
            continue;
        } else if (c >= 0xC2 && c <= 0xDF) {
            len = 2;
        } else if (c >= 0xE0 && c <= 0xEF) {
            len = 3;
            if (c == 0xE0)
                lo = 0xA0;
            else if (c == 0xED)
                hi = 0x9F;
        } else if (c >= 0xF0 && c <= 0xF4) {
            len = 4;
            if (c == 0xF0)
                lo = 0x90;
            else if (c == 0xF4)
                hi = 0x8F;
        }
        bool ok = len != 0 && i + len <= n;
        for (size_t k = 1; ok && k < len; ++k) {
            unsigned char cc = static_cast<unsigned char>(value[i + k]);
            if (k == 1 ? (cc < lo || cc > hi) : (cc < 0x80 || cc > 0xBF))
                ok = false;
        }
        if (!ok) {
            if (bad_offset)
                *bad_offset = i;
            return false;
        }
        i += len;
    }
    return true;
}
