#include "parse_utils.hpp"

#include <algorithm>
#include <cctype>
#include <climits>

namespace {

std::string lowercase(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

bool all_digits(const std::string& value) {
    return !value.empty() && std::all_of(value.begin(), value.end(), [](unsigned char c) {
        return std::isdigit(c) != 0;
    });
}

} // namespace

size_t parse_size_t(const std::string& value, size_t min, size_t max, bool& ok) {
    ok = false;
    if (!all_digits(value))
        return 0;
    try {
        unsigned long long v = std::stoull(value);
        if (v < min || v > max)
            return 0;
        ok = true;
        return static_cast<size_t>(v);
    } catch (const std::exception&) {
        return 0;
    }
}

size_t parse_bytes(const std::string& value, size_t min, size_t max, bool& ok) {
    ok = false;
    std::string val = lowercase(value);
    unsigned long long mult = 1;
    auto strip = [&](const std::string& suf, unsigned long long m) {
        if (val.size() > suf.size() &&
            val.compare(val.size() - suf.size(), suf.size(), suf) == 0) {
            val.erase(val.size() - suf.size());
            mult = m;
            return true;
        }
        return false;
    };
    const unsigned long long kib = 1024ull;
    strip("kb", kib) || strip("mb", kib * kib) || strip("gb", kib * kib * kib) ||
        strip("k", kib) || strip("m", kib * kib) || strip("g", kib * kib * kib) || strip("b", 1);
    if (!all_digits(val))
        return 0;
    unsigned long long base = 0;
    try {
        base = std::stoull(val);
    } catch (const std::exception&) {
        return 0;
    }
    if (base > ULLONG_MAX / mult)
        return 0;
    unsigned long long total = base * mult;
    if (total < min || total > max)
        return 0;
    ok = true;
    return static_cast<size_t>(total);
}

bool parse_bool(const std::string& value, bool& ok) {
    ok = true;
    const std::string v = lowercase(value);
    if (v.empty() || v == "1" || v == "true" || v == "yes" || v == "on")
        return true;
    if (v == "0" || v == "false" || v == "no" || v == "off")
        return false;
    ok = false;
    return false;
}
