#include "Strings.h"
#include <sstream>
#include <iomanip>
#include <charconv>
#include <algorithm>
#include <cctype>

std::string Strings::hex(uint8_t v) {
    std::stringstream ss;
    ss << std::hex << std::uppercase << std::setw(2) << std::setfill('0') << (int)v;
    return ss.str();
}

std::string Strings::hex(uint16_t v) {
    std::stringstream ss;
    ss << std::hex << std::uppercase << std::setw(4) << std::setfill('0') << (int)v;
    return ss.str();
}

std::string Strings::lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(), [](unsigned char c){ return std::tolower(c); });
    return result;
}

std::string Strings::trim(const std::string& s) {
    auto start = std::find_if(s.begin(), s.end(), [](unsigned char ch) { return !std::isspace(ch); });
    auto end = std::find_if(s.rbegin(), s.rend(), [](unsigned char ch) { return !std::isspace(ch); }).base();
    return (start < end) ? std::string(start, end) : "";
}

std::vector<std::string> Strings::split(const std::string& s, char delimiter) {
    std::vector<std::string> tokens;
    std::string token;
    std::istringstream tokenStream(s);
    while (std::getline(tokenStream, token, delimiter)) {
        if (!token.empty())
            tokens.push_back(token);
    }
    return tokens;
}

bool Strings::parse_integer(const std::string& s, int64_t& out_value, bool* out_of_range) {
    if (out_of_range)
        *out_of_range = false;
    std::string str = s;
    const char* whitespace = " \t";
    str.erase(0, str.find_first_not_of(whitespace));
    str.erase(str.find_last_not_of(whitespace) + 1);
    if (str.empty())
        return false;
    const char* start = str.data();
    const char* end = str.data() + str.size();
    bool is_negative = false;
    if (start < end && *start == '-') {
        is_negative = true;
        start++;
    } else if (start < end && *start == '+')
        start++;
    int base = 10;
    if ((end - start) > 2 && (*start == '0' && (*(start + 1) == 'x' || *(start + 1) == 'X'))) {
        start += 2;
        base = 16;
    } else if ((end - start) > 2 && (*start == '0' && (*(start + 1) == 'b' || *(start + 1) == 'B'))) {
        start += 2;
        base = 2;
    } else if ((end - start) > 1 && *start == '$') {
        start += 1;
        base = 16;
    } else if ((end - start) > 1 && *start == '%') {
        start += 1;
        base = 2;
    } else if ((end - start) > 0) {
        char last_char = *(end - 1);
        if (last_char == 'H' || last_char == 'h') {
            end -= 1;
            base = 16;
        } else if (last_char == 'B' || last_char == 'b') {
            end -= 1;
            base = 2;
        }
    }
    if (start == end)
        return false;
    uint64_t magnitude = 0;
    auto result = std::from_chars(start, end, magnitude, base);
    if (result.ptr != end)
        return false;
    const uint64_t limit = is_negative ? (uint64_t)INT64_MAX + 1 : (uint64_t)INT64_MAX;
    if (result.ec == std::errc::result_out_of_range || (result.ec == std::errc() && magnitude > limit)) {
        if (out_of_range)
            *out_of_range = true;
        return false;
    }
    if (result.ec != std::errc())
        return false;
    out_value = is_negative ? (int64_t)(0 - magnitude) : (int64_t)magnitude;
    return true;
}

bool Strings::parse_integer(const std::string& s, int32_t& out_value) {
    int64_t value = 0;
    if (!parse_integer(s, value) || value < INT32_MIN || value > INT32_MAX)
        return false;
    out_value = (int32_t)value;
    return true;
}
