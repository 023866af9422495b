#ifndef __STRINGS_H__
#define __STRINGS_H__

#include <string>
#include <cstdint>
#include <vector>

class Strings {
public:
    static std::string hex(uint8_t v);
    static std::string hex(uint16_t v);

    static std::string lower(const std::string& s);
    static std::string trim(const std::string& s);
    static std::vector<std::string> split(const std::string& s, char delimiter = ' ');

    static bool parse_integer(const std::string& s, int32_t& out_value);
    // out_of_range is set when s is a well-formed number that does not fit.
    static bool parse_integer(const std::string& s, int64_t& out_value, bool* out_of_range = nullptr);
};

#endif//__STRINGS_H__
