#ifndef __FORMATTER_H__
#define __FORMATTER_H__

#include <string>
#include <cstdint>
#include "../Cmd/Options.h"

class Formatter {
public:
    static std::string format_value(uint16_t value, Options::Format format);
    // "<label>: sum $8F2C complement $70D3" with the fields selected by print.
    static std::string format_result(const std::string& label, uint16_t checksum, const Options& options);
    static std::string format_expectation(uint16_t checksum, const Options& options);
};

#endif // __FORMATTER_H__
