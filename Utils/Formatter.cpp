#include "Formatter.h"
#include "Strings.h"
#include "Checksum.h"
#include <sstream>
#include <iomanip>

std::string Formatter::format_value(uint16_t value, Options::Format format) {
    std::stringstream ss;
    switch (format) {
        case Options::Format::Dec:
            ss << std::dec << value;
            break;
        case Options::Format::Python:
            ss << "0x" << std::hex << std::nouppercase << value;
            break;
        case Options::Format::Hex:
        default:
            ss << "$" << Strings::hex(value);
            break;
    }
    return ss.str();
}

std::string Formatter::format_result(const std::string& label, uint16_t checksum, const Options& options) {
    std::stringstream ss;
    ss << label << ":";
    if (options.print != Options::Print::Complement)
        ss << " sum " << format_value(checksum, options.format);
    if (options.print != Options::Print::Sum)
        ss << " complement " << format_value(Checksum::complement(checksum), options.format);
    if (options.hasExpected)
        ss << " " << format_expectation(checksum, options);
    return ss.str();
}

std::string Formatter::format_expectation(uint16_t checksum, const Options& options) {
    if (checksum == options.expected)
        return "OK";
    return "MISMATCH (expected " + format_value(options.expected, options.format) + ")";
}
