#ifndef __OPTIONS_H__
#define __OPTIONS_H__

#include <string>
#include <vector>
#include <cstdint>

#include "../Utils/Checksum.h"

struct Options {
    enum class ToolMode { Sum, Bytes, Unknown };
    enum class Print { Both, Sum, Complement };
    enum class Format { Hex, Dec, Python };

    ToolMode mode = ToolMode::Unknown;
    std::vector<std::string> inputs; // file paths for 'sum', byte literals for 'bytes'
    Checksum::Mode sumMode = Checksum::Mode::Byte;
    Checksum::OddBytePolicy oddBytes = Checksum::OddBytePolicy::Drop;
    uint64_t offset = 0;
    Print print = Print::Both;
    Format format = Format::Hex;
    bool hasExpected = false;
    uint16_t expected = 0;
    bool verbose = false;
};

#endif // __OPTIONS_H__
