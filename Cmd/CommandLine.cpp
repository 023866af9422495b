#include "CommandLine.h"
#include "Options.h"
#include "../Utils/Strings.h"
#include <stdexcept>
#include <iostream>
#include <cctype>

int64_t CommandLine::parse_number(const std::string& option, const std::string& value) {
    int64_t result = 0;
    if (!Strings::parse_integer(value, result))
        throw std::runtime_error("Invalid number '" + value + "' for option '" + option + "'.");
    return result;
}

bool CommandLine::parse(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage();
        return false;
    }
    std::string first_arg = argv[1];
    if (first_arg == "--help" || first_arg == "-h") {
        print_usage();
        return false;
    }
    if (first_arg == "--version") {
        std::cout << "romsum version 0.1.0" << std::endl;
        return false;
    }
    try {
        options = Options();
        if (argc < 3) {
            throw std::runtime_error("Invalid arguments. Command and inputs are required.");
    }
    std::string mode_str = argv[1];
    if (mode_str == "sum")
        options.mode = Options::ToolMode::Sum;
    else if (mode_str == "bytes")
        options.mode = Options::ToolMode::Bytes;
    else
        throw std::runtime_error("Unknown command: '" + mode_str + "'. Use 'sum' or 'bytes'.");
    for (int i = 2; i < argc; ++i) {
        std::string arg = argv[i];
        auto next_value = [&]() -> std::string {
            if (i + 1 >= argc)
                throw std::runtime_error("Missing value for option '" + arg + "'.");
            return argv[++i];
        };
        // Negative literals are values for 'bytes', not options.
        bool negative_literal = options.mode == Options::ToolMode::Bytes && arg.size() > 1 && arg[0] == '-' && std::isdigit((unsigned char)arg[1]);
        if (arg[0] == '-' && arg.size() > 1 && !negative_literal) {
            if (arg == "-v" || arg == "--verbose") options.verbose = true;
            else if (arg == "-s" || arg == "--strict") options.oddBytes = Checksum::OddBytePolicy::Strict;
            else if (arg == "-m" || arg == "--mode") {
                std::string m = Strings::lower(next_value());
                if (m == "byte") options.sumMode = Checksum::Mode::Byte;
                else if (m == "word") options.sumMode = Checksum::Mode::Word;
                else if (m == "mirror") options.sumMode = Checksum::Mode::Mirror;
                else throw std::runtime_error("Invalid mode: '" + m + "'. Use 'byte', 'word', or 'mirror'.");
            } else if (arg == "-p" || arg == "--print") {
                std::string p = Strings::lower(next_value());
                if (p == "both") options.print = Options::Print::Both;
                else if (p == "sum") options.print = Options::Print::Sum;
                else if (p == "complement") options.print = Options::Print::Complement;
                else throw std::runtime_error("Invalid print selection: '" + p + "'. Use 'both', 'sum', or 'complement'.");
            } else if (arg == "-f" || arg == "--format") {
                std::string f = Strings::lower(next_value());
                if (f == "hex") options.format = Options::Format::Hex;
                else if (f == "dec") options.format = Options::Format::Dec;
                else if (f == "py") options.format = Options::Format::Python;
                else throw std::runtime_error("Invalid format: '" + f + "'. Use 'hex', 'dec', or 'py'.");
            } else if (arg == "-e" || arg == "--expect") {
                std::string value = next_value();
                int64_t v = parse_number(arg, value);
                if (v < 0 || v > 0xFFFF)
                    throw std::runtime_error("Expected checksum out of range: " + value);
                options.expected = static_cast<uint16_t>(v);
                options.hasExpected = true;
            } else if ((arg == "-o" || arg == "--offset") && options.mode == Options::ToolMode::Sum) {
                std::string value = next_value();
                int64_t v = parse_number(arg, value);
                if (v < 0)
                    throw std::runtime_error("Offset cannot be negative: " + value);
                options.offset = static_cast<uint64_t>(v);
            } else
                throw std::runtime_error("Unknown argument '" + arg + "' for '" + mode_str + "' mode.");
        } else {
            options.inputs.push_back(arg);
        }
    }
    if (options.inputs.empty()) {
        throw std::runtime_error(options.mode == Options::ToolMode::Sum ? "No input file specified." : "No byte values specified.");
    }

    // Post-parsing validation
    if (options.mode == Options::ToolMode::Bytes && options.sumMode == Checksum::Mode::Mirror) {
        throw std::runtime_error("Mode 'mirror' applies to image files only.");
    }

    } catch (const std::exception& e) {
        std::cerr << "\nError: " << e.what() << std::endl;
        return false;
    }
    return true;
}

void CommandLine::print_usage() const {
    std::cerr << "romsum v0.1.0 - 16-bit additive checksums for cartridge images.\n\n"
              << "Usage: romsum <command> <inputs...> [options]\n"
              << "       romsum --help | --version\n\n"
              << "Commands:\n"
              << "  sum                Checksum one or more image files.\n"
              << "  bytes              Checksum byte values given as arguments (e.g. 0x01 $02 3).\n\n"
              << "Options:\n"
              << "  -m, --mode <m>       Accumulation: byte (default), word, mirror.\n"
              << "                       word pairs bytes as big-endian 16-bit words.\n"
              << "                       mirror counts a non power-of-two tail twice (sum only).\n"
              << "  -s, --strict         Fail on a trailing unpaired byte in word mode.\n"
              << "  -p, --print <what>   both (default), sum, complement.\n"
              << "  -f, --format <fmt>   hex (default), dec, py.\n"
              << "  -e, --expect <n>     Compare the checksum with n, exit with 1 on mismatch.\n"
              << "  -v, --verbose        Show mode, byte counts and warnings.\n\n"
              << "File Options (sum command):\n"
              << "  -o, --offset <n>     Skip the first n bytes of each file.\n";
}
