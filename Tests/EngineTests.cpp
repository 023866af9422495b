#include "EngineTests.h"
#include <vector>
#include <string>
#include <cassert>
#include <fstream>
#include <filesystem>
#include <iostream>
#include <sstream>
#include "../Cmd/CommandLine.h"
#include "../Core/Application.h"
#include "../Engines/BytesEngine.h"
#include "../Utils/Formatter.h"
#include "../Utils/Checksum.h"

struct RunResult {
    int code;
    std::string out;
    std::string err;
};

static RunResult run_tool(const std::vector<std::string>& args) {
    std::vector<char*> argv;
    for (const auto& arg : args)
        argv.push_back(const_cast<char*>(arg.c_str()));

    std::stringstream out_ss, err_ss;
    std::streambuf* old_cout = std::cout.rdbuf(out_ss.rdbuf());
    std::streambuf* old_cerr = std::cerr.rdbuf(err_ss.rdbuf());

    int code = 1;
    CommandLine cmd;
    if (cmd.parse((int)argv.size(), argv.data())) {
        Application app;
        code = app.run(cmd);
    }

    std::cout.rdbuf(old_cout);
    std::cerr.rdbuf(old_cerr);
    return {code, out_ss.str(), err_ss.str()};
}

static void write_file(const std::string& path, const std::vector<uint8_t>& data) {
    std::ofstream out(path, std::ios::binary);
    out.write(reinterpret_cast<const char*>(data.data()), data.size());
}

void test_sum_engine_byte() {
    write_file("engine_byte.sfc", { 0x12, 0x34, 0xFF });
    RunResult r = run_tool({"romsum", "sum", "engine_byte.sfc"});
    std::filesystem::remove("engine_byte.sfc");

    // 0x12 + 0x34 + 0xFF = 0x0145
    assert(r.code == 0);
    assert(r.out == "engine_byte.sfc: sum $0145 complement $FEBA\n");
    assert(r.err.empty());
}

void test_sum_engine_word_odd_warning() {
    write_file("engine_word.sfc", { 0x12, 0x34, 0xFF });
    RunResult r = run_tool({"romsum", "sum", "engine_word.sfc", "-m", "word", "-p", "sum"});
    std::filesystem::remove("engine_word.sfc");

    assert(r.code == 0);
    assert(r.out == "engine_word.sfc: sum $1234\n");
    assert(r.err.find("Warning:") != std::string::npos);
    assert(r.err.find("$FF") != std::string::npos);
}

void test_sum_engine_word_strict() {
    write_file("engine_strict.sfc", { 0x12, 0x34, 0xFF });
    RunResult r = run_tool({"romsum", "sum", "engine_strict.sfc", "-m", "word", "--strict"});
    std::filesystem::remove("engine_strict.sfc");

    assert(r.code == 1);
    assert(r.out.empty());
    assert(r.err.find("Error: Invalid input length") != std::string::npos);
}

void test_sum_engine_offset() {
    write_file("engine_offset.sfc", { 0xEE, 0xEE, 0x01, 0x02 });
    RunResult r = run_tool({"romsum", "sum", "engine_offset.sfc", "-o", "2", "-f", "dec", "-p", "sum", "-v"});
    std::filesystem::remove("engine_offset.sfc");

    assert(r.code == 0);
    assert(r.out.find("Reading engine_offset.sfc (4 bytes, skipping 2)") != std::string::npos);
    assert(r.out.find("byte mode, 2 bytes") != std::string::npos);
    assert(r.out.find("engine_offset.sfc: sum 3\n") != std::string::npos);
}

void test_sum_engine_expect() {
    write_file("engine_ok.sfc", { 0x01, 0x02 });
    write_file("engine_bad.sfc", { 0x01, 0x03 });

    RunResult ok = run_tool({"romsum", "sum", "engine_ok.sfc", "-e", "3", "-p", "sum"});
    RunResult bad = run_tool({"romsum", "sum", "engine_ok.sfc", "engine_bad.sfc", "-e", "3", "-p", "sum", "-f", "py"});

    std::filesystem::remove("engine_ok.sfc");
    std::filesystem::remove("engine_bad.sfc");

    assert(ok.code == 0);
    assert(ok.out == "engine_ok.sfc: sum $0003 OK\n");
    assert(bad.code == 1);
    assert(bad.out == "engine_ok.sfc: sum 0x3 OK\nengine_bad.sfc: sum 0x4 MISMATCH (expected 0x3)\n");
}

void test_sum_engine_mirror() {
    std::vector<uint8_t> image(0x18000, 0x00);
    image[0] = 0x05;
    image[0x10000] = 0x07;
    write_file("engine_mirror.sfc", image);

    RunResult mirrored = run_tool({"romsum", "sum", "engine_mirror.sfc", "-m", "mirror", "-p", "sum"});
    RunResult plain = run_tool({"romsum", "sum", "engine_mirror.sfc", "-p", "sum"});
    std::filesystem::remove("engine_mirror.sfc");

    assert(mirrored.code == 0);
    assert(mirrored.out == "engine_mirror.sfc: sum $0013\n");
    assert(plain.out == "engine_mirror.sfc: sum $000C\n");

    // 128 KiB + 32 KiB: the tail is counted twice like any other split.
    std::vector<uint8_t> wide(0x28000, 0x00);
    wide[0x20000] = 0x10;
    write_file("engine_wide.sfc", wide);
    RunResult wide_run = run_tool({"romsum", "sum", "engine_wide.sfc", "-m", "mirror", "-p", "sum", "-v"});
    std::filesystem::remove("engine_wide.sfc");
    assert(wide_run.code == 0);
    assert(wide_run.out.find("engine_wide.sfc: mirror mode, 131072 + 32768 bytes, tail counted twice\n") != std::string::npos);
    assert(wide_run.out.find("engine_wide.sfc: sum $0020\n") != std::string::npos);

    write_file("engine_small.sfc", { 0x01, 0x02, 0x03 });
    RunResult small = run_tool({"romsum", "sum", "engine_small.sfc", "-m", "mirror"});
    std::filesystem::remove("engine_small.sfc");
    assert(small.code == 1);
    assert(small.err.find("Invalid input length") != std::string::npos);
}

void test_sum_engine_missing_file() {
    RunResult r = run_tool({"romsum", "sum", "does_not_exist.sfc"});
    assert(r.code == 1);
    assert(r.err.find("Cannot open file: does_not_exist.sfc") != std::string::npos);
}

void test_bytes_engine_values() {
    RunResult r = run_tool({"romsum", "bytes", "0x01", "$02", "3,4"});
    assert(r.code == 0);
    assert(r.out == "bytes: sum $000A complement $FFF5\n");

    RunResult w = run_tool({"romsum", "bytes", "0xFF,0xFF", "0x00", "0x01", "-m", "word"});
    assert(w.code == 0);
    assert(w.out == "bytes: sum $0000 complement $FFFF\n");

    std::vector<int32_t> values = BytesEngine::parse_values({"1, 2 ,", "%101"});
    assert(values.size() == 3);
    assert(values[2] == 5);
}

void test_bytes_engine_out_of_range() {
    RunResult r = run_tool({"romsum", "bytes", "1", "256"});
    assert(r.code == 1);
    assert(r.out.empty());
    assert(r.err.find("Error: Invalid byte value: 256 at index 1") != std::string::npos);

    RunResult n = run_tool({"romsum", "bytes", "-1"});
    assert(n.code == 1);
    assert(n.err.find("Invalid byte value: -1 at index 0") != std::string::npos);
}

void test_bytes_engine_invalid_literal() {
    RunResult r = run_tool({"romsum", "bytes", "1", "zz"});
    assert(r.code == 1);
    assert(r.err.find("Invalid byte literal: 'zz'") != std::string::npos);
}

void test_format_values() {
    assert(Formatter::format_value(0x8F2C, Options::Format::Hex) == "$8F2C");
    assert(Formatter::format_value(0x8F2C, Options::Format::Dec) == "36652");
    assert(Formatter::format_value(0x8F2C, Options::Format::Python) == "0x8f2c");
    assert(Formatter::format_value(0, Options::Format::Python) == "0x0");

    Options options;
    assert(Formatter::format_result("x", 0x1234, options) == "x: sum $1234 complement $EDCB");
    options.print = Options::Print::Complement;
    assert(Formatter::format_result("x", 0x1234, options) == "x: complement $EDCB");
}

void test_bytes_engine_wide_literal() {
    RunResult r = run_tool({"romsum", "bytes", "1", "4294967296"});
    assert(r.code == 1);
    assert(r.err.find("Error: Invalid byte value: 4294967296 at index 1") != std::string::npos);

    RunResult huge = run_tool({"romsum", "bytes", "99999999999999999999999"});
    assert(huge.code == 1);
    assert(huge.err.find("Invalid byte value: 99999999999999999999999 at index 0") != std::string::npos);

    try {
        BytesEngine::parse_values({"0x1,0x1FFFFFFFF"});
        assert(false);
    } catch (const Checksum::Error& err) {
        assert(err.code() == Checksum::ErrorCode::INVALID_BYTE_VALUE);
        assert(err.detail() == "0x1FFFFFFFF at index 1");
    }
}
