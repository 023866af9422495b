#include "BytesEngine.h"
#include <stdexcept>
#include "../Core/ChecksumAccumulator.h"
#include "../Utils/Checksum.h"
#include "../Utils/Strings.h"

BytesEngine::BytesEngine(const Options& options) : Engine(options) {}

std::vector<int32_t> BytesEngine::parse_values(const std::vector<std::string>& inputs) {
    std::vector<int32_t> values;
    for (const auto& input : inputs) {
        for (const auto& token : Strings::split(input, ',')) {
            std::string literal = Strings::trim(token);
            if (literal.empty())
                continue;
            int64_t value = 0;
            bool out_of_range = false;
            if (!Strings::parse_integer(literal, value, &out_of_range) && !out_of_range)
                throw std::runtime_error("Invalid byte literal: '" + literal + "'");
            // Anything wider than int32_t cannot be a byte either.
            if (out_of_range || value < INT32_MIN || value > INT32_MAX)
                throw Checksum::Error(Checksum::ErrorCode::INVALID_BYTE_VALUE, literal + " at index " + std::to_string(values.size()));
            values.push_back(static_cast<int32_t>(value));
        }
    }
    return values;
}

int BytesEngine::run() {
    std::vector<uint8_t> bytes = Checksum::to_bytes(parse_values(m_options.inputs));
    ChecksumAccumulator acc(m_options.sumMode, m_options.oddBytes);
    acc.update(bytes);
    uint16_t checksum = finish(acc, "bytes");
    return report("bytes", checksum) ? 0 : 1;
}
