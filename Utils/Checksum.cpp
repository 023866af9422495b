#include "Checksum.h"
#include "../Core/ChecksumAccumulator.h"

Checksum::Error::Error(ErrorCode code, const std::string& detail) : m_code(code), m_detail(detail) {
    switch (code) {
        case ErrorCode::INVALID_INPUT_LENGTH:
            m_message = "Invalid input length";
            break;
        case ErrorCode::INVALID_BYTE_VALUE:
            m_message = "Invalid byte value";
            break;
        default:
            m_message = "Checksum error";
            break;
    }
}

const char* Checksum::Error::what() const noexcept {
    return m_message.c_str();
}

uint16_t Checksum::compute_byte_wise(const std::vector<uint8_t>& data) {
    ChecksumAccumulator acc(Mode::Byte);
    acc.update(data);
    return acc.finish();
}

uint16_t Checksum::compute_word_wise(const std::vector<uint8_t>& data, OddBytePolicy policy) {
    ChecksumAccumulator acc(Mode::Word, policy);
    acc.update(data);
    return acc.finish();
}

uint16_t Checksum::compute_byte_wise(const std::vector<int32_t>& values) {
    return compute_byte_wise(to_bytes(values));
}

uint16_t Checksum::compute_word_wise(const std::vector<int32_t>& values, OddBytePolicy policy) {
    return compute_word_wise(to_bytes(values), policy);
}

std::vector<uint8_t> Checksum::to_bytes(const std::vector<int32_t>& values) {
    std::vector<uint8_t> bytes;
    bytes.reserve(values.size());
    for (size_t i = 0; i < values.size(); ++i) {
        int32_t v = values[i];
        if (v < 0 || v > 0xFF)
            throw Error(ErrorCode::INVALID_BYTE_VALUE, std::to_string(v) + " at index " + std::to_string(i));
        bytes.push_back(static_cast<uint8_t>(v));
    }
    return bytes;
}

bool Checksum::split_mirrored(size_t size, size_t& prefix, size_t& tail) {
    prefix = MIRROR_MIN_SECTION;
    while (prefix * 2 <= size)
        prefix *= 2;
    if (prefix == size) {
        tail = 0;
        return true;
    }
    tail = MIRROR_MIN_SECTION;
    while (tail * 2 + prefix <= size)
        tail *= 2;
    return prefix + tail == size;
}

uint16_t Checksum::compute_mirrored(const std::vector<uint8_t>& data) {
    size_t prefix = 0, tail = 0;
    if (!split_mirrored(data.size(), prefix, tail))
        throw Error(ErrorCode::INVALID_INPUT_LENGTH, "image size " + std::to_string(data.size()) + " is not a power-of-two split");
    ChecksumAccumulator head(Mode::Byte);
    head.update(data.data(), prefix);
    if (tail == 0)
        return head.finish();
    ChecksumAccumulator rest(Mode::Byte);
    rest.update(data.data() + prefix, tail);
    return static_cast<uint16_t>((head.finish() + rest.finish() * 2u) & MASK);
}

std::string Checksum::mode_name(Mode mode) {
    switch (mode) {
        case Mode::Byte: return "byte";
        case Mode::Word: return "word";
        case Mode::Mirror: return "mirror";
    }
    return "?";
}
