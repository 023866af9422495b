#include "ChecksumAccumulator.h"
#include <stdexcept>

ChecksumAccumulator::ChecksumAccumulator(Mode mode, OddBytePolicy policy) : m_mode(mode), m_policy(policy) {
    if (mode == Mode::Mirror)
        throw std::invalid_argument("Mirror mode needs the whole image, it cannot be accumulated in chunks.");
}

void ChecksumAccumulator::update(const uint8_t* data, size_t size) {
    if (size == 0)
        return;
    m_consumed += size;
    size_t i = 0;
    if (m_mode == Mode::Byte) {
        for (; i < size; ++i)
            m_sum = static_cast<uint16_t>((m_sum + data[i]) & Checksum::MASK);
        return;
    }
    if (m_has_pending) {
        m_sum = static_cast<uint16_t>((m_sum + ((m_pending << 8) | data[0])) & Checksum::MASK);
        m_has_pending = false;
        i = 1;
    }
    for (; i + 1 < size; i += 2)
        m_sum = static_cast<uint16_t>((m_sum + ((data[i] << 8) | data[i + 1])) & Checksum::MASK);
    if (i < size) {
        m_pending = data[i];
        m_has_pending = true;
    }
}

uint16_t ChecksumAccumulator::finish() const {
    if (m_has_pending && m_policy == OddBytePolicy::Strict)
        throw Checksum::Error(Checksum::ErrorCode::INVALID_INPUT_LENGTH,
                              "word mode needs an even number of bytes, got " + std::to_string(m_consumed));
    return m_sum;
}

void ChecksumAccumulator::reset() {
    m_sum = 0;
    m_pending = 0;
    m_has_pending = false;
    m_consumed = 0;
}
