#ifndef __CHECKSUMACCUMULATOR_H__
#define __CHECKSUMACCUMULATOR_H__

#include <cstdint>
#include <cstddef>
#include <vector>

#include "../Utils/Checksum.h"

// Running 16-bit sum over a byte stream fed in chunks. In word mode a byte left
// over at the end of a chunk is paired with the first byte of the next one, so
// the result never depends on how the input was split.
class ChecksumAccumulator {
public:
    using Mode = Checksum::Mode;
    using OddBytePolicy = Checksum::OddBytePolicy;

    explicit ChecksumAccumulator(Mode mode, OddBytePolicy policy = OddBytePolicy::Drop);

    void update(const uint8_t* data, size_t size);
    void update(const std::vector<uint8_t>& data) { update(data.data(), data.size()); }

    uint16_t finish() const;
    uint16_t complement() const { return Checksum::complement(finish()); }
    void reset();

    Mode get_mode() const { return m_mode; }
    OddBytePolicy get_policy() const { return m_policy; }
    uint64_t get_consumed() const { return m_consumed; }
    bool has_pending_byte() const { return m_has_pending; }
    uint8_t get_pending_byte() const { return m_pending; }

private:
    Mode m_mode;
    OddBytePolicy m_policy;
    uint16_t m_sum = 0;
    uint8_t m_pending = 0;
    bool m_has_pending = false;
    uint64_t m_consumed = 0;
};

#endif // __CHECKSUMACCUMULATOR_H__
