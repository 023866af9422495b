#include "ByteSource.h"
#include "../Core/ChecksumAccumulator.h"
#include <algorithm>
#include <cstring>

std::vector<uint8_t> ByteSource::read_all(ByteSource& source) {
    std::vector<uint8_t> data;
    auto known = source.size();
    if (known)
        data.reserve(static_cast<size_t>(*known));
    std::vector<uint8_t> chunk(DEFAULT_CHUNK);
    size_t n;
    while ((n = source.read(chunk.data(), chunk.size())) > 0)
        data.insert(data.end(), chunk.begin(), chunk.begin() + n);
    return data;
}

uint64_t ByteSource::accumulate(ByteSource& source, ChecksumAccumulator& acc, size_t chunk) {
    if (chunk == 0)
        chunk = DEFAULT_CHUNK;
    std::vector<uint8_t> buffer(chunk);
    uint64_t total = 0;
    size_t n;
    while ((n = source.read(buffer.data(), buffer.size())) > 0) {
        acc.update(buffer.data(), n);
        total += n;
    }
    return total;
}

size_t MemorySource::read(uint8_t* buffer, size_t max) {
    size_t n = std::min(max, m_data.size() - m_pos);
    if (n > 0)
        std::memcpy(buffer, m_data.data() + m_pos, n);
    m_pos += n;
    return n;
}
