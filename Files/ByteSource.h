#ifndef __BYTESOURCE_H__
#define __BYTESOURCE_H__

#include <vector>
#include <cstdint>
#include <cstddef>
#include <optional>
#include <utility>

class ChecksumAccumulator;

class ByteSource {
public:
    static constexpr size_t DEFAULT_CHUNK = 64 * 1024;

    virtual ~ByteSource() = default;
    // Copies up to max bytes into buffer. Returns 0 once the data is exhausted.
    virtual size_t read(uint8_t* buffer, size_t max) = 0;
    // Bytes left to read, if the source knows it.
    virtual std::optional<uint64_t> size() const { return std::nullopt; }

    static std::vector<uint8_t> read_all(ByteSource& source);
    static uint64_t accumulate(ByteSource& source, ChecksumAccumulator& acc, size_t chunk = DEFAULT_CHUNK);
};

class MemorySource : public ByteSource {
public:
    explicit MemorySource(std::vector<uint8_t> data) : m_data(std::move(data)) {}
    size_t read(uint8_t* buffer, size_t max) override;
    std::optional<uint64_t> size() const override { return m_data.size() - m_pos; }
private:
    std::vector<uint8_t> m_data;
    size_t m_pos = 0;
};

#endif // __BYTESOURCE_H__
