#ifndef __CHECKSUM_H__
#define __CHECKSUM_H__

#include <cstdint>
#include <vector>
#include <cstddef>
#include <string>
#include <exception>

class Checksum {
public:
    enum class Mode { Byte, Word, Mirror };
    // What to do with a trailing unpaired byte in word mode.
    enum class OddBytePolicy { Drop, Strict };

    enum class ErrorCode {
        INVALID_INPUT_LENGTH,
        INVALID_BYTE_VALUE
    };

    class Error : public std::exception {
    public:
        Error(ErrorCode code, const std::string& detail = "");
        ErrorCode code() const { return m_code; }
        const std::string& detail() const { return m_detail; }
        const char* what() const noexcept override;
    private:
        ErrorCode m_code;
        std::string m_detail;
        std::string m_message;
    };

    static constexpr uint16_t MASK = 0xFFFF;
    static constexpr size_t MIRROR_MIN_SECTION = 0x8000;

    static uint16_t compute_byte_wise(const std::vector<uint8_t>& data);
    static uint16_t compute_word_wise(const std::vector<uint8_t>& data, OddBytePolicy policy = OddBytePolicy::Drop);
    static uint16_t complement(uint16_t checksum) { return checksum ^ MASK; }

    // Checked variants for values that did not come from a byte buffer.
    static uint16_t compute_byte_wise(const std::vector<int32_t>& values);
    static uint16_t compute_word_wise(const std::vector<int32_t>& values, OddBytePolicy policy = OddBytePolicy::Drop);
    static std::vector<uint8_t> to_bytes(const std::vector<int32_t>& values);

    // Byte-wise sum of an image whose size is a power-of-two prefix followed by
    // a smaller power-of-two tail. The tail is counted twice.
    static uint16_t compute_mirrored(const std::vector<uint8_t>& data);
    static bool split_mirrored(size_t size, size_t& prefix, size_t& tail);

    static std::string mode_name(Mode mode);
};

#endif // __CHECKSUM_H__
