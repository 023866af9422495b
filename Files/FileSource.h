#ifndef __FILESOURCE_H__
#define __FILESOURCE_H__

#include <string>
#include <fstream>
#include <cstdint>

#include "ByteSource.h"

class FileSource : public ByteSource {
public:
    FileSource(const std::string& path, uint64_t offset = 0);
    size_t read(uint8_t* buffer, size_t max) override;
    std::optional<uint64_t> size() const override { return m_remaining; }

    const std::string& get_path() const { return m_path; }
    uint64_t get_file_size() const { return m_file_size; }

private:
    std::string m_path;
    std::ifstream m_file;
    uint64_t m_file_size = 0;
    uint64_t m_remaining = 0;
};

#endif // __FILESOURCE_H__
