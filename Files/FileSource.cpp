#include "FileSource.h"
#include <stdexcept>
#include <algorithm>

FileSource::FileSource(const std::string& path, uint64_t offset) : m_path(path) {
    m_file.open(path, std::ios::binary | std::ios::ate);
    if (!m_file)
        throw std::runtime_error("Cannot open file: " + path);
    std::streamoff end = m_file.tellg();
    if (end < 0)
        throw std::runtime_error("Cannot determine size of file: " + path);
    m_file_size = static_cast<uint64_t>(end);
    if (offset > m_file_size)
        throw std::runtime_error("Offset " + std::to_string(offset) + " is past the end of " + path + " (" + std::to_string(m_file_size) + " bytes)");
    m_file.seekg(static_cast<std::streamoff>(offset), std::ios::beg);
    m_remaining = m_file_size - offset;
}

size_t FileSource::read(uint8_t* buffer, size_t max) {
    size_t want = static_cast<size_t>(std::min<uint64_t>(max, m_remaining));
    if (want == 0)
        return 0;
    m_file.read(reinterpret_cast<char*>(buffer), static_cast<std::streamsize>(want));
    size_t got = static_cast<size_t>(m_file.gcount());
    if (got != want)
        throw std::runtime_error("Read error in file: " + m_path);
    m_remaining -= got;
    return got;
}
