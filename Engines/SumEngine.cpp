#include "SumEngine.h"
#include <iostream>
#include "../Core/ChecksumAccumulator.h"
#include "../Files/FileSource.h"
#include "../Utils/Checksum.h"

SumEngine::SumEngine(const Options& options) : Engine(options) {}

int SumEngine::run() {
    bool all_match = true;
    for (const auto& path : m_options.inputs) {
        uint16_t checksum = sum_file(path);
        if (!report(path, checksum))
            all_match = false;
    }
    return all_match ? 0 : 1;
}

uint16_t SumEngine::sum_file(const std::string& path) {
    FileSource source(path, m_options.offset);
    if (m_options.verbose) {
        std::cout << "Reading " << path << " (" << source.get_file_size() << " bytes";
        if (m_options.offset > 0)
            std::cout << ", skipping " << m_options.offset;
        std::cout << ")" << std::endl;
    }
    if (m_options.sumMode == Checksum::Mode::Mirror)
        return sum_mirrored(source);

    ChecksumAccumulator acc(m_options.sumMode, m_options.oddBytes);
    ByteSource::accumulate(source, acc);
    return finish(acc, path);
}

uint16_t SumEngine::sum_mirrored(FileSource& source) {
    std::vector<uint8_t> image = ByteSource::read_all(source);
    if (m_options.verbose) {
        size_t prefix = 0, tail = 0;
        if (Checksum::split_mirrored(image.size(), prefix, tail)) {
            std::cout << source.get_path() << ": mirror mode, " << prefix << " + " << tail << " bytes";
            if (tail > 0)
                std::cout << ", tail counted twice";
            std::cout << std::endl;
        }
    }
    return Checksum::compute_mirrored(image);
}
