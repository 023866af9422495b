#include "Engine.h"
#include "../Core/ChecksumAccumulator.h"
#include "../Utils/Formatter.h"
#include "../Utils/Strings.h"
#include <iostream>

uint16_t Engine::finish(const ChecksumAccumulator& acc, const std::string& label) const {
    uint16_t checksum = acc.finish();
    if (acc.has_pending_byte())
        std::cerr << "Warning: " << label << ": trailing byte $" << Strings::hex(acc.get_pending_byte())
                  << " ignored in word mode (" << acc.get_consumed() << " bytes)." << std::endl;
    if (m_options.verbose)
        std::cout << label << ": " << Checksum::mode_name(acc.get_mode()) << " mode, " << acc.get_consumed() << " bytes" << std::endl;
    return checksum;
}

bool Engine::report(const std::string& label, uint16_t checksum) const {
    std::cout << Formatter::format_result(label, checksum, m_options) << std::endl;
    return !m_options.hasExpected || checksum == m_options.expected;
}
