#ifndef __ENGINE_H__
#define __ENGINE_H__

#include <string>
#include <cstdint>

#include "../Cmd/Options.h"

class ChecksumAccumulator;

class Engine {
public:
    explicit Engine(const Options& options) : m_options(options) {}
    virtual ~Engine() = default;
    virtual int run() = 0;

protected:
    // Reports a dropped trailing byte and returns the final checksum.
    uint16_t finish(const ChecksumAccumulator& acc, const std::string& label) const;
    // Prints the result line; returns false on an --expect mismatch.
    bool report(const std::string& label, uint16_t checksum) const;

    const Options& m_options;
};

#endif // __ENGINE_H__
