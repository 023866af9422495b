#ifndef __BYTESENGINE_H__
#define __BYTESENGINE_H__

#include <vector>
#include <cstdint>
#include "Engine.h"

class BytesEngine : public Engine {
public:
    explicit BytesEngine(const Options& options);
    int run() override;

    // Accepts separate arguments and comma separated lists.
    static std::vector<int32_t> parse_values(const std::vector<std::string>& inputs);
};

#endif // __BYTESENGINE_H__
