#ifndef __SUMENGINE_H__
#define __SUMENGINE_H__

#include "Engine.h"

class FileSource;

class SumEngine : public Engine {
public:
    explicit SumEngine(const Options& options);
    int run() override;

private:
    uint16_t sum_file(const std::string& path);
    uint16_t sum_mirrored(FileSource& source);
};

#endif // __SUMENGINE_H__
