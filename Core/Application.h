#ifndef __APPLICATION_H__
#define __APPLICATION_H__

#include <memory>

class CommandLine;
class Engine;
struct Options;

class Application {
public:
    Application() = default;
    ~Application() = default;

    int run(CommandLine& commands);

private:
    std::unique_ptr<Engine> create_engine(const Options& options);
};

#endif//__APPLICATION_H__
