#include "Application.h"
#include <iostream>
#include <memory>
#include "../Cmd/CommandLine.h"
#include "../Cmd/Options.h"
#include "../Engines/Engine.h"
#include "../Engines/SumEngine.h"
#include "../Engines/BytesEngine.h"
#include "../Utils/Checksum.h"

int Application::run(CommandLine& commands) {
    try {
        const auto& options = commands.get_options();
        std::unique_ptr<Engine> engine = create_engine(options);
        if (!engine) {
            std::cerr << "Error: Tool mode not supported." << std::endl;
            return 1;
        }
        return engine->run();
    } catch (const Checksum::Error& e) {
        std::cerr << "Error: " << e.what();
        if (!e.detail().empty())
            std::cerr << ": " << e.detail();
        std::cerr << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
    }
    return 1;
}

std::unique_ptr<Engine> Application::create_engine(const Options& options) {
    switch (options.mode) {
        case Options::ToolMode::Sum:
            return std::make_unique<SumEngine>(options);
        case Options::ToolMode::Bytes:
            return std::make_unique<BytesEngine>(options);
        case Options::ToolMode::Unknown:
        default:
            return nullptr;
    }
}
