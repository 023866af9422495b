#include "Cmd/CommandLine.h"
#include "Core/Application.h"

int main(int argc, char* argv[]) {
    CommandLine commandLine;
    if (!commandLine.parse(argc, argv))
        return 1;
    Application app;
    return app.run(commandLine);
}
