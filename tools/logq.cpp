#include "logq.hpp"
#include <cstring>
#include <iostream>
#include <stdexcept>

namespace {

    const char* programName(const char* argv0) {
        const char* slash = std::strrchr(argv0, '/');
        return slash ? slash + 1 : argv0;
    }

} // namespace

int main(int argc, char* argv[]) {
    const char* program = programName(argc > 0 ? argv[0] : "logq");

    logq::CommandLine cmd;
    try {
        cmd = logq::parseCommandLine(argc, argv);
    } catch (const std::invalid_argument& e) {
        std::cerr << program << ": " << e.what() << "\n\n" << logq::usage(program);
        return 2;
    }
    if (cmd.helpRequested) {
        std::cout << logq::usage(program);
        return 0;
    }

    try {
        return logq::runViewer(cmd.config.build());
    } catch (const std::invalid_argument& e) {
        std::cerr << program << ": " << e.what() << "\n";
        return 2;
    } catch (const std::exception& e) {
        std::cerr << program << ": " << e.what() << "\n";
        return 1;
    }
}
