#include <cstdlib>
#include <iostream>

#include "CommandLine.hpp"
#include "Exploder.hpp"

namespace {
constexpr int kUsageError = 2;
}

int main(int argc, char* argv[]) {
    CommandLine commandLine(std::cout, std::cerr);
    if (!commandLine.parse(argc, argv)) {
        return kUsageError;
    }

    if (commandLine.exitRequested()) {
        return EXIT_SUCCESS;
    }

    Exploder exploder(commandLine.config(), std::cout);
    if (!exploder.explode()) {
        std::cerr << "Error: " << exploder.lastError().message << std::endl;
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
