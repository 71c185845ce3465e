#ifndef EXPLODE_CONFIG_HPP
#define EXPLODE_CONFIG_HPP

#include <filesystem>

// Fully validated settings for one explode run; read-only once constructed.
struct ExplodeConfig {
    std::filesystem::path source;
    std::filesystem::path destination{"."};
    bool force = false;
    bool dryRun = false;
    bool verbose = false;
};

#endif
