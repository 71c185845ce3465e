#ifndef COMMAND_LINE_HPP
#define COMMAND_LINE_HPP

#include "ExplodeConfig.hpp"

#include <ostream>

// Turns argv (plus an optional JSON defaults file) into a validated ExplodeConfig.
class CommandLine {
public:
    // Usage and version text go to `out`, usage errors to `err`.
    CommandLine(std::ostream& out, std::ostream& err);

    // Returns false on usage errors. --help and --version return true with exitRequested() set.
    bool parse(int argc, const char* const argv[]);
    // True when the program should stop after parsing (help or version was printed).
    bool exitRequested() const { return m_exitRequested; }
    const ExplodeConfig& config() const { return m_config; }

private:
    std::ostream& m_out;
    std::ostream& m_err;
    ExplodeConfig m_config;
    bool m_exitRequested = false;
};

#endif
