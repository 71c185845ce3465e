#ifndef CONFIG_PARSER_HPP
#define CONFIG_PARSER_HPP

#include <string>

#include <nlohmann/json_fwd.hpp>

// Defaults read from a config file; command-line flags can only switch these on.
struct ConfigDefaults {
    std::string destination;
    bool verbose = false;
    bool dryRun = false;
    bool force = false;
};

// Parses a JSON defaults file such as {"destination": "/srv/inbox", "verbose": true}.
class ConfigParser {
public:
    // Load configuration from disk; returns false on I/O or validation errors.
    bool load(const std::string& filePath);
    // Read-only access to the loaded defaults.
    const ConfigDefaults& getDefaults() const;
    // True when the file provided a destination directory.
    bool hasDestination() const;

private:
    // Read an optional boolean key; returns false if the key is present with another type.
    static bool readFlag(const nlohmann::json& data, const std::string& key, bool& value);

    ConfigDefaults m_defaults;
};

#endif
