#include "ConfigParser.hpp"

#include <array>
#include <fstream>
#include <iostream>
#include <utility>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace {
constexpr std::array<const char*, 4> kKnownKeys = {"destination", "verbose", "dry_run", "force"};
}

const ConfigDefaults& ConfigParser::getDefaults() const {
    return m_defaults;
}

bool ConfigParser::hasDestination() const {
    return !m_defaults.destination.empty();
}

bool ConfigParser::load(const std::string& filePath) {
    std::ifstream jsonFile(filePath);
    if (!jsonFile) {
        std::cerr << "Failed to open configuration file: `" << filePath << "`" << std::endl;
        return false;
    }

    json data;
    try {
        jsonFile >> data;
    } catch (const json::parse_error& e) {
        std::cerr << "Failed to parse configuration file: " << e.what() << std::endl;
        return false;
    }

    if (!data.is_object()) {
        std::cerr << "Invalid configuration: `" << filePath << "` must contain a JSON object." << std::endl;
        return false;
    }

    ConfigDefaults defaults;

    if (auto it = data.find("destination"); it != data.end()) {
        if (!it->is_string() || it->get<std::string>().empty()) {
            std::cerr << "`destination` must be a non-empty string." << std::endl;
            return false;
        }
        defaults.destination = it->get<std::string>();
    }

    if (!readFlag(data, "verbose", defaults.verbose) || !readFlag(data, "dry_run", defaults.dryRun) ||
        !readFlag(data, "force", defaults.force)) {
        return false;
    }

    for (auto it = data.begin(); it != data.end(); ++it) {
        bool known = false;
        for (const char* key : kKnownKeys) {
            if (it.key() == key) {
                known = true;
                break;
            }
        }
        if (!known) {
            std::cerr << "Warning: ignoring unknown configuration key `" << it.key() << "`." << std::endl;
        }
    }

    m_defaults = std::move(defaults);
    return true;
}

bool ConfigParser::readFlag(const json& data, const std::string& key, bool& value) {
    auto it = data.find(key);
    if (it == data.end()) {
        return true;
    }

    if (!it->is_boolean()) {
        std::cerr << "`" << key << "` must be a boolean value." << std::endl;
        return false;
    }

    value = it->get<bool>();
    return true;
}
