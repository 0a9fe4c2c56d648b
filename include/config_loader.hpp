#ifndef CONFIG_LOADER_H
#define CONFIG_LOADER_H

#include "terminal_model.hpp"
#include <string>

/**
 * @class ConfigLoader
 * @brief Reads a terminal profile: serial line, database file, poll timing and site seed.
 *
 * Every value is checked while it is read, so a Config that comes back is
 * ready to open the bus and the database with. Missing sections keep their
 * defaults.
 */
class ConfigLoader {
public:
    /**
     * @brief Reads a terminal profile from disk.
     * @param filename Path of the YAML profile, usually terminal_profile.yaml.
     * @throw std::runtime_error when the file is unreadable or a value is invalid.
     */
    static Config loadConfig(const std::string& filename);

    /**
     * @brief Parses configuration held in memory.
     * @param text YAML document.
     * @throw std::runtime_error on parse or validation errors.
     */
    static Config parseConfig(const std::string& text);
};

#endif // CONFIG_LOADER_H
