#ifndef TASKWEAVE_CONFIG_PARSER_HPP
#define TASKWEAVE_CONFIG_PARSER_HPP

#include "engine_config.hpp"
#include <stdexcept>
#include <string>

namespace taskweave {

/**
 * @brief Exception thrown when a config document cannot be read or parsed
 */
class ConfigParseError : public std::runtime_error {
public:
    explicit ConfigParseError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Parses an engine configuration from a JSON file
 *
 * A relative engine.state_directory is resolved against the directory of
 * the config file.
 *
 * @param file_path Path to the JSON configuration file
 * @return Parsed engine configuration
 * @throws ConfigParseError if file cannot be read or JSON is invalid
 * @throws ConfigurationError if configuration is invalid
 */
EngineConfig parse_engine_config_from_file(const std::string& file_path);

/**
 * @brief Parses an engine configuration from a JSON string
 *
 * @param json_string JSON configuration as string
 * @return Parsed engine configuration
 * @throws ConfigParseError if JSON is invalid
 * @throws ConfigurationError if configuration is invalid
 */
EngineConfig parse_engine_config_from_string(const std::string& json_string);

/**
 * @brief Expands environment variable references in a string
 *
 * Supports syntax: ${VAR_NAME} or $VAR_NAME. Unset variables expand to "".
 */
std::string expand_environment_variables(const std::string& value);

/**
 * @brief Resolves a path relative to the directory of a config file
 *
 * Absolute paths are returned unchanged.
 */
std::string resolve_relative_path(const std::string& path, const std::string& config_file_path);

} // namespace taskweave

#endif // TASKWEAVE_CONFIG_PARSER_HPP
