#pragma once

#include "stego/StegoEngine.hpp"

#include <expected>
#include <filesystem>
#include <nlohmann/json.hpp>
#include <string>
#include <string_view>
#include <vector>

namespace stegomotion {

namespace fs = std::filesystem;
using json = nlohmann::json;

// Error types for configuration loading
enum class ConfigError { FileNotFound, ParseError, InvalidValue };

// Settings for reading and writing video containers
struct VideoConfig {
  std::string fourcc = "FFV1"; // Lossless codec for the stego output
  std::vector<std::string> extensions = {".avi", ".mov"};
};

// Settings for the log sinks
struct LoggingConfig {
  std::string level = "info";
  std::string file = "logs/stegomotion.log";
};

/**
 * @brief Complete application configuration.
 */
struct AppConfig {
  EngineConfig engine;
  VideoConfig video;
  LoggingConfig logging;
};

/**
 * @brief Builds a configuration from a JSON document. Missing keys keep
 * their defaults.
 * @param document The parsed JSON document.
 * @return The configuration or ConfigError::InvalidValue.
 */
auto parseConfig(const json &document) -> std::expected<AppConfig, ConfigError>;

/**
 * @brief Reads and parses a JSON configuration file.
 * @param path The path to the file.
 * @return The configuration or the reason it could not be loaded.
 */
auto loadConfig(const fs::path &path) -> std::expected<AppConfig, ConfigError>;

/**
 * @brief Serializes a configuration back to JSON.
 */
json toJson(const AppConfig &config);

// String representation for ConfigError
std::string_view errorToString(ConfigError error) noexcept;

} // namespace stegomotion
