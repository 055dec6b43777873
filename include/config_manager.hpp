#pragma once

#include "logger.hpp"
#include "type_definitions.hpp"
#include <functional>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <unordered_set>
#include <vector>

namespace scrub {

class ConfigManager;

// Configuration validation result
struct ConfigValidationResult {
  bool isValid = true;
  std::vector<std::string> errors;
  std::vector<std::string> warnings;

  void addError(const std::string &error) {
    isValid = false;
    errors.push_back(error);
  }

  void addWarning(const std::string &warning) { warnings.push_back(warning); }
};

// How a column scope naming unknown columns is treated
enum class ScopePolicy { PERMISSIVE, STRICT };

std::string scopePolicyToString(ScopePolicy policy);
std::optional<ScopePolicy> parseScopePolicy(std::string_view name);

// Cleaning engine tuning, read from the "engine" section
struct EngineConfig {
  ScopePolicy scopePolicy = ScopePolicy::PERMISSIVE;
  int dateSampleSize = 100;
  std::string defaultDateFormat = "%Y-%m-%d";
  double iqrMultiplier = 1.5;
  double zscoreThreshold = 3.0;

  static EngineConfig fromConfig(const ConfigManager &config);
  ConfigValidationResult validate() const;
  bool operator==(const EngineConfig &other) const;
};

class ConfigManager {
public:
  static ConfigManager &getInstance();

  bool loadConfig(const std::string &configPath);
  bool loadFromString(const std::string &jsonText);

  // Drops every loaded value; getters fall back to their defaults
  void clear();

  std::string getString(const std::string &key,
                        const std::string &defaultValue = "") const;
  int getInt(const std::string &key, int defaultValue = 0) const;
  bool getBool(const std::string &key, bool defaultValue = false) const;
  double getDouble(const std::string &key, double defaultValue = 0.0) const;
  StringSet getStringSet(const std::string &key) const;
  bool hasKey(const std::string &key) const;

  // Logging configuration helpers
  LogConfig getLoggingConfig() const;

  /**
   * Engine settings from the "engine" section. When the section fails
   * validation the errors are logged and the defaults are returned.
   */
  EngineConfig getEngineConfig() const;

  ConfigValidationResult validateConfiguration() const;

  // Get raw JSON configuration
  const nlohmann::json &getJsonConfig() const;

  // Configuration access with validation
  template <typename T>
  T getValidatedValue(
      const std::string &key, const T &defaultValue,
      const std::function<bool(const T &)> &validator = nullptr) const;

private:
  ConfigManager() = default;

  StringMap configData;
  std::string configFilePath;
  nlohmann::json rawConfig_;

  bool applyJson(const nlohmann::json &jsonConfig);
  void flattenJson(const nlohmann::json &json, const std::string &prefix,
                   int currentDepth, int maxDepth);
};

/**
 * @brief Retrieve a typed configuration value with optional validation.
 *
 * Supported types are std::string, int, bool and double. Returns
 * @p defaultValue when the key is absent or @p validator rejects the value.
 */
template <typename T>
T ConfigManager::getValidatedValue(
    const std::string &key, const T &defaultValue,
    const std::function<bool(const T &)> &validator) const {
  T value;

  if constexpr (std::is_same_v<T, std::string>) {
    value = getString(key, defaultValue);
  } else if constexpr (std::is_same_v<T, int>) {
    value = getInt(key, defaultValue);
  } else if constexpr (std::is_same_v<T, bool>) {
    value = getBool(key, defaultValue);
  } else if constexpr (std::is_same_v<T, double>) {
    value = getDouble(key, defaultValue);
  } else {
    static_assert(std::is_same_v<T, std::string> || std::is_same_v<T, int> ||
                      std::is_same_v<T, bool> || std::is_same_v<T, double>,
                  "Unsupported type for getValidatedValue");
    return defaultValue;
  }

  if (validator && !validator(value)) {
    return defaultValue;
  }

  return value;
}

} // namespace scrub
