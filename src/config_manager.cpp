#include "config_manager.hpp"
#include "component_logger.hpp"
#include "string_utils.hpp"
#include <fstream>
#include <mutex>
#include <sstream>
#include <stdexcept>

namespace scrub {

static std::mutex configMutex;

std::string scopePolicyToString(ScopePolicy policy) {
  return policy == ScopePolicy::STRICT ? "strict" : "permissive";
}

std::optional<ScopePolicy> parseScopePolicy(std::string_view name) {
  std::string lowered = string_utils::to_lower(string_utils::trim(name));
  if (lowered == "permissive") {
    return ScopePolicy::PERMISSIVE;
  }
  if (lowered == "strict") {
    return ScopePolicy::STRICT;
  }
  return std::nullopt;
}

ConfigManager &ConfigManager::getInstance() {
  static ConfigManager instance;
  return instance;
}

bool ConfigManager::loadConfig(const std::string &configPath) {
  CONFIG_LOG_INFO("Loading configuration from: {}", configPath);

  std::ifstream file(configPath);
  if (!file.is_open()) {
    CONFIG_LOG_ERROR("Cannot open config file: {}", configPath);
    return false;
  }

  nlohmann::json jsonConfig;
  try {
    file >> jsonConfig;
  } catch (const nlohmann::json::parse_error &e) {
    CONFIG_LOG_ERROR("Failed to parse JSON config file {}: {}", configPath,
                     e.what());
    return false;
  }

  bool result = applyJson(jsonConfig);
  if (result) {
    std::scoped_lock lock(configMutex);
    configFilePath = configPath;
    CONFIG_LOG_INFO("Configuration loaded successfully with {} parameters",
                    configData.size());
  }
  return result;
}

bool ConfigManager::loadFromString(const std::string &jsonText) {
  nlohmann::json jsonConfig;
  try {
    jsonConfig = nlohmann::json::parse(jsonText);
  } catch (const nlohmann::json::parse_error &e) {
    CONFIG_LOG_ERROR("Failed to parse JSON configuration: {}", e.what());
    return false;
  }
  return applyJson(jsonConfig);
}

void ConfigManager::clear() {
  std::scoped_lock lock(configMutex);
  configData.clear();
  rawConfig_ = nlohmann::json::object();
  configFilePath.clear();
}

bool ConfigManager::applyJson(const nlohmann::json &jsonConfig) {
  if (!jsonConfig.is_object()) {
    CONFIG_LOG_ERROR("Configuration root must be a JSON object");
    return false;
  }

  std::scoped_lock lock(configMutex);
  configData.clear();
  rawConfig_ = jsonConfig;
  flattenJson(rawConfig_, "", 0, 100);
  return true;
}

std::string ConfigManager::getString(const std::string &key,
                                     const std::string &defaultValue) const {
  if (auto it = configData.find(key); it != configData.end()) {
    return it->second;
  }
  return defaultValue;
}

int ConfigManager::getInt(const std::string &key, int defaultValue) const {
  if (auto it = configData.find(key); it != configData.end()) {
    try {
      return std::stoi(it->second);
    } catch (const std::invalid_argument &) {
      return defaultValue;
    } catch (const std::out_of_range &) {
      return defaultValue;
    }
  }
  return defaultValue;
}

bool ConfigManager::getBool(const std::string &key, bool defaultValue) const {
  if (auto it = configData.find(key); it != configData.end()) {
    std::string value = string_utils::to_lower(it->second);
    return value == "true" || value == "1" || value == "yes" || value == "on";
  }
  return defaultValue;
}

double ConfigManager::getDouble(const std::string &key,
                                double defaultValue) const {
  if (auto it = configData.find(key); it != configData.end()) {
    try {
      return std::stod(it->second);
    } catch (const std::invalid_argument &) {
      return defaultValue;
    } catch (const std::out_of_range &) {
      return defaultValue;
    }
  }
  return defaultValue;
}

StringSet ConfigManager::getStringSet(const std::string &key) const {
  StringSet result;
  auto it = configData.find(key);
  if (it == configData.end()) {
    return result;
  }

  const std::string &raw = it->second;
  if (!raw.empty() && raw.front() == '[') {
    auto arr = nlohmann::json::parse(raw, nullptr, false);
    if (arr.is_array()) {
      for (const auto &v : arr) {
        if (v.is_string()) {
          result.insert(v.get<std::string>());
        }
      }
      return result;
    }
  }

  // Comma separated fallback
  for (const auto &item : string_utils::split(raw, ',')) {
    auto trimmed = string_utils::trim(item);
    if (!trimmed.empty()) {
      result.emplace(trimmed);
    }
  }
  return result;
}

bool ConfigManager::hasKey(const std::string &key) const {
  return configData.find(key) != configData.end();
}

LogConfig ConfigManager::getLoggingConfig() const {
  LogConfig config;

  config.level = Logger::parseLogLevel(getString("logging.level", "INFO"));
  config.format = Logger::parseLogFormat(getString("logging.format", "TEXT"));
  config.consoleOutput = getBool("logging.console_output", true);
  config.fileOutput = getBool("logging.file_output", false);
  config.logFile = getString("logging.log_file", "logs/scrub.log");
  config.maxFileSize =
      static_cast<size_t>(getInt("logging.max_file_size", 10485760));
  config.maxBackupFiles = getInt("logging.max_backup_files", 5);
  config.enableRotation = getBool("logging.enable_rotation", true);
  config.componentFilter = getStringSet("logging.component_filter");
  config.includeMetrics = getBool("logging.include_metrics", false);

  return config;
}

EngineConfig ConfigManager::getEngineConfig() const {
  auto result = validateConfiguration();
  for (const auto &warning : result.warnings) {
    CONFIG_LOG_WARN(warning);
  }
  if (!result.isValid) {
    for (const auto &error : result.errors) {
      CONFIG_LOG_ERROR(error);
    }
    CONFIG_LOG_WARN("Invalid engine configuration, using defaults");
    return EngineConfig{};
  }
  return EngineConfig::fromConfig(*this);
}

ConfigValidationResult ConfigManager::validateConfiguration() const {
  ConfigValidationResult result;

  if (hasKey("engine.scope_policy") &&
      !parseScopePolicy(getString("engine.scope_policy"))) {
    result.addError("Engine: scope_policy must be 'permissive' or 'strict', "
                    "got: " +
                    getString("engine.scope_policy"));
  }

  auto engineResult = EngineConfig::fromConfig(*this).validate();
  result.isValid = result.isValid && engineResult.isValid;
  for (const auto &error : engineResult.errors) {
    result.errors.push_back("Engine: " + error);
  }
  for (const auto &warning : engineResult.warnings) {
    result.warnings.push_back("Engine: " + warning);
  }

  if (hasKey("logging.max_backup_files") &&
      getInt("logging.max_backup_files", 5) < 0) {
    result.addError("Logging: max_backup_files must not be negative");
  }

  return result;
}

const nlohmann::json &ConfigManager::getJsonConfig() const {
  return rawConfig_;
}

void ConfigManager::flattenJson(const nlohmann::json &json,
                                const std::string &prefix, int currentDepth,
                                int maxDepth) {
  if (currentDepth >= maxDepth) {
    std::string key = prefix.empty() ? "deep_nested" : prefix + ".deep_nested";
    configData[key] = json.dump();
    return;
  }

  for (auto it = json.begin(); it != json.end(); ++it) {
    std::string key = prefix.empty() ? it.key() : prefix + "." + it.key();

    if (it->is_object()) {
      flattenJson(*it, key, currentDepth + 1, maxDepth);
    } else if (it->is_array()) {
      // Arrays are kept as JSON text, see getStringSet()
      configData[key] = it->dump();
    } else if (it->is_string()) {
      configData[key] = it->get<std::string>();
    } else if (it->is_number_integer()) {
      configData[key] = std::to_string(it->get<long long>());
    } else if (it->is_boolean()) {
      configData[key] = it->get<bool>() ? "true" : "false";
    } else {
      configData[key] = it->dump();
    }
  }
}

// ===== EngineConfig Implementation =====

EngineConfig EngineConfig::fromConfig(const ConfigManager &config) {
  EngineConfig engineConfig;

  engineConfig.scopePolicy =
      parseScopePolicy(config.getString("engine.scope_policy", "permissive"))
          .value_or(ScopePolicy::PERMISSIVE);
  engineConfig.dateSampleSize = config.getInt("engine.date_sample_size", 100);
  engineConfig.defaultDateFormat =
      config.getString("engine.default_date_format", "%Y-%m-%d");
  engineConfig.iqrMultiplier = config.getDouble("engine.iqr_multiplier", 1.5);
  engineConfig.zscoreThreshold =
      config.getDouble("engine.zscore_threshold", 3.0);

  return engineConfig;
}

ConfigValidationResult EngineConfig::validate() const {
  ConfigValidationResult result;

  if (dateSampleSize <= 0) {
    std::stringstream ss;
    ss << "date_sample_size must be positive, got: " << dateSampleSize;
    result.addError(ss.str());
  } else if (dateSampleSize < 10) {
    std::stringstream ss;
    ss << "date_sample_size is very low (" << dateSampleSize
       << "), date detection may be unreliable";
    result.addWarning(ss.str());
  }

  if (defaultDateFormat.empty()) {
    result.addError("default_date_format must not be empty");
  } else if (defaultDateFormat.find('%') == std::string::npos) {
    result.addWarning("default_date_format '" + defaultDateFormat +
                      "' contains no directives, every date renders the same");
  }

  if (iqrMultiplier <= 0.0) {
    std::stringstream ss;
    ss << "iqr_multiplier must be positive, got: " << iqrMultiplier;
    result.addError(ss.str());
  }

  if (zscoreThreshold <= 0.0) {
    std::stringstream ss;
    ss << "zscore_threshold must be positive, got: " << zscoreThreshold;
    result.addError(ss.str());
  }

  return result;
}

bool EngineConfig::operator==(const EngineConfig &other) const {
  return scopePolicy == other.scopePolicy &&
         dateSampleSize == other.dateSampleSize &&
         defaultDateFormat == other.defaultDateFormat &&
         iqrMultiplier == other.iqrMultiplier &&
         zscoreThreshold == other.zscoreThreshold;
}

} // namespace scrub
