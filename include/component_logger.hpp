#pragma once

#include "logger.hpp"
#include <sstream>
#include <string>
#include <type_traits>
#include <utility>

namespace scrub {

template <typename Component> struct ComponentTrait;

template <> struct ComponentTrait<class CleaningEngine> {
  static constexpr const char *name = "CleaningEngine";
};

template <> struct ComponentTrait<class CleaningSession> {
  static constexpr const char *name = "CleaningSession";
};

template <> struct ComponentTrait<class ScopeResolver> {
  static constexpr const char *name = "ScopeResolver";
};

template <> struct ComponentTrait<class ConfigManager> {
  static constexpr const char *name = "ConfigManager";
};

template <> struct ComponentTrait<class PipelineLoader> {
  static constexpr const char *name = "PipelineLoader";
};

template <> struct ComponentTrait<class DuplicateRemover> {
  static constexpr const char *name = "DuplicateRemover";
};

template <> struct ComponentTrait<class MissingValueHandler> {
  static constexpr const char *name = "MissingValueHandler";
};

template <> struct ComponentTrait<class TextStandardizer> {
  static constexpr const char *name = "TextStandardizer";
};

template <> struct ComponentTrait<class DateNormalizer> {
  static constexpr const char *name = "DateNormalizer";
};

template <> struct ComponentTrait<class OutlierRemover> {
  static constexpr const char *name = "OutlierRemover";
};

template <> struct ComponentTrait<class TypeConverter> {
  static constexpr const char *name = "TypeConverter";
};

template <> struct ComponentTrait<class WhitespaceTrimmer> {
  static constexpr const char *name = "WhitespaceTrimmer";
};

template <> struct ComponentTrait<class EmptyRowRemover> {
  static constexpr const char *name = "EmptyRowRemover";
};

/**
 * ComponentLogger - Template-based logging with the component name resolved
 * at compile time via ComponentTrait.
 *
 * Messages may carry "{}" placeholders which are replaced in order by the
 * trailing arguments.
 */
template <typename Component> class ComponentLogger {
private:
  static_assert(std::is_class_v<Component>, "Component must be a class type");

  static constexpr const char *component_name = ComponentTrait<Component>::name;

  static Logger &getLogger() { return Logger::getInstance(); }

public:
  template <typename... Args>
  static void debug(const std::string &message, Args &&...args) {
    if constexpr (sizeof...(args) > 0) {
      getLogger().debug(component_name,
                        format_message(message, std::forward<Args>(args)...));
    } else {
      getLogger().debug(component_name, message);
    }
  }

  template <typename... Args>
  static void info(const std::string &message, Args &&...args) {
    if constexpr (sizeof...(args) > 0) {
      getLogger().info(component_name,
                       format_message(message, std::forward<Args>(args)...));
    } else {
      getLogger().info(component_name, message);
    }
  }

  template <typename... Args>
  static void warn(const std::string &message, Args &&...args) {
    if constexpr (sizeof...(args) > 0) {
      getLogger().warn(component_name,
                       format_message(message, std::forward<Args>(args)...));
    } else {
      getLogger().warn(component_name, message);
    }
  }

  template <typename... Args>
  static void error(const std::string &message, Args &&...args) {
    if constexpr (sizeof...(args) > 0) {
      getLogger().error(component_name,
                        format_message(message, std::forward<Args>(args)...));
    } else {
      getLogger().error(component_name, message);
    }
  }

  template <typename... Args>
  static void fatal(const std::string &message, Args &&...args) {
    if constexpr (sizeof...(args) > 0) {
      getLogger().fatal(component_name,
                        format_message(message, std::forward<Args>(args)...));
    } else {
      getLogger().fatal(component_name, message);
    }
  }

  static void infoWithContext(const std::string &message,
                              const StringMap &context = {}) {
    getLogger().info(component_name, message, context);
  }

  static void warnWithContext(const std::string &message,
                              const StringMap &context = {}) {
    getLogger().warn(component_name, message, context);
  }

  static void errorWithContext(const std::string &message,
                               const StringMap &context = {}) {
    getLogger().error(component_name, message, context);
  }

  static void logPerformance(const std::string &operation, double durationMs,
                             const StringMap &context = {}) {
    getLogger().logPerformance(operation, durationMs, context);
  }

  static constexpr const char *getComponentName() { return component_name; }

  // Exposed for tests
  template <typename... Args>
  static std::string format_message(const std::string &format, Args &&...args) {
    std::stringstream ss;
    format_impl(ss, format, std::forward<Args>(args)...);
    return ss.str();
  }

private:
  template <typename T>
  static void stream_value(std::stringstream &ss, T &&value) {
    if constexpr (std::is_arithmetic_v<std::decay_t<T>> ||
                  std::is_convertible_v<T, std::string>) {
      ss << std::forward<T>(value);
    } else {
      ss << "[object]";
    }
  }

  template <typename T, typename... Args>
  static void format_impl(std::stringstream &ss, const std::string &format,
                          T &&arg, Args &&...args) {
    size_t pos = format.find("{}");
    if (pos != std::string::npos) {
      ss << format.substr(0, pos);
      stream_value(ss, std::forward<T>(arg));
      if constexpr (sizeof...(args) > 0) {
        format_impl(ss, format.substr(pos + 2), std::forward<Args>(args)...);
      } else {
        ss << format.substr(pos + 2);
      }
    } else {
      ss << format;
    }
  }

  static void format_impl(std::stringstream &ss, const std::string &format) {
    ss << format;
  }
};

using EngineLogger = ComponentLogger<class CleaningEngine>;
using SessionLogger = ComponentLogger<class CleaningSession>;
using ScopeLogger = ComponentLogger<class ScopeResolver>;
using ConfigLogger = ComponentLogger<class ConfigManager>;
using PipelineLogger = ComponentLogger<class PipelineLoader>;

} // namespace scrub

#define COMPONENT_LOG_DEBUG(ComponentClass, message, ...)                      \
  scrub::ComponentLogger<ComponentClass>::debug(message, ##__VA_ARGS__)
#define COMPONENT_LOG_INFO(ComponentClass, message, ...)                       \
  scrub::ComponentLogger<ComponentClass>::info(message, ##__VA_ARGS__)
#define COMPONENT_LOG_WARN(ComponentClass, message, ...)                       \
  scrub::ComponentLogger<ComponentClass>::warn(message, ##__VA_ARGS__)
#define COMPONENT_LOG_ERROR(ComponentClass, message, ...)                      \
  scrub::ComponentLogger<ComponentClass>::error(message, ##__VA_ARGS__)

#define ENGINE_LOG_DEBUG(message, ...)                                         \
  scrub::EngineLogger::debug(message, ##__VA_ARGS__)
#define ENGINE_LOG_INFO(message, ...)                                          \
  scrub::EngineLogger::info(message, ##__VA_ARGS__)
#define ENGINE_LOG_WARN(message, ...)                                          \
  scrub::EngineLogger::warn(message, ##__VA_ARGS__)
#define ENGINE_LOG_ERROR(message, ...)                                         \
  scrub::EngineLogger::error(message, ##__VA_ARGS__)

#define SCOPE_LOG_DEBUG(message, ...)                                          \
  scrub::ScopeLogger::debug(message, ##__VA_ARGS__)
#define SCOPE_LOG_WARN(message, ...)                                           \
  scrub::ScopeLogger::warn(message, ##__VA_ARGS__)

#define CONFIG_LOG_DEBUG(message, ...)                                         \
  scrub::ConfigLogger::debug(message, ##__VA_ARGS__)
#define CONFIG_LOG_INFO(message, ...)                                          \
  scrub::ConfigLogger::info(message, ##__VA_ARGS__)
#define CONFIG_LOG_WARN(message, ...)                                          \
  scrub::ConfigLogger::warn(message, ##__VA_ARGS__)
#define CONFIG_LOG_ERROR(message, ...)                                         \
  scrub::ConfigLogger::error(message, ##__VA_ARGS__)

#define PIPELINE_LOG_DEBUG(message, ...)                                       \
  scrub::PipelineLogger::debug(message, ##__VA_ARGS__)
#define PIPELINE_LOG_INFO(message, ...)                                        \
  scrub::PipelineLogger::info(message, ##__VA_ARGS__)
#define PIPELINE_LOG_WARN(message, ...)                                        \
  scrub::PipelineLogger::warn(message, ##__VA_ARGS__)
#define PIPELINE_LOG_ERROR(message, ...)                                       \
  scrub::PipelineLogger::error(message, ##__VA_ARGS__)
