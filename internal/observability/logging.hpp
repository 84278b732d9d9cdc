#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

#include "internal/model/status.hpp"

namespace modstore::runtime::config {
class RuntimeConfig;
}

namespace modstore::observability {

/*
  Records are logfmt lines:

    ingest finished module=example.com/lib@v1.2.0 is_latest=true duration=4.210ms

  Values holding spaces, '=' or quotes are quoted.
*/
struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);
LogField DurationMsField(std::string_view key, double milliseconds);

// module=<module_path>@<version>, or module=<module_path> when version is empty.
LogField ModuleField(std::string_view module_path, std::string_view version = {});

// status=<name>/<code>, e.g. status=validation_failure/480.
LogField StatusField(model::VersionStatus status);

LogField ErrorField(std::string_view what);

/*
  Tags every record logged on the current thread with the module version
  being processed, until destroyed. Scopes nest; the innermost wins. Records
  that already carry a module field are left alone.
*/
class ScopedModuleContext {
 public:
  ScopedModuleContext(std::string_view module_path, std::string_view version);
  ~ScopedModuleContext();

  ScopedModuleContext(const ScopedModuleContext&)            = delete;
  ScopedModuleContext& operator=(const ScopedModuleContext&) = delete;

 private:
  std::string previous_;
};

// The line Log writes for message and fields, without trace context.
std::string FormatRecord(std::string_view message, std::initializer_list<LogField> fields);

void InitializeLogging(const modstore::runtime::config::RuntimeConfig& config);
void ShutdownLogging();

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields = {});

inline void LogDebug(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::debug, message, fields);
}

inline void LogInfo(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::info, message, fields);
}

inline void LogWarn(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::warn, message, fields);
}

inline void LogError(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::err, message, fields);
}

} // namespace modstore::observability

#define MODSTORE_LOG_DEBUG(message, ...) ::modstore::observability::LogDebug((message), ##__VA_ARGS__)
#define MODSTORE_LOG_INFO(message, ...) ::modstore::observability::LogInfo((message), ##__VA_ARGS__)
#define MODSTORE_LOG_WARN(message, ...) ::modstore::observability::LogWarn((message), ##__VA_ARGS__)
#define MODSTORE_LOG_ERROR(message, ...) ::modstore::observability::LogError((message), ##__VA_ARGS__)
