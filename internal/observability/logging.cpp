#include "internal/observability/logging.hpp"

#include <algorithm>
#include <cstdlib>
#include <string>
#include <utility>

#include <spdlog/fmt/fmt.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"

#ifdef MODSTORE_WITH_OTEL
#include <opentelemetry/context/runtime_context.h>
#include <opentelemetry/trace/provider.h>
#include <opentelemetry/trace/span.h>
#endif

namespace modstore::observability {
namespace {

constexpr std::string_view kModuleKey = "module";

// module@version of the item the current thread is working on
thread_local std::string t_module_context;

bool g_include_trace_context{false};

std::string EnvOr(const char* name, const std::string& configured, const char* fallback) {
  if (const char* v = std::getenv(name)) {
    return v;
  }
  return configured.empty() ? fallback : configured;
}

bool NeedsQuoting(std::string_view value) {
  if (value.empty()) {
    return true;
  }
  return std::any_of(value.begin(), value.end(), [](char c) { return c == ' ' || c == '=' || c == '"' || c == '\n' || c == '\t'; });
}

void AppendValue(std::string& out, std::string_view value) {
  if (!NeedsQuoting(value)) {
    out.append(value);
    return;
  }
  out.push_back('"');
  for (char c : value) {
    switch (c) {
      case '"':
        out.append("\\\"");
        break;
      case '\\':
        out.append("\\\\");
        break;
      case '\n':
        out.append("\\n");
        break;
      case '\t':
        out.append("\\t");
        break;
      default:
        out.push_back(c);
    }
  }
  out.push_back('"');
}

void AppendField(std::string& out, std::string_view key, std::string_view value) {
  out.push_back(' ');
  out.append(key);
  out.push_back('=');
  AppendValue(out, value);
}

#ifdef MODSTORE_WITH_OTEL
std::string HexId(const uint8_t* data, std::size_t size) {
  static constexpr char kHex[] = "0123456789abcdef";
  std::string result;
  result.reserve(size * 2);
  for (std::size_t i = 0; i < size; ++i) {
    result.push_back(kHex[(data[i] >> 4) & 0x0F]);
    result.push_back(kHex[data[i] & 0x0F]);
  }
  return result;
}

void AppendTraceContext(std::string& out) {
  if (!g_include_trace_context) {
    return;
  }

  auto span = opentelemetry::trace::GetSpan(opentelemetry::context::RuntimeContext::GetCurrent());
  if (!span) {
    return;
  }

  auto context = span->GetContext();
  if (!context.IsValid()) {
    return;
  }

  uint8_t trace_bytes[16];
  uint8_t span_bytes[8];
  context.trace_id().CopyBytesTo(trace_bytes);
  context.span_id().CopyBytesTo(span_bytes);
  AppendField(out, "trace_id", HexId(trace_bytes, 16));
  AppendField(out, "span_id", HexId(span_bytes, 8));
}
#else
void AppendTraceContext(std::string&) {
}
#endif

} // namespace

// ------------------------------------------------------------
// Fields
// ------------------------------------------------------------

LogField StringField(std::string_view key, std::string_view value) {
  return {std::string(key), std::string(value)};
}

LogField IntField(std::string_view key, std::int64_t value) {
  return {std::string(key), std::to_string(value)};
}

LogField BoolField(std::string_view key, bool value) {
  return {std::string(key), value ? "true" : "false"};
}

LogField DurationMsField(std::string_view key, double milliseconds) {
  return {std::string(key), fmt::format("{:.3f}ms", milliseconds)};
}

LogField ModuleField(std::string_view module_path, std::string_view version) {
  std::string value(module_path);
  if (!version.empty()) {
    value.push_back('@');
    value.append(version);
  }
  return {std::string(kModuleKey), std::move(value)};
}

LogField StatusField(model::VersionStatus status) {
  return {"status", fmt::format("{}/{}", model::StatusName(status), model::ToCode(status))};
}

LogField ErrorField(std::string_view what) {
  return {"error", std::string(what)};
}

// ------------------------------------------------------------
// Module context
// ------------------------------------------------------------

ScopedModuleContext::ScopedModuleContext(std::string_view module_path, std::string_view version)
    : previous_(std::move(t_module_context)) {
  t_module_context = ModuleField(module_path, version).value;
}

ScopedModuleContext::~ScopedModuleContext() {
  t_module_context = std::move(previous_);
}

// ------------------------------------------------------------
// Records
// ------------------------------------------------------------

std::string FormatRecord(std::string_view message, std::initializer_list<LogField> fields) {
  std::string out(message);

  const bool has_module =
      std::any_of(fields.begin(), fields.end(), [](const LogField& f) { return f.key == kModuleKey; });
  if (!has_module && !t_module_context.empty()) {
    AppendField(out, kModuleKey, t_module_context);
  }
  for (const auto& field : fields) {
    AppendField(out, field.key, field.value);
  }
  return out;
}

void InitializeLogging(const modstore::runtime::config::RuntimeConfig& config) {
  const auto& logging = config.logging();

  spdlog::drop("modstore");
  auto logger = spdlog::stdout_color_mt("modstore");
  logger->set_pattern(EnvOr("MODSTORE_LOG_PATTERN", logging.pattern(), "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v"));
  logger->set_level(spdlog::level::from_str(EnvOr("MODSTORE_LOG_LEVEL", logging.level(), "info")));
  spdlog::set_default_logger(std::move(logger));
  spdlog::flush_on(spdlog::level::warn);

  if (const char* include_trace = std::getenv("MODSTORE_LOG_INCLUDE_TRACE_CONTEXT")) {
    g_include_trace_context = std::string(include_trace) == "1" || std::string(include_trace) == "true";
  } else {
    g_include_trace_context = logging.include_trace_context();
  }
}

void ShutdownLogging() {
  spdlog::shutdown();
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  if (!spdlog::should_log(level)) {
    return;
  }
  auto line = FormatRecord(message, fields);
  AppendTraceContext(line);
  spdlog::log(level, "{}", line);
}

} // namespace modstore::observability
