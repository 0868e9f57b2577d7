#include "internal/observability/logging.hpp"

#include <cstdlib>
#include <memory>
#include <string>
#include <vector>

#include <spdlog/fmt/fmt.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"

#ifdef ENABLE_OTEL
#include <opentelemetry/context/runtime_context.h>
#include <opentelemetry/trace/provider.h>
#include <opentelemetry/trace/span.h>
#endif

namespace mediaflow::observability {
namespace {

constexpr const char* kLoggerName     = "mediaflow";
constexpr const char* kDefaultPattern = "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] [%t] %v";
constexpr std::uint64_t kDefaultMaxFileBytes = 16ull * 1024 * 1024;
constexpr std::uint32_t kDefaultMaxFiles     = 4;

bool g_include_trace_context{false};

// MEDIAFLOW_LOG_* wins over the config file.
std::string Setting(const char* env, const std::string& configured, const char* fallback) {
  if (const char* value = std::getenv(env); value != nullptr && *value != '\0') {
    return value;
  }
  return configured.empty() ? fallback : configured;
}

bool IsTruthy(const std::string& value) {
  return value == "1" || value == "true" || value == "yes";
}

// Values with spaces or quotes (error messages, captions) are quoted so key=value stays parseable.
void AppendValue(std::string& out, const std::string& value) {
  if (!value.empty() && value.find_first_of(" \"=") == std::string::npos) {
    out += value;
    return;
  }
  out += '"';
  for (char c : value) {
    if (c == '"' || c == '\\') {
      out += '\\';
    }
    out += c;
  }
  out += '"';
}

std::string SerializeFields(std::initializer_list<LogField> fields) {
  std::string out;
  for (const auto& field : fields) {
    if (!out.empty()) {
      out += ' ';
    }
    out += field.key;
    out += '=';
    AppendValue(out, field.value);
  }
  return out;
}

#ifdef ENABLE_OTEL
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

std::string TraceContextFields() {
  if (!g_include_trace_context) {
    return {};
  }

  auto span = opentelemetry::trace::GetSpan(opentelemetry::context::RuntimeContext::GetCurrent());
  if (!span) {
    return {};
  }

  const auto context = span->GetContext();
  if (!context.IsValid()) {
    return {};
  }

  uint8_t trace_bytes[16];
  uint8_t span_bytes[8];
  context.trace_id().CopyBytesTo(trace_bytes);
  context.span_id().CopyBytesTo(span_bytes);
  return "trace_id=" + HexId(trace_bytes, 16) + " span_id=" + HexId(span_bytes, 8);
}
#else
std::string TraceContextFields() {
  return {};
}
#endif

std::vector<spdlog::sink_ptr> BuildSinks(const mediaflow::runtime::config::LoggingConfig& logging) {
  std::vector<spdlog::sink_ptr> sinks;
  sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());

  const auto file_path = Setting("MEDIAFLOW_LOG_FILE", logging.file_path(), "");
  if (!file_path.empty()) {
    const auto max_bytes = logging.max_file_bytes() > 0 ? logging.max_file_bytes() : kDefaultMaxFileBytes;
    const auto max_files = logging.max_files() > 0 ? logging.max_files() : kDefaultMaxFiles;
    sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(file_path, max_bytes, max_files));
  }
  return sinks;
}

} // namespace

LogField StringField(std::string_view key, std::string_view value) {
  return {std::string(key), std::string(value)};
}

LogField IntField(std::string_view key, std::int64_t value) {
  return {std::string(key), std::to_string(value)};
}

LogField DoubleField(std::string_view key, double value) {
  return {std::string(key), fmt::format("{:.3f}", value)};
}

LogField BoolField(std::string_view key, bool value) {
  return {std::string(key), value ? "true" : "false"};
}

void InitializeLogging(const mediaflow::runtime::config::RuntimeConfig& config) {
  const auto& logging = config.logging();

  // Replaced on re-initialization so a changed file sink takes effect.
  spdlog::drop(kLoggerName);
  const auto sinks  = BuildSinks(logging);
  auto       logger = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());

  logger->set_pattern(Setting("MEDIAFLOW_LOG_PATTERN", logging.pattern(), kDefaultPattern));
  logger->set_level(spdlog::level::from_str(Setting("MEDIAFLOW_LOG_LEVEL", logging.level(), "info")));
  logger->flush_on(spdlog::level::warn);
  spdlog::set_default_logger(std::move(logger));

  g_include_trace_context =
      logging.include_trace_context() || IsTruthy(Setting("MEDIAFLOW_LOG_INCLUDE_TRACE_CONTEXT", "", "false"));
}

void ShutdownLogging() {
  spdlog::shutdown();
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  auto line = SerializeFields(fields);
  if (auto trace_fields = TraceContextFields(); !trace_fields.empty()) {
    if (!line.empty()) {
      line += ' ';
    }
    line += trace_fields;
  }

  if (line.empty()) {
    spdlog::log(level, "{}", message);
  } else {
    spdlog::log(level, "{} {}", message, line);
  }
}

} // namespace mediaflow::observability
