#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace mintgate::runtime::config {
class RuntimeConfig;
}

namespace mintgate::observability {

/*
  Structured logging for the gateway.

  Every line is a fixed message followed by key=value pairs, e.g.

    Minted after payment proof=0xab.. recipient=0x12.. paid=10000 mint_tx=0xcd..

  Messages stay constant so they can be grepped; anything that varies
  (hashes, addresses, amounts, RPC errors) goes in a field. Amounts are
  logged as decimal base-unit strings, never as floats.
*/

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);

// Level and pattern come from MINTGATE_LOG_LEVEL / MINTGATE_LOG_PATTERN,
// then the `logging` config block. Safe to call more than once.
void InitializeLogging(const mintgate::runtime::config::RuntimeConfig& config);
void ShutdownLogging();

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields = {});

inline void LogInfo(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::info, message, fields);
}

// Recoverable: a retried poll, a rejected request, a skipped log entry.
inline void LogWarn(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::warn, message, fields);
}

// Needs an operator: misconfiguration, or a mint whose outcome is unknown.
inline void LogError(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::err, message, fields);
}

} // namespace mintgate::observability

#define MINTGATE_LOG_INFO(message, ...) ::mintgate::observability::LogInfo((message), ##__VA_ARGS__)
#define MINTGATE_LOG_WARN(message, ...) ::mintgate::observability::LogWarn((message), ##__VA_ARGS__)
#define MINTGATE_LOG_ERROR(message, ...) ::mintgate::observability::LogError((message), ##__VA_ARGS__)
