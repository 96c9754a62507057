#pragma once

#include <cstdint>
#include <string>

namespace dynamap {

enum class LogLevel : uint8_t {
  kDebug = 0,
  kInfo,
  kWarn,
  kError,
};

/// How extracted key components are assigned when the source key splits into
/// fewer parts than the declared component index.
enum class ExtractionPolicy : uint8_t {
  /// Inherit MapperOption::extraction_policy_.
  kDefault = 0,
  /// Leave the component absent and log a warning.
  kLenient,
  /// Fail the mapping operation with a ConversionError.
  kStrict,
};

struct MapperOption {
  // ---------------------------------------------------------------------------
  // log related options
  // ---------------------------------------------------------------------------

  /// The log level.
  LogLevel log_level_ = LogLevel::kInfo;

  /// Log file path, logs go to stderr when empty.
  std::string log_file_;

  /// Whether fields marked sensitive are redacted in log lines and error
  /// context.
  bool redact_sensitive_ = true;

  // ---------------------------------------------------------------------------
  // mapping related options
  // ---------------------------------------------------------------------------

  /// Policy for extracted fields declared with ExtractionPolicy::kDefault.
  ExtractionPolicy extraction_policy_ = ExtractionPolicy::kLenient;

  /// Whether a raw record matching more than one configured shape is reported
  /// as a warning.
  bool warn_on_ambiguous_shapes_ = true;

  /// Whether partition-key groups without a primary record are logged.
  bool warn_on_orphans_ = true;
};

inline const char* ToString(ExtractionPolicy policy) {
  switch (policy) {
  case ExtractionPolicy::kDefault:
    return "default";
  case ExtractionPolicy::kLenient:
    return "lenient";
  case ExtractionPolicy::kStrict:
    return "strict";
  }
  return "unknown";
}

} // namespace dynamap
