#pragma once

#include <cstdint>
#include <format>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace dynamap {

/// Forward declaration of Error class
class Error;

/// All the error code names, values, and message formats are listed in this macro.
///
/// To add a new error code, simply add a new line in this macro with the
/// format, all the other code will be generated automatically.
#define DYNAMAP_ERROR_CODE_LIST(ACTION)                                                            \
  ACTION(General, 001, "{}")                                                                       \
  ACTION(NotImplemented, 002, "{}")                                                                \
  ACTION(InvalidArgument, 003, "{}")                                                               \
  ACTION(FileOpen, 100, "Open file failed, file={}, errno={}, strerror={}")                        \
  ACTION(FileRead, 103, "Read file failed, file={}, errno={}, strerror={}")                        \
  ACTION(DefinitionParse, 110, "Parse entity definitions failed, source={}, reason={}")            \
  ACTION(SchemaBuildFailed, 200, "Build schema failed, entity={}, errors={}, first={}")            \
  ACTION(SchemaNotFound, 201, "Schema not found, entity={}")                                       \
  ACTION(ConversionError, 300,                                                                     \
         "Convert attribute failed, field={}, node={}, target_type={}, cause={}")                  \
  ACTION(IncompleteKeyMaterial, 301, "Incomplete key material, field={}, missing_source={}")       \
  ACTION(EntityConstructionFailed, 302, "Construct entity failed, schema={}, cause={}")            \
  ACTION(EncryptionHookFailed, 303,                                                                \
         "Field encryption hook failed, field={}, operation={}, cause={}")

#define DYNAMAP_ERROR_CODE(ename) k##ename

#define DYNAMAP_ERROR_FMT(ename) k##ename##MsgFmt

#define DYNAMAP_DEFINE_ERROR_CODE(ename, evalue, ...) DYNAMAP_ERROR_CODE(ename) = evalue,

#define DYNAMAP_DEFINE_ERROR_BUILDER(ename, ...)                                                   \
  template <typename... Args>                                                                      \
  static Error ename(Args&&... args) {                                                             \
    return Error(Error::Code::DYNAMAP_ERROR_CODE(ename),                                           \
                 std::vformat(DYNAMAP_ERROR_FMT(ename), std::make_format_args(args...)));          \
  }
#define DYNAMAP_DEFINE_ERROR_FMT(ename, evalue, efmt, ...)                                         \
  static const constexpr char* DYNAMAP_ERROR_FMT(ename) = efmt;

/// Representation of an error with code, message, and structured context.
///
/// 1. All the error codes and corresponding message formats are listed in
///    DYNAMAP_ERROR_CODE_LIST macro.
///
/// 2. Errors should be created using the static factory methods. All factory
///    method names are the same as the error code names. Factory method
///    arguments should match the format string parameters in the
///    DYNAMAP_ERROR_CODE_LIST macro.
///
/// 3. Mapping errors attach context pairs (field, record, schema, ...) with
///    WithContext(), so callers can inspect the offending field and record
///    without parsing the message.
///
/// Example usage:
///   auto err1 = Error::General("A general error occurred");
///   auto err2 = Error::IncompleteKeyMaterial("pk", "tenant_id").WithContext("schema", "Order");
class Error {
public:
  /// Error codes.
  enum Code : int64_t { DYNAMAP_ERROR_CODE_LIST(DYNAMAP_DEFINE_ERROR_CODE) };

  using ContextEntry = std::pair<std::string, std::string>;

  /// Returns the error code.
  Code GetCode() const {
    return code_;
  }

  /// Returns the formatted message without code prefix and context.
  const std::string& Message() const {
    return message_;
  }

  /// Returns all the attached context entries in insertion order.
  const std::vector<ContextEntry>& Context() const {
    return context_;
  }

  /// Returns the first context value attached under the given key.
  std::optional<std::string_view> ContextValue(std::string_view key) const {
    for (const auto& [k, v] : context_) {
      if (k == key) {
        return std::string_view(v);
      }
    }
    return std::nullopt;
  }

  /// Attaches a context entry, returns the error itself for chaining.
  Error& WithContext(std::string key, std::string value) & {
    context_.emplace_back(std::move(key), std::move(value));
    return *this;
  }

  Error&& WithContext(std::string key, std::string value) && {
    context_.emplace_back(std::move(key), std::move(value));
    return std::move(*this);
  }

  /// Returns the string representation of the Error, including context if available.
  std::string ToString() const {
    auto str = std::format("[ERR-{:03}] {}", static_cast<int64_t>(code_), message_);
    for (const auto& [k, v] : context_) {
      str += std::format(", {}={}", k, v);
    }
    return str;
  }

  /// Stream output operator for Error.
  friend std::ostream& operator<<(std::ostream& os, const Error& error) {
    return os << error.ToString();
  }

  /// Equality operator for Error. Context is not part of the identity.
  bool operator==(const Error& other) const {
    return code_ == other.code_ && message_ == other.message_;
  }

  /// Inequality operator for Error.
  bool operator!=(const Error& other) const {
    return !(*this == other);
  }

  /// Factory methods for creating errors for each error code.
  DYNAMAP_ERROR_CODE_LIST(DYNAMAP_DEFINE_ERROR_BUILDER);

private:
  /// Make constructor private to enforce usage of factory methods.
  Error(Code code, std::string&& message) : code_(code), message_(std::move(message)) {
  }

  /// Message formats for each error code.
  DYNAMAP_ERROR_CODE_LIST(DYNAMAP_DEFINE_ERROR_FMT);

  Code code_;                         // error code.
  std::string message_;               // error message.
  std::vector<ContextEntry> context_; // structured context, e.g. field and record.
};

#undef DYNAMAP_ERROR_CODE_LIST
#undef DYNAMAP_ERROR_CODE
#undef DYNAMAP_ERROR_FMT
#undef DYNAMAP_DEFINE_ERROR_CODE
#undef DYNAMAP_DEFINE_ERROR_BUILDER
#undef DYNAMAP_DEFINE_ERROR_FMT

} // namespace dynamap
