#pragma once

#include "dynamap/base/result.hpp"
#include "dynamap/value/attribute_value.hpp"

#include <future>
#include <string>

namespace dynamap {

/// Identifies the value passed to an encryption hook.
struct FieldEncryptionContext {
  std::string entity_id_;
  std::string field_name_;
  std::string stored_name_;
};

/// Pluggable per-field encryption hook. The mapper waits on every returned
/// future in place before it continues with the next field, and reports
/// failures as EncryptionHookFailed without retrying.
class FieldEncryptor {
public:
  virtual ~FieldEncryptor() = default;

  virtual std::future<Result<Binary>> EncryptAsync(const Binary& plaintext,
                                                   const FieldEncryptionContext& context) = 0;

  virtual std::future<Result<Binary>> DecryptAsync(const Binary& ciphertext,
                                                   const FieldEncryptionContext& context) = 0;
};

} // namespace dynamap
