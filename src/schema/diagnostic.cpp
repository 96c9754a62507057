#include "dynamap/schema/diagnostic.hpp"

#include <algorithm>
#include <format>

namespace dynamap {

std::string_view ToString(DiagnosticCode code) {
#define DYNAMAP_DIAGNOSTIC_NAME(dname, ...)                                                        \
  case DiagnosticCode::k##dname:                                                                   \
    return #dname;

  switch (code) { DYNAMAP_DIAGNOSTIC_LIST(DYNAMAP_DIAGNOSTIC_NAME) }
  return "Unknown";

#undef DYNAMAP_DIAGNOSTIC_NAME
}

DiagnosticSeverity SeverityOf(DiagnosticCode code) {
#define DYNAMAP_DIAGNOSTIC_SEVERITY(dname, dvalue, dseverity)                                      \
  case DiagnosticCode::k##dname:                                                                   \
    return DiagnosticSeverity::dseverity;

  switch (code) { DYNAMAP_DIAGNOSTIC_LIST(DYNAMAP_DIAGNOSTIC_SEVERITY) }
  return DiagnosticSeverity::kError;

#undef DYNAMAP_DIAGNOSTIC_SEVERITY
}

std::string Diagnostic::ToString() const {
  return std::format("DYN{:03} {} at {}: {}", static_cast<uint16_t>(code_),
                     dynamap::ToString(code_), field_path_, message_);
}

bool HasErrors(const Diagnostics& diagnostics) {
  return std::any_of(diagnostics.begin(), diagnostics.end(),
                     [](const Diagnostic& d) { return d.IsError(); });
}

Diagnostic MakeDiagnostic(DiagnosticCode code, std::string field_path, std::string message) {
  return Diagnostic{
      .code_ = code,
      .severity_ = SeverityOf(code),
      .message_ = std::move(message),
      .field_path_ = std::move(field_path),
  };
}

} // namespace dynamap
