#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace dynamap {

/// All the schema diagnostics: name, numeric id, severity.
#define DYNAMAP_DIAGNOSTIC_LIST(ACTION)                                                            \
  ACTION(InvalidDefinition, 1, kError)                                                             \
  ACTION(MissingPartitionKey, 2, kError)                                                           \
  ACTION(MultiplePartitionKeys, 3, kError)                                                         \
  ACTION(MultipleSortKeys, 4, kError)                                                              \
  ACTION(DuplicateFieldName, 5, kError)                                                            \
  ACTION(DuplicateStoredName, 6, kError)                                                           \
  ACTION(CollectionFieldCannotBeKey, 7, kError)                                                    \
  ACTION(ConflictingFieldRoles, 8, kError)                                                         \
  ACTION(InvalidGsiConfiguration, 9, kError)                                                       \
  ACTION(CircularKeyDependency, 10, kError)                                                        \
  ACTION(InvalidDerivedKeySource, 11, kError)                                                      \
  ACTION(InvalidExtractedKeySource, 12, kError)                                                    \
  ACTION(InvalidKeyFormat, 13, kError)                                                             \
  ACTION(InvalidFieldFormat, 14, kError)                                                           \
  ACTION(InvalidNestedShape, 15, kError)                                                           \
  ACTION(InvalidRelationshipTarget, 16, kError)                                                    \
  ACTION(RelationshipsRequireSortKey, 17, kWarning)                                                \
  ACTION(ConflictingRelationshipPatterns, 18, kWarning)                                            \
  ACTION(InvalidDiscriminator, 19, kError)                                                         \
  ACTION(AmbiguousDiscriminator, 20, kWarning)                                                     \
  ACTION(ConflictingEntityShapes, 21, kError)

enum class DiagnosticSeverity : uint8_t {
  kWarning = 0,
  kError,
};

#define DYNAMAP_DEFINE_DIAGNOSTIC_CODE(dname, dvalue, ...) k##dname = dvalue,

enum class DiagnosticCode : uint16_t { DYNAMAP_DIAGNOSTIC_LIST(DYNAMAP_DEFINE_DIAGNOSTIC_CODE) };

#undef DYNAMAP_DEFINE_DIAGNOSTIC_CODE

/// Name of the diagnostic code, e.g. "CircularKeyDependency".
std::string_view ToString(DiagnosticCode code);

/// Default severity of the diagnostic code.
DiagnosticSeverity SeverityOf(DiagnosticCode code);

/// One problem found while building a schema.
struct Diagnostic {
  DiagnosticCode code_;
  DiagnosticSeverity severity_ = DiagnosticSeverity::kError;
  std::string message_;

  /// "<entity>.<field>" or "<entity>" for entity level problems.
  std::string field_path_;

  /// Renders as "DYN010 CircularKeyDependency at Order.pk: message".
  std::string ToString() const;

  bool IsError() const {
    return severity_ == DiagnosticSeverity::kError;
  }
};

using Diagnostics = std::vector<Diagnostic>;

bool HasErrors(const Diagnostics& diagnostics);

/// Creates a diagnostic with the default severity of its code.
Diagnostic MakeDiagnostic(DiagnosticCode code, std::string field_path, std::string message);

} // namespace dynamap
