#pragma once

#include <concepts>
#include <optional>
#include <string_view>
#include <type_traits>

namespace dynamap {

/// Trait struct for enum types to provide string conversion. Each enum type
/// stored in an entity field must specialize this struct, its string form is
/// what gets persisted.
template <typename E>
struct EnumTraits {
  static std::string_view ToString(E) {
    static_assert(sizeof(E) == 0, "EnumTraits not specialized for this enum type");
    return {};
  }

  static std::optional<E> FromString(std::string_view) {
    static_assert(sizeof(E) == 0, "EnumTraits not specialized for this enum type");
    return std::nullopt;
  }
};

/// Concept to ensure that EnumTraits specialization provides required methods
/// for a given enum type E.
template <typename E>
concept EnumTraitsRequired = std::is_enum_v<E> && requires(E e) {
  { EnumTraits<E>::ToString(e) } -> std::same_as<std::string_view>;
  { EnumTraits<E>::FromString(std::string_view{}) } -> std::same_as<std::optional<E>>;
};

} // namespace dynamap
