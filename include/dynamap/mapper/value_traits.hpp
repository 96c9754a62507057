#pragma once

#include "dynamap/base/enum_traits.hpp"
#include "dynamap/value/attribute_value.hpp"
#include "dynamap/value/date_time.hpp"
#include "dynamap/value/field_value.hpp"

#include <concepts>
#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

namespace dynamap {

/// Conversion between a C++ member type and a FieldValue. Each specialization
/// provides:
///   - kTypeName, used in conversion errors,
///   - To(const M&) -> FieldValue,
///   - From(const FieldValue&, M&) -> bool, false on a kind mismatch.
/// From() is only called with set values.
template <typename M>
struct ValueTraits;

template <>
struct ValueTraits<std::string> {
  static constexpr std::string_view kTypeName = "string";

  static FieldValue To(const std::string& v) {
    return FieldValue(v);
  }

  static bool From(const FieldValue& v, std::string& out) {
    const auto* s = v.AsString();
    if (s == nullptr) {
      return false;
    }
    out = *s;
    return true;
  }
};

template <>
struct ValueTraits<bool> {
  static constexpr std::string_view kTypeName = "bool";

  static FieldValue To(bool v) {
    return FieldValue(v);
  }

  static bool From(const FieldValue& v, bool& out) {
    const auto* b = v.AsBool();
    if (b == nullptr) {
      return false;
    }
    out = *b;
    return true;
  }
};

template <typename M>
  requires(std::is_integral_v<M> && !std::is_same_v<M, bool>)
struct ValueTraits<M> {
  static constexpr std::string_view kTypeName = "integer";

  static FieldValue To(M v) {
    return FieldValue(static_cast<int64_t>(v));
  }

  static bool From(const FieldValue& v, M& out) {
    const auto* i = v.AsInteger();
    if (i == nullptr || !std::in_range<M>(*i)) {
      return false;
    }
    out = static_cast<M>(*i);
    return true;
  }
};

template <typename M>
  requires std::is_floating_point_v<M>
struct ValueTraits<M> {
  static constexpr std::string_view kTypeName = "decimal";

  static FieldValue To(M v) {
    return FieldValue(static_cast<double>(v));
  }

  static bool From(const FieldValue& v, M& out) {
    if (const auto* d = v.AsDecimal(); d != nullptr) {
      out = static_cast<M>(*d);
      return true;
    }
    if (const auto* i = v.AsInteger(); i != nullptr) {
      out = static_cast<M>(*i);
      return true;
    }
    return false;
  }
};

template <>
struct ValueTraits<Binary> {
  static constexpr std::string_view kTypeName = "binary";

  static FieldValue To(const Binary& v) {
    return FieldValue(v);
  }

  static bool From(const FieldValue& v, Binary& out) {
    const auto* b = v.AsBinary();
    if (b == nullptr) {
      return false;
    }
    out = *b;
    return true;
  }
};

template <>
struct ValueTraits<DateTime> {
  static constexpr std::string_view kTypeName = "datetime";

  static FieldValue To(const DateTime& v) {
    return FieldValue(v);
  }

  static bool From(const FieldValue& v, DateTime& out) {
    const auto* dt = v.AsDateTime();
    if (dt == nullptr) {
      return false;
    }
    out = *dt;
    return true;
  }
};

/// Enums are stored by name, see EnumTraits.
template <typename E>
  requires EnumTraitsRequired<E>
struct ValueTraits<E> {
  static constexpr std::string_view kTypeName = "enum";

  static FieldValue To(E v) {
    return FieldValue(EnumTraits<E>::ToString(v));
  }

  static bool From(const FieldValue& v, E& out) {
    const auto* s = v.AsString();
    if (s == nullptr) {
      return false;
    }
    auto parsed = EnumTraits<E>::FromString(*s);
    if (!parsed) {
      return false;
    }
    out = *parsed;
    return true;
  }
};

template <typename U>
struct ValueTraits<std::optional<U>> {
  static constexpr std::string_view kTypeName = ValueTraits<U>::kTypeName;

  static FieldValue To(const std::optional<U>& v) {
    return v.has_value() ? ValueTraits<U>::To(*v) : FieldValue();
  }

  static bool From(const FieldValue& v, std::optional<U>& out) {
    U inner{};
    if (!ValueTraits<U>::From(v, inner)) {
      return false;
    }
    out = std::move(inner);
    return true;
  }
};

template <typename U>
  requires(!std::is_same_v<U, uint8_t>)
struct ValueTraits<std::vector<U>> {
  static constexpr std::string_view kTypeName = "list";

  static FieldValue To(const std::vector<U>& v) {
    FieldValue::List items;
    items.reserve(v.size());
    for (const auto& item : v) {
      items.push_back(ValueTraits<U>::To(item));
    }
    return FieldValue(std::move(items));
  }

  static bool From(const FieldValue& v, std::vector<U>& out) {
    const auto* items = v.AsList();
    if (items == nullptr) {
      return false;
    }
    out.clear();
    out.reserve(items->size());
    for (const auto& item : *items) {
      U element{};
      if (!ValueTraits<U>::From(item, element)) {
        return false;
      }
      out.push_back(std::move(element));
    }
    return true;
  }
};

template <typename U>
struct ValueTraits<std::set<U>> {
  static constexpr std::string_view kTypeName = "set";

  static FieldValue To(const std::set<U>& v) {
    FieldValue::List items;
    items.reserve(v.size());
    for (const auto& item : v) {
      items.push_back(ValueTraits<U>::To(item));
    }
    return FieldValue(std::move(items));
  }

  static bool From(const FieldValue& v, std::set<U>& out) {
    const auto* items = v.AsList();
    if (items == nullptr) {
      return false;
    }
    out.clear();
    for (const auto& item : *items) {
      U element{};
      if (!ValueTraits<U>::From(item, element)) {
        return false;
      }
      out.insert(std::move(element));
    }
    return true;
  }
};

} // namespace dynamap
