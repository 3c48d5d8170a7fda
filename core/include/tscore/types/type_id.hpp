// tscore/types/type_id.hpp - Opaque handles for interned types and declarations
//
// TypeId and DefId are plain integer handles. Types never embed each other
// directly; every cross-reference goes through one of these ids, which keeps
// cyclic type graphs representable without cyclic ownership.
//
#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>

namespace tscore
{

// ============================================================================
// TypeId
// ============================================================================

/**
 * Handle to an interned type.
 *
 * Equality of handles implies structural equality of the denoted types.
 * Value 0 is reserved as the invalid / "absent" handle.
 */
struct TypeId
{
  uint32_t value = 0;

  constexpr TypeId() noexcept = default;
  explicit constexpr TypeId(uint32_t v) noexcept : value(v) {}

  [[nodiscard]] constexpr bool is_valid() const noexcept { return value != 0; }
  [[nodiscard]] constexpr bool is_intrinsic() const noexcept;

  friend constexpr bool operator==(TypeId a, TypeId b) noexcept { return a.value == b.value; }
  friend constexpr bool operator!=(TypeId a, TypeId b) noexcept { return a.value != b.value; }
  friend constexpr bool operator<(TypeId a, TypeId b) noexcept { return a.value < b.value; }
};

// ============================================================================
// DefId
// ============================================================================

/**
 * Stable identity of a declaration (class, interface, alias, enum, function,
 * variable or type parameter), assigned once by the binder.
 */
struct DefId
{
  uint32_t value = 0;

  constexpr DefId() noexcept = default;
  explicit constexpr DefId(uint32_t v) noexcept : value(v) {}

  [[nodiscard]] constexpr bool is_valid() const noexcept { return value != 0; }

  friend constexpr bool operator==(DefId a, DefId b) noexcept { return a.value == b.value; }
  friend constexpr bool operator!=(DefId a, DefId b) noexcept { return a.value != b.value; }
  friend constexpr bool operator<(DefId a, DefId b) noexcept { return a.value < b.value; }
};

// ============================================================================
// Intrinsic Types
// ============================================================================

/**
 * Kind of intrinsic (built-in, non-composite) type.
 *
 * Intrinsics occupy fixed ids below k_first_user_type_id, so they can be
 * named as compile-time constants.
 */
enum class IntrinsicKind : uint8_t {
  Any,
  Unknown,
  Never,
  Void,
  Null,
  Undefined,
  Boolean,
  Number,
  String,
  BigInt,
  Symbol,
  Object,      ///< non-primitive `object`
  Function,    ///< global untyped callable `Function`
  Unresolved,  ///< sentinel for a reference whose declaration is missing
};

inline constexpr uint32_t k_intrinsic_count = 14;
inline constexpr uint32_t k_first_user_type_id = 64;

[[nodiscard]] constexpr TypeId intrinsic_type_id(IntrinsicKind kind) noexcept
{
  return TypeId{static_cast<uint32_t>(kind) + 1};
}

constexpr bool TypeId::is_intrinsic() const noexcept
{
  return value != 0 && value <= k_intrinsic_count;
}

inline constexpr TypeId k_invalid_type{};
inline constexpr TypeId k_any = intrinsic_type_id(IntrinsicKind::Any);
inline constexpr TypeId k_unknown = intrinsic_type_id(IntrinsicKind::Unknown);
inline constexpr TypeId k_never = intrinsic_type_id(IntrinsicKind::Never);
inline constexpr TypeId k_void = intrinsic_type_id(IntrinsicKind::Void);
inline constexpr TypeId k_null = intrinsic_type_id(IntrinsicKind::Null);
inline constexpr TypeId k_undefined = intrinsic_type_id(IntrinsicKind::Undefined);
inline constexpr TypeId k_boolean = intrinsic_type_id(IntrinsicKind::Boolean);
inline constexpr TypeId k_number = intrinsic_type_id(IntrinsicKind::Number);
inline constexpr TypeId k_string = intrinsic_type_id(IntrinsicKind::String);
inline constexpr TypeId k_bigint = intrinsic_type_id(IntrinsicKind::BigInt);
inline constexpr TypeId k_symbol = intrinsic_type_id(IntrinsicKind::Symbol);
inline constexpr TypeId k_object = intrinsic_type_id(IntrinsicKind::Object);
inline constexpr TypeId k_function = intrinsic_type_id(IntrinsicKind::Function);
inline constexpr TypeId k_unresolved = intrinsic_type_id(IntrinsicKind::Unresolved);

inline constexpr DefId k_invalid_def{};

/// Name of an intrinsic as written in source ("any", "string", ...).
[[nodiscard]] const char * intrinsic_name(IntrinsicKind kind) noexcept;

/// Primitives that have an apparent object interface.
[[nodiscard]] constexpr bool is_primitive_kind(IntrinsicKind kind) noexcept
{
  return kind == IntrinsicKind::String || kind == IntrinsicKind::Number ||
         kind == IntrinsicKind::Boolean || kind == IntrinsicKind::BigInt ||
         kind == IntrinsicKind::Symbol;
}

}  // namespace tscore

namespace std
{

template <>
struct hash<tscore::TypeId>
{
  size_t operator()(tscore::TypeId id) const noexcept { return hash<uint32_t>{}(id.value); }
};

template <>
struct hash<tscore::DefId>
{
  size_t operator()(tscore::DefId id) const noexcept { return hash<uint32_t>{}(id.value); }
};

}  // namespace std
