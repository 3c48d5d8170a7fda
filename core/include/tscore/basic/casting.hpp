// tscore/basic/casting.hpp - LLVM-style casting over the TypeKey variant
//
// Gives TypeKey the same isa / cast / dyn_cast vocabulary used for class
// hierarchies, backed by std::variant queries instead of classof().
//
// Usage:
//   if (isa<UnionKey>(key)) { ... }
//   const auto & u = cast<UnionKey>(key);         // asserts on failure
//   if (const auto * obj = dyn_cast<ObjectKey>(key)) { ... }  // nullptr on failure
//
#pragma once

#include <cassert>
#include <variant>

namespace tscore
{

// ============================================================================
// isa<T> - Variant alternative check
// ============================================================================

/**
 * Check whether a variant currently holds alternative T.
 *
 * @tparam T The alternative to test for
 * @param v The variant to inspect
 * @return true if v holds a T
 */
template <typename T, typename... Ts>
[[nodiscard]] inline bool isa(const std::variant<Ts...> & v) noexcept
{
  return std::holds_alternative<T>(v);
}

// ============================================================================
// cast<T> - Unchecked access (asserts on failure)
// ============================================================================

/**
 * Access alternative T, asserting that the variant holds it.
 *
 * @note Use dyn_cast when the alternative is not known in advance.
 */
template <typename T, typename... Ts>
[[nodiscard]] inline const T & cast(const std::variant<Ts...> & v) noexcept
{
  const T * p = std::get_if<T>(&v);
  assert(p != nullptr && "Invalid cast");
  return *p;
}

// ============================================================================
// dyn_cast<T> - Safe access (returns nullptr on failure)
// ============================================================================

/**
 * Access alternative T if held, nullptr otherwise.
 *
 * Example:
 *   if (const auto * lit = dyn_cast<LiteralKey>(key)) {
 *     // Use lit safely
 *   }
 */
template <typename T, typename... Ts>
[[nodiscard]] inline const T * dyn_cast(const std::variant<Ts...> & v) noexcept
{
  return std::get_if<T>(&v);
}

// ============================================================================
// Exhaustive matching helper
// ============================================================================

/// Overload set for std::visit with one lambda per alternative.
template <typename... Fs>
struct Overloaded : Fs...
{
  using Fs::operator()...;
};

template <typename... Fs>
Overloaded(Fs...) -> Overloaded<Fs...>;

}  // namespace tscore
