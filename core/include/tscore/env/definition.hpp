// tscore/env/definition.hpp - Declaration records owned by the Environment
//
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "tscore/types/type_id.hpp"
#include "tscore/types/type_key.hpp"

namespace tscore
{

class TypeInterner;

enum class DefKind : uint8_t {
  Interface,
  Class,
  TypeAlias,
  Enum,
  EnumMember,
  Function,
  Variable,
  TypeParameter,
};

[[nodiscard]] const char * def_kind_name(DefKind kind) noexcept;

/**
 * What the Environment knows about one declaration.
 *
 * - `body`: alias target, interface/class instance shape, enum type, enum
 *   member literal, or a type parameter's constraint.
 * - `value_type`: the declaration's value-side type, used by `typeof`.
 * - `parent`: the enum owning an EnumMember.
 */
struct DefinitionInfo
{
  DefKind kind = DefKind::TypeAlias;
  std::string name;
  std::vector<TypeParamInfo> type_params;
  TypeId body;
  TypeId value_type;
  EnumKind enum_kind = EnumKind::Numeric;
  DefId parent;

  /// Aliases are transparent; interfaces and classes keep nominal Lazy identity.
  [[nodiscard]] bool is_transparent() const noexcept { return kind == DefKind::TypeAlias; }
};

/**
 * Binder hook consulted when a DefId has no definition yet.
 *
 * Implementations must be safe to call from several threads; two threads may
 * ask for the same DefId, and only the first result is kept.
 */
class DefinitionProvider
{
public:
  virtual ~DefinitionProvider() = default;

  virtual std::optional<DefinitionInfo> provide(DefId def, TypeInterner & interner) = 0;
};

}  // namespace tscore
