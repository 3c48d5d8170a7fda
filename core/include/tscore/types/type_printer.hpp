// tscore/types/type_printer.hpp - Render types in source-language syntax
//
#pragma once

#include <string>

#include "tscore/types/type_id.hpp"

namespace tscore
{

class TypeInterner;
class Environment;

/**
 * Render a type the way it would be written in source.
 *
 * Lazy, enum and typeof references print their declaration name when an
 * Environment is supplied, and `#<def>` otherwise. References are not
 * expanded, so recursive types print finitely.
 */
[[nodiscard]] std::string to_string(
  const TypeInterner & interner, TypeId id, const Environment * env = nullptr);

}  // namespace tscore
