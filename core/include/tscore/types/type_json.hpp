// tscore/types/type_json.hpp - JSON dump of interned type structure
//
// Provides a structural JSON serialization of a type and everything it
// references (one level per id, nested by value) for debugging and golden
// tests.
//
#pragma once

#include <nlohmann/json.hpp>

#include "tscore/types/type_id.hpp"

namespace tscore
{

class TypeInterner;

/**
 * Serialize a type to JSON.
 *
 * Every node carries `"kind"` (the TypeKey alternative name) and `"id"`.
 * References through Lazy / TypeQuery are emitted as `"def"` numbers and
 * not followed.
 *
 * @param max_depth nesting beyond this depth is emitted as `{"ref": id}`
 */
[[nodiscard]] nlohmann::json to_json(const TypeInterner & interner, TypeId id, int max_depth = 16);

}  // namespace tscore
