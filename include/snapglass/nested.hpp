#pragma once

#include "layout.hpp"
#include "value.hpp"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace snapglass {

// Rebuild the nested tree for one record from its flattened fields and decoded
// values (parallel vectors; a missing value is written as the zero of its
// field's scalar type).
//
// Object steps create or reuse members, index steps create or reuse dense
// arrays. The result has the schema's full shape however many fields decoded,
// and equal inputs always produce equal trees.
Value rebuild_nested(const std::vector<FieldPath>& fields,
                     const std::vector<std::optional<ScalarValue>>& values);

// Same, from a flat "name -> value" mapping. Names that do not parse are skipped.
Value rebuild_nested(const std::map<std::string, ScalarValue>& flat);

// Insert one leaf along `steps`. Returns false if the path conflicts with what
// is already there (e.g. indexing into an object).
bool insert_at_path(Value& root, const std::vector<PathStep>& steps, Value leaf);

// Same shape as `v` with every scalar replaced by the zero of its kind
Value zeroed_like(const Value& v);

} // namespace snapglass
