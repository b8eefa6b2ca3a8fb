//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <variant>

#include <Vellum/Path/api_export.h>

namespace vellum::path {

//! Value bound to a template field: a string or a non-negative integer.
using FieldValue = std::variant<std::string, std::int64_t>;

//! Field name to value mapping, ordered for deterministic iteration.
/*!
 Field names are key names, or the key alias when the key declares one.
*/
using Fields = std::map<std::string, FieldValue>;

//! Human-readable form of a field value (integers unpadded).
VLLM_PATH_NDAPI auto to_string(const FieldValue& value) -> std::string;

//! Render a field map as `{a: 'x', b: 3}` for diagnostics.
VLLM_PATH_NDAPI auto to_string(const Fields& fields) -> std::string;

//! Returns true if the value holds an integer.
[[nodiscard]] inline auto IsInteger(const FieldValue& value) noexcept -> bool
{
  return std::holds_alternative<std::int64_t>(value);
}

} // namespace vellum::path
