//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#include <string>

#include <fmt/format.h>

#include <Vellum/Path/FieldValue.h>

namespace vellum::path {

auto to_string(const FieldValue& value) -> std::string
{
  if (const auto* number = std::get_if<std::int64_t>(&value)) {
    return std::to_string(*number);
  }
  return std::get<std::string>(value);
}

auto to_string(const Fields& fields) -> std::string
{
  std::string out = "{";
  bool first = true;
  for (const auto& [name, value] : fields) {
    if (!first) {
      out += ", ";
    }
    first = false;
    if (IsInteger(value)) {
      out += fmt::format("{}: {}", name, to_string(value));
    } else {
      out += fmt::format("{}: '{}'", name, to_string(value));
    }
  }
  out += "}";
  return out;
}

} // namespace vellum::path
