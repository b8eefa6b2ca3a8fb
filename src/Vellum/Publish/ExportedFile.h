//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace vellum::publish {

//! A file written by the exporter, with its name parsed.
/*!
 File names follow `<texture_set>_<map_name>_<color_space>[.<udim>].<ext>`,
 for example `hull_Normal_raw.1001.png`. Tokens keep the case they have on
 disk.
*/
struct ExportedFile {
  std::filesystem::path path;
  std::string texture_set;
  std::string map_name;
  std::string color_space;
  std::optional<uint32_t> udim;
  std::string extension;

  [[nodiscard]] auto IsTiled() const noexcept -> bool
  {
    return udim.has_value();
  }

  [[nodiscard]] auto operator==(const ExportedFile&) const -> bool = default;
};

//! A file name that does not follow the export naming convention.
struct PatternMismatch {
  std::filesystem::path path;
  std::string reason;

  [[nodiscard]] auto operator==(const PatternMismatch&) const -> bool
    = default;
};

} // namespace vellum::publish
