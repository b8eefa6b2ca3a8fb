//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <string>
#include <string_view>
#include <vector>

#include <Vellum/Path/api_export.h>

namespace vellum::path {

//! A network share and the drive it is mounted as, e.g.
//! `\\studio\projects` and `P:`.
struct PathMapping {
  std::string unc_prefix;
  std::string mapped_drive_prefix;

  [[nodiscard]] auto operator==(const PathMapping&) const -> bool = default;
};

//! Translates paths between UNC and mapped-drive forms.
/*!
 Some tools cannot write to UNC locations, so export areas resolved from
 templates are handed to them with the share replaced by its drive letter.

 Prefix matching ignores case and treats `/` and `\` as the same separator.
 A prefix only matches whole path components (`\\srv\share` does not match
 `\\srv\share2`). Only the prefix is replaced; the rest of the path is kept
 verbatim. The first matching mapping wins. Paths that match no mapping are
 returned unchanged.
*/
class PathMapper {
public:
  PathMapper() = default;

  //! Mappings with an empty prefix on either side are ignored.
  VLLM_PATH_API explicit PathMapper(std::vector<PathMapping> mappings);

  VLLM_PATH_NDAPI auto ToMappedDrive(std::string_view path) const
    -> std::string;

  VLLM_PATH_NDAPI auto ToUnc(std::string_view path) const -> std::string;

  [[nodiscard]] auto Mappings() const noexcept
    -> const std::vector<PathMapping>&
  {
    return mappings_;
  }

  [[nodiscard]] auto Empty() const noexcept -> bool
  {
    return mappings_.empty();
  }

private:
  std::vector<PathMapping> mappings_;
};

} // namespace vellum::path
