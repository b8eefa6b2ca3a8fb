//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include <Vellum/Publish/ExportedFile.h>

namespace vellum::publish {

//! One texture map of a texture set: a single file, or a UDIM tile sequence.
struct TextureMap {
  std::string name;
  std::string color_space;
  std::string extension;

  //! Single untiled file, or tiles sorted by UDIM number.
  std::vector<ExportedFile> files;

  [[nodiscard]] auto IsTiled() const noexcept -> bool
  {
    return !files.empty() && files.front().IsTiled();
  }

  [[nodiscard]] auto Tiles() const -> std::vector<uint32_t>
  {
    std::vector<uint32_t> tiles;
    for (const auto& file : files) {
      if (file.udim) {
        tiles.push_back(*file.udim);
      }
    }
    return tiles;
  }
};

//! Exported maps grouped into one logical artifact.
struct TextureSet {
  //! Name used by the painting application, e.g. `hull_main`.
  std::string source_name;

  //! Name used in publish paths and records: `source_name` without `_`.
  std::string publish_name;

  //! Publish version, assigned when the set is staged.
  int version = 0;

  //! Maps in order of first appearance in the export.
  std::vector<TextureMap> maps;

  bool is_tiled = false;

  [[nodiscard]] auto FindMap(const std::string_view name) const
    -> const TextureMap*
  {
    const auto it = std::ranges::find(maps, name, &TextureMap::name);
    return it == maps.end() ? nullptr : &*it;
  }

  [[nodiscard]] auto FileCount() const noexcept -> std::size_t
  {
    std::size_t count = 0;
    for (const auto& map : maps) {
      count += map.files.size();
    }
    return count;
  }
};

} // namespace vellum::publish
