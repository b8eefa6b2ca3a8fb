//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <string>
#include <string_view>
#include <vector>

#include <Vellum/Publish/ExportedFile.h>
#include <Vellum/Publish/TextureSet.h>
#include <Vellum/Publish/api_export.h>

namespace vellum::publish {

//! Publish name of a texture set: the source name with underscores removed.
VLLM_PUBL_NDAPI auto TextureSetPublishName(std::string_view source_name)
  -> std::string;

//! Groups exported files into texture sets.
/*!
 Files are grouped by texture set name, then by map. Texture sets and maps
 keep the order in which they first appear in the input; tiles are sorted by
 UDIM number. Partial tile sequences (e.g. `1001` and `1003` only) are valid.

 Aggregation fails with `InconsistentTextureSetError` when:
 - a map name contains `_`, `.`, a path separator or whitespace,
 - the same map, color space and tile appear more than once,
 - a map mixes tiled and untiled files,
 - the tiles of one map have different extensions,
 - with `single_slot_per_map`, one map is exported with two color spaces.

 Without `single_slot_per_map`, a map exported with two color spaces
 becomes two distinct maps.
*/
class TextureSetAggregator {
public:
  struct Options {
    //! Destination templates reserve one path per map name.
    bool single_slot_per_map = true;
  };

  TextureSetAggregator() = default;

  explicit TextureSetAggregator(const Options options)
    : options_(options)
  {
  }

  VLLM_PUBL_NDAPI auto Aggregate(const std::vector<ExportedFile>& files) const
    -> std::vector<TextureSet>;

private:
  Options options_;
};

} // namespace vellum::publish
