//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>
#include <optional>

//! UDIM tile numbering helpers.
/*!
 @file Udim.h

 A UDIM tile number encodes the position of a unit square in UV space: tile
 `1001` covers `[0,1]x[0,1]`, numbers increase by one along U for ten tiles,
 then by ten along V:

 ```text
 1011 1012 1013 ...
 1001 1002 1003 ... 1010
 ```
*/

namespace vellum::publish {

//! First UDIM tile, covering the UV unit square.
inline constexpr uint32_t kFirstUdimTile = 1001;

//! Largest tile expressible with four digits.
inline constexpr uint32_t kLastUdimTile = 9999;

//! Number of tiles in one UDIM row.
inline constexpr uint32_t kUdimRowSize = 10;

//! Integer UV block coordinates of a tile.
struct UdimBlock {
  uint32_t u = 0;
  uint32_t v = 0;

  [[nodiscard]] constexpr auto operator==(const UdimBlock&) const -> bool
    = default;
};

[[nodiscard]] constexpr auto IsValidUdim(const uint32_t tile) noexcept -> bool
{
  return tile >= kFirstUdimTile && tile <= kLastUdimTile;
}

//! Tile number of a block. `u` must be in `[0, 9]`.
[[nodiscard]] constexpr auto UdimFromBlock(const UdimBlock block) noexcept
  -> std::optional<uint32_t>
{
  if (block.u >= kUdimRowSize) {
    return std::nullopt;
  }
  const auto tile = kFirstUdimTile + block.u + block.v * kUdimRowSize;
  if (!IsValidUdim(tile)) {
    return std::nullopt;
  }
  return tile;
}

//! Block coordinates of a tile number.
[[nodiscard]] constexpr auto BlockFromUdim(const uint32_t tile) noexcept
  -> std::optional<UdimBlock>
{
  if (!IsValidUdim(tile)) {
    return std::nullopt;
  }
  return UdimBlock {
    .u = (tile - kFirstUdimTile) % kUdimRowSize,
    .v = (tile - kFirstUdimTile) / kUdimRowSize,
  };
}

} // namespace vellum::publish
