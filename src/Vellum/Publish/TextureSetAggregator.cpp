//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#include <algorithm>
#include <cctype>
#include <iterator>
#include <optional>

#include <fmt/format.h>

#include <Vellum/Base/Logging.h>
#include <Vellum/Publish/PublishErrors.h>
#include <Vellum/Publish/TextureSetAggregator.h>

using vellum::publish::ExportedFile;
using vellum::publish::InconsistentTextureSetError;
using vellum::publish::TextureMap;
using vellum::publish::TextureSet;

namespace {

auto FindForbiddenChar(const std::string& map_name) -> std::optional<char>
{
  for (const char ch : map_name) {
    if (ch == '_' || ch == '.' || ch == '/' || ch == '\\'
      || std::isspace(static_cast<unsigned char>(ch)) != 0) {
      return ch;
    }
  }
  return std::nullopt;
}

auto FindSet(std::vector<TextureSet>& sets, const std::string& name)
  -> TextureSet*
{
  const auto it = std::ranges::find(sets, name, &TextureSet::source_name);
  return it == sets.end() ? nullptr : &*it;
}

//! Add one file to its map, enforcing the per-map invariants.
auto AddToMap(TextureMap& map, const std::string& set, const ExportedFile& file)
  -> void
{
  if (map.files.empty()) {
    map.files.push_back(file);
    return;
  }
  if (map.IsTiled() != file.IsTiled()) {
    throw InconsistentTextureSetError(
      set, map.name, file.udim, "map mixes tiled and untiled files");
  }
  if (!file.IsTiled()) {
    throw InconsistentTextureSetError(set, map.name, std::nullopt,
      fmt::format("map exported twice in color space '{}' ('{}' and '{}')",
        map.color_space, map.files.front().path.filename().string(),
        file.path.filename().string()));
  }
  if (std::ranges::contains(map.files, file.udim, &ExportedFile::udim)) {
    throw InconsistentTextureSetError(
      set, map.name, file.udim, "duplicate UDIM tile");
  }
  if (file.extension != map.extension) {
    throw InconsistentTextureSetError(set, map.name, file.udim,
      fmt::format("tile extension '{}' differs from '{}'", file.extension,
        map.extension));
  }
  map.files.push_back(file);
}

} // namespace

namespace vellum::publish {

auto TextureSetPublishName(const std::string_view source_name) -> std::string
{
  std::string name;
  name.reserve(source_name.size());
  std::ranges::copy_if(
    source_name, std::back_inserter(name), [](char ch) { return ch != '_'; });
  return name;
}

auto TextureSetAggregator::Aggregate(
  const std::vector<ExportedFile>& files) const -> std::vector<TextureSet>
{
  std::vector<TextureSet> sets;

  for (const auto& file : files) {
    if (const auto ch = FindForbiddenChar(file.map_name)) {
      throw InconsistentTextureSetError(file.texture_set, file.map_name,
        file.udim,
        fmt::format("map name contains forbidden character '{}'", *ch));
    }

    auto* set = FindSet(sets, file.texture_set);
    if (set == nullptr) {
      auto publish_name = TextureSetPublishName(file.texture_set);
      if (publish_name.empty()) {
        throw InconsistentTextureSetError(file.texture_set, file.map_name,
          file.udim, "texture set name is empty once underscores are removed");
      }
      set = &sets.emplace_back(TextureSet {
        .source_name = file.texture_set,
        .publish_name = std::move(publish_name),
      });
    }

    auto it = std::ranges::find_if(set->maps, [&](const TextureMap& map) {
      return map.name == file.map_name
        && (options_.single_slot_per_map
          || map.color_space == file.color_space);
    });
    if (it != set->maps.end() && it->color_space != file.color_space) {
      throw InconsistentTextureSetError(set->source_name, file.map_name,
        file.udim,
        fmt::format("map exported in color spaces '{}' and '{}' but the "
                    "destination has a single slot per map",
          it->color_space, file.color_space));
    }
    if (it == set->maps.end()) {
      set->maps.push_back(TextureMap {
        .name = file.map_name,
        .color_space = file.color_space,
        .extension = file.extension,
      });
      it = std::prev(set->maps.end());
    }
    AddToMap(*it, set->source_name, file);
  }

  for (auto& set : sets) {
    for (auto& map : set.maps) {
      std::ranges::sort(map.files, {}, &ExportedFile::udim);
      set.is_tiled = set.is_tiled || map.IsTiled();
    }
    DLOG_F(1, "texture set '{}' ({}): {} map(s), {} file(s){}",
      set.source_name, set.publish_name, set.maps.size(), set.FileCount(),
      set.is_tiled ? ", tiled" : "");
  }
  return sets;
}

} // namespace vellum::publish
