//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

#include <Vellum/Path/PathMapper.h>
#include <Vellum/Publish/ExportPreset.h>

namespace vellum::publish {

//! Names of the templates used by the publish pipeline.
struct PublishTemplates {
  //! Project file in the work area; identity fields are read from it.
  std::string project_work = "project_work";
  std::string project_publish = "project_publish";

  //! Directory the exporter writes textures into.
  std::string texture_export_area = "texture_export_area";

  //! Published file of an untiled map.
  std::string texture_publish = "texture_publish";

  //! Published tile of a tiled map. Its UDIM key should have a default such
  //! as `<UDIM>` so that the record path is abstract.
  std::string texture_publish_udim = "texture_publish_udim";

  //! Folder of one published texture set version.
  std::string texture_set_folder = "texture_set_folder";
};

//! Field names the pipeline fills or reads.
struct PublishFieldNames {
  std::string asset = "Asset";
  std::string task = "task_name";
  std::string name = "name";
  std::string texture_set = "texture_set";
  std::string texture_map = "texture_map";
  std::string color_space = "colorspace";
  std::string udim = "UDIM";
  std::string extension = "extension";
  std::string version = "version";
};

//! Registry type labels of published records.
struct PublishTypes {
  std::string project = "Substance Painter Project File";
  std::string texture = "Texture";
  std::string texture_set = "Texture Set";
};

//! Publish pipeline settings, usually loaded with `PipelineConfig`.
struct PublishSettings {
  PublishTemplates templates;
  PublishFieldNames fields;
  PublishTypes publish_types;

  //! Studio export presets start with this prefix (case-insensitive).
  std::string preset_prefix = std::string(kDefaultPresetPrefix);

  //! Bound on lock waits and on each file commit.
  std::chrono::milliseconds io_timeout { std::chrono::minutes(5) };

  std::size_t copy_workers = 4;

  //! Texture publish templates have one slot per map name.
  bool single_slot_per_map = true;

  std::vector<path::PathMapping> path_mappings;
};

} // namespace vellum::publish
