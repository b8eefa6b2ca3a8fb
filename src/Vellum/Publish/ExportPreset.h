//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <string>
#include <string_view>
#include <vector>

#include <Vellum/Publish/api_export.h>

namespace vellum::publish {

//! Default prefix of studio export presets.
inline constexpr std::string_view kDefaultPresetPrefix = "shotgrid";

//! Naming rule every output map of a studio preset must follow.
inline constexpr std::string_view kOutputMapConvention
  = "$textureSet_<MapNameNoUnderscores>_$colorSpace(.$udim)";

//! Export preset as reported by the painting application.
struct ExportPreset {
  std::string name;

  //! Resource location handed back to the exporter.
  std::string url;

  //! Abstract file names of the output maps, e.g.
  //! `$textureSet_BaseColor_$colorSpace(.$udim)`.
  std::vector<std::string> output_maps;
};

//! Returns true if the preset name starts with `prefix`, ignoring case.
VLLM_PUBL_NDAPI auto IsStudioPreset(
  const ExportPreset& preset, std::string_view prefix = kDefaultPresetPrefix)
  -> bool;

//! Studio presets among `presets`, in their original order.
VLLM_PUBL_NDAPI auto StudioPresets(const std::vector<ExportPreset>& presets,
  std::string_view prefix = kDefaultPresetPrefix) -> std::vector<ExportPreset>;

//! Output map names that do not follow `kOutputMapConvention`.
VLLM_PUBL_NDAPI auto NonConformingOutputMaps(const ExportPreset& preset)
  -> std::vector<std::string>;

//! Check that a preset can be used for publishing.
/*!
 @throw ValidationError if the preset is not a studio preset, has no output
   map, or if any output map breaks the naming rule. The message lists every
   offending map.
*/
VLLM_PUBL_API auto ValidateExportPreset(const ExportPreset& preset,
  std::string_view prefix = kDefaultPresetPrefix) -> void;

} // namespace vellum::publish
