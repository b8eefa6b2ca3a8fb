//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <ostream>
#include <string_view>

#include <Vellum/Path/TemplateRegistry.h>
#include <Vellum/Publish/PublishSettings.h>
#include <Vellum/Publish/api_export.h>

namespace vellum::publish {

//! Keys, templates and publish settings of a production.
/*!
 Loaded once at startup from a JSON file, then passed to the components that
 need it. The file has four sections:

 ```json
 {
   "keys": {
     "Asset": { "type": "str" },
     "texture_set": { "type": "str", "filter_by": "alphanumeric" },
     "version": { "type": "int", "format_spec": "03" },
     "UDIM": { "type": "int", "default": "<UDIM>" }
   },
   "paths": {
     "asset_root": "/projects/{Asset}",
     "texture_set_folder": {
       "definition": "publish/textures/{texture_set}/v{version}",
       "base": "asset_root"
     }
   },
   "publish": { "preset_prefix": "shotgrid", "io_timeout_ms": 60000 },
   "path_mappings": [ { "unc_prefix": "//studio/projects",
                        "mapped_drive_prefix": "P:" } ]
 }
 ```

 `publish.templates`, `publish.fields` and `publish.publish_types` override
 the members of `PublishTemplates`, `PublishFieldNames` and `PublishTypes`
 with the same names.
*/
struct PipelineConfig {
  std::shared_ptr<const path::TemplateRegistry> templates;
  PublishSettings publish;

  //! Load and validate a configuration file.
  /*!
   @param config_path Path to the JSON configuration.
   @param error_stream Stream for reporting parsing and validation errors.
   @return The configuration, or std::nullopt on failure.
  */
  VLLM_PUBL_NDAPI static auto Load(const std::filesystem::path& config_path,
    std::ostream& error_stream = std::cerr) -> std::optional<PipelineConfig>;

  //! Same as `Load()`, from JSON text.
  VLLM_PUBL_NDAPI static auto Parse(std::string_view json_text,
    std::ostream& error_stream = std::cerr) -> std::optional<PipelineConfig>;
};

} // namespace vellum::publish
