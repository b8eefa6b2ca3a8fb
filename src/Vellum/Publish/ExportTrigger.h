//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace vellum::publish {

//! Per-export parameters forwarded to the exporter.
struct ExportParameters {
  bool dithering = true;
  std::string padding_algorithm = "infinite";
  bool export_shader_params = false;
};

//! Request to export the textures of one texture set.
struct ExportRequest {
  //! Preset name and the resource location the exporter resolves.
  std::string preset_name;
  std::string preset_url;

  //! Directory the exporter writes into.
  std::filesystem::path output_directory;

  //! Texture set to export, as named by the painting application.
  std::string texture_set;

  //! Export roots: `<texture_set>/<stack>` per stack, or `<texture_set>`.
  std::vector<std::string> root_paths;

  ExportParameters parameters;
};

//! What the exporter reported.
struct ExportResult {
  bool success = false;
  std::string message;

  //! Written files, by stack. May be empty when the exporter does not
  //! report them; the output directory is then scanned.
  std::map<std::string, std::vector<std::filesystem::path>> textures_by_stack;
};

//! Host application service that exports textures to disk.
/*!
 The trigger reports whether the export call itself succeeded. Whether the
 written files follow the naming convention is checked afterwards by the
 publish pipeline. Implementations may throw any `std::exception`; it is
 reported as `ExportError`.
*/
class IExportTrigger {
public:
  virtual ~IExportTrigger() = default;

  [[nodiscard]] virtual auto Export(const ExportRequest& request)
    -> ExportResult
    = 0;
};

//! Export roots for a texture set and its stacks.
[[nodiscard]] inline auto ExportRootPaths(const std::string& texture_set,
  const std::vector<std::string>& stacks) -> std::vector<std::string>
{
  if (stacks.empty()) {
    return { texture_set };
  }
  std::vector<std::string> roots;
  roots.reserve(stacks.size());
  for (const auto& stack : stacks) {
    roots.push_back(texture_set + "/" + stack);
  }
  return roots;
}

} // namespace vellum::publish
