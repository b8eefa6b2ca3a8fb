//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#include <algorithm>
#include <cctype>
#include <iterator>
#include <regex>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <Vellum/Base/Logging.h>
#include <Vellum/Publish/ExportPreset.h>
#include <Vellum/Publish/PublishErrors.h>

namespace {

auto OutputMapPattern() -> const std::regex&
{
  static const std::regex pattern(
    R"(^\$textureSet_[A-Za-z0-9]+_\$colorSpace(\(\.\$udim\))?$)");
  return pattern;
}

auto LowerChar(const char ch) -> char
{
  return static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
}

} // namespace

namespace vellum::publish {

auto IsStudioPreset(const ExportPreset& preset, const std::string_view prefix)
  -> bool
{
  if (preset.name.size() < prefix.size()) {
    return false;
  }
  return std::ranges::equal(
    std::string_view(preset.name).substr(0, prefix.size()), prefix, {},
    LowerChar, LowerChar);
}

auto StudioPresets(const std::vector<ExportPreset>& presets,
  const std::string_view prefix) -> std::vector<ExportPreset>
{
  std::vector<ExportPreset> result;
  std::ranges::copy_if(presets, std::back_inserter(result),
    [&](const ExportPreset& preset) { return IsStudioPreset(preset, prefix); });
  return result;
}

auto NonConformingOutputMaps(const ExportPreset& preset)
  -> std::vector<std::string>
{
  std::vector<std::string> offending;
  for (const auto& map : preset.output_maps) {
    if (!std::regex_match(map, OutputMapPattern())) {
      offending.push_back(map);
    }
  }
  return offending;
}

auto ValidateExportPreset(const ExportPreset& preset,
  const std::string_view prefix) -> void
{
  if (!IsStudioPreset(preset, prefix)) {
    throw ValidationError(fmt::format(
      "export preset '{}' is not a studio preset (name must start with '{}')",
      preset.name, prefix));
  }
  if (preset.output_maps.empty()) {
    throw ValidationError(
      fmt::format("export preset '{}' has no output map", preset.name));
  }
  const auto offending = NonConformingOutputMaps(preset);
  if (!offending.empty()) {
    LOG_F(ERROR, "export preset '{}': output maps must be named '{}'",
      preset.name, kOutputMapConvention);
    throw ValidationError(fmt::format(
      "export preset '{}': output map(s) {} do not match '{}'", preset.name,
      offending, kOutputMapConvention));
  }
}

} // namespace vellum::publish
