//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#include <chrono>
#include <cstdint>
#include <sstream>
#include <string>

#include <Vellum/Testing/GTest.h>
#include <Vellum/Testing/TempDirectory.h>

#include <Vellum/Publish/PipelineConfig.h>

using testing::HasSubstr;
using vellum::path::Fields;
using vellum::path::PathMapping;
using vellum::publish::PipelineConfig;
using vellum::testing::TempDirectory;

namespace {

constexpr auto kStudioConfig = R"({
  "keys": {
    "Asset": { "type": "str" },
    "task_name": { "type": "str", "filter_by": "alphanumeric" },
    "name": { "type": "str", "filter_by": "alphanumeric" },
    "texture_set": { "type": "str", "filter_by": "alphanumeric" },
    "texture_map": { "type": "str", "filter_by": "alphanumeric" },
    "extension": { "type": "str", "filter_by": "alphanumeric" },
    "UDIM": { "type": "int", "default": "<UDIM>" },
    "version": { "type": "int", "format_spec": "03" },
    "colorspace": { "type": "str", "choices": ["sRGB", "raw"] }
  },
  "paths": {
    "asset_root": "//studio/projects/{Asset}/{task_name}",
    "project_work": { "definition": "work/{name}.v{version}.spp",
                      "base": "asset_root" },
    "project_publish": { "definition": "publish/{name}.v{version}.spp",
                         "base": "asset_root" },
    "texture_export_area": { "definition": "export/{texture_set}",
                             "base": "asset_root" },
    "texture_set_folder": {
      "definition": "publish/textures/{texture_set}/v{version}",
      "base": "asset_root"
    },
    "texture_publish": {
      "definition": "{texture_set}_{texture_map}.{extension}",
      "base": "texture_set_folder"
    },
    "texture_publish_udim": {
      "definition": "{texture_set}_{texture_map}.{UDIM}.{extension}",
      "base": "texture_set_folder"
    }
  },
  "publish": {
    "fields": { "color_space": "colorspace" },
    "publish_types": { "project": "Painter Project" },
    "preset_prefix": "studio",
    "io_timeout_ms": 30000,
    "copy_workers": 8,
    "single_slot_per_map": false
  },
  "path_mappings": [
    { "unc_prefix": "//studio/projects", "mapped_drive_prefix": "P:" }
  ]
})";

//! A complete studio configuration builds templates and publish settings.
NOLINT_TEST(PipelineConfigTest, Parse_StudioConfig_Loads)
{
  // Arrange
  std::ostringstream errors;

  // Act
  const auto config = PipelineConfig::Parse(kStudioConfig, errors);

  // Assert
  ASSERT_TRUE(config.has_value()) << errors.str();
  EXPECT_TRUE(errors.str().empty());
  const auto& publish = config->publish;
  EXPECT_EQ(publish.preset_prefix, "studio");
  EXPECT_EQ(publish.io_timeout, std::chrono::milliseconds(30000));
  EXPECT_EQ(publish.copy_workers, 8U);
  EXPECT_FALSE(publish.single_slot_per_map);
  EXPECT_EQ(publish.fields.color_space, "colorspace");
  EXPECT_EQ(publish.fields.asset, "Asset");
  EXPECT_EQ(publish.publish_types.project, "Painter Project");
  EXPECT_EQ(publish.publish_types.texture, "Texture");
  ASSERT_EQ(publish.path_mappings.size(), 1U);
  EXPECT_EQ(publish.path_mappings[0],
    (PathMapping { .unc_prefix = "//studio/projects",
      .mapped_drive_prefix = "P:" }));
}

//! Templates read from the file resolve with their base and key formats.
NOLINT_TEST(PipelineConfigTest, Parse_Templates_Resolve)
{
  std::ostringstream errors;
  const auto config = PipelineConfig::Parse(kStudioConfig, errors);
  ASSERT_TRUE(config.has_value()) << errors.str();

  const auto path = config->templates->Resolve("texture_publish_udim",
    Fields {
      { "Asset", "hull" },
      { "task_name", "texturing" },
      { "texture_set", "hull" },
      { "texture_map", "Normal" },
      { "extension", "exr" },
      { "version", std::int64_t { 4 } },
    });

  EXPECT_EQ(path,
    "//studio/projects/hull/texturing/publish/textures/hull/v004/"
    "hull_Normal.<UDIM>.exr");
}

//! The publish section is optional and its defaults apply.
NOLINT_TEST(PipelineConfigTest, Parse_NoPublishSection_Defaults)
{
  std::ostringstream errors;

  const auto config = PipelineConfig::Parse(
    R"({ "keys": { "Asset": { "type": "str" } },
         "paths": { "asset_root": "/projects/{Asset}" } })",
    errors);

  ASSERT_TRUE(config.has_value()) << errors.str();
  EXPECT_EQ(config->publish.preset_prefix, "shotgrid");
  EXPECT_EQ(config->publish.copy_workers, 4U);
  EXPECT_TRUE(config->templates->HasTemplate("asset_root"));
}

//! Schema violations are reported with their location.
NOLINT_TEST(PipelineConfigTest, Parse_SchemaViolation_Reported)
{
  std::ostringstream errors;

  const auto config = PipelineConfig::Parse(
    R"({ "keys": { "version": { "type": "float" } }, "paths": {} })", errors);

  EXPECT_FALSE(config.has_value());
  EXPECT_THAT(errors.str(), HasSubstr("schema validation failed"));
  EXPECT_THAT(errors.str(), HasSubstr("/keys/version/type"));
}

//! Unknown top-level sections are rejected.
NOLINT_TEST(PipelineConfigTest, Parse_UnknownSection_Rejected)
{
  std::ostringstream errors;

  const auto config = PipelineConfig::Parse(
    R"({ "keys": {}, "paths": {}, "hooks": {} })", errors);

  EXPECT_FALSE(config.has_value());
  EXPECT_THAT(errors.str(), HasSubstr("schema validation failed"));
}

//! Malformed JSON is reported, not thrown.
NOLINT_TEST(PipelineConfigTest, Parse_MalformedJson_Reported)
{
  std::ostringstream errors;

  const auto config = PipelineConfig::Parse(R"({ "keys": )", errors);

  EXPECT_FALSE(config.has_value());
  EXPECT_THAT(errors.str(), HasSubstr("invalid configuration JSON"));
}

//! A template using an undeclared key is a configuration error.
NOLINT_TEST(PipelineConfigTest, Parse_UnknownKey_Reported)
{
  std::ostringstream errors;

  const auto config = PipelineConfig::Parse(
    R"({ "keys": { "Asset": { "type": "str" } },
         "paths": { "asset_root": "/projects/{Asset}/{shot}" } })",
    errors);

  EXPECT_FALSE(config.has_value());
  EXPECT_THAT(errors.str(), HasSubstr("invalid path configuration"));
  EXPECT_THAT(errors.str(), HasSubstr("shot"));
}

//! A key definition the engine rejects is reported like any path error.
NOLINT_TEST(PipelineConfigTest, Parse_InvalidKeyDefinition_Reported)
{
  std::ostringstream errors;

  const auto config = PipelineConfig::Parse(
    R"({ "keys": { "Asset": { "type": "str", "format_spec": "03" } },
         "paths": { "asset_root": "/projects/{Asset}" } })",
    errors);

  EXPECT_FALSE(config.has_value());
  EXPECT_THAT(errors.str(), HasSubstr("invalid path configuration"));
  EXPECT_THAT(errors.str(), HasSubstr("zero padding"));
}

//! A base that is never defined is a configuration error.
NOLINT_TEST(PipelineConfigTest, Parse_UnknownBase_Reported)
{
  std::ostringstream errors;

  const auto config = PipelineConfig::Parse(
    R"({ "keys": { "Asset": { "type": "str" } },
         "paths": { "work": { "definition": "{Asset}.spp",
                              "base": "missing_root" } } })",
    errors);

  EXPECT_FALSE(config.has_value());
  EXPECT_THAT(errors.str(), HasSubstr("missing_root"));
}

//! A publish section must name templates that exist.
NOLINT_TEST(PipelineConfigTest, Parse_MissingPublishTemplate_Reported)
{
  std::ostringstream errors;

  const auto config = PipelineConfig::Parse(
    R"({ "keys": { "Asset": { "type": "str" } },
         "paths": { "asset_root": "/projects/{Asset}" },
         "publish": { "preset_prefix": "studio" } })",
    errors);

  EXPECT_FALSE(config.has_value());
  EXPECT_THAT(errors.str(), HasSubstr("'project_work' is not defined"));
  EXPECT_THAT(errors.str(), HasSubstr("'texture_set_folder' is not defined"));
}

//! Entries of a name map must match a known setting.
NOLINT_TEST(PipelineConfigTest, Parse_UnknownFieldName_Reported)
{
  std::ostringstream errors;

  const auto config = PipelineConfig::Parse(
    R"({ "keys": {}, "paths": {},
         "publish": { "fields": { "shot": "Shot" } } })",
    errors);

  EXPECT_FALSE(config.has_value());
  EXPECT_THAT(errors.str(), HasSubstr("unknown entry 'shot' in publish.fields"));
}

//! Configurations load from disk; a missing file is reported.
NOLINT_TEST(PipelineConfigTest, Load_FromFile)
{
  const TempDirectory temp("vellum_config");
  const auto file = temp.WriteFile("pipeline.json", kStudioConfig);
  std::ostringstream errors;

  const auto loaded = PipelineConfig::Load(file, errors);
  const auto missing = PipelineConfig::Load(temp.Path() / "none.json", errors);

  EXPECT_TRUE(loaded.has_value());
  EXPECT_FALSE(missing.has_value());
  EXPECT_THAT(errors.str(), HasSubstr("failed to open configuration"));
}

} // namespace
