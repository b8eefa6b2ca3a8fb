//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#include <cstdint>

#include <Vellum/Testing/GTest.h>

#include <Vellum/Path/PathErrors.h>
#include <Vellum/Path/TemplateRegistry.h>

using vellum::path::CyclicTemplateError;
using vellum::path::DuplicateKeyError;
using vellum::path::DuplicateTemplateError;
using vellum::path::Fields;
using vellum::path::KeyType;
using vellum::path::TemplateRegistry;
using vellum::path::TemplateSyntaxError;
using vellum::path::UnknownKeyError;
using vellum::path::UnknownTemplateError;

namespace {

class TemplateRegistryTest : public ::testing::Test {
protected:
  auto SetUp() -> void override
  {
    builder_.RegisterKey({ .name = "Asset" })
      .RegisterKey({ .name = "task_name", .type = KeyType::kAlphanumeric })
      .RegisterKey(
        { .name = "version", .type = KeyType::kInteger, .zero_pad = 3 })
      .RegisterKey({ .name = "variant", .type = KeyType::kAlphanumeric });
  }

  TemplateRegistry::Builder builder_;
};

//=== Composition ===---------------------------------------------------------//

//! References and base templates are expanded into the effective pattern.
NOLINT_TEST_F(TemplateRegistryTest, Build_ReferencesAndBase_AreExpanded)
{
  // Arrange
  builder_.RegisterTemplate("asset_root", "/projects/{Asset}")
    .RegisterTemplate("task_root", "@asset_root/{task_name}")
    .RegisterTemplate(
      "work", "work/{Asset}_{task_name}.v{version}.spp", "task_root");

  // Act
  const auto registry = builder_.Build();

  // Assert
  EXPECT_EQ(registry->GetTemplate("work").Pattern(),
    "/projects/{Asset}/{task_name}/work/{Asset}_{task_name}.v{version}.spp");
  EXPECT_EQ(registry->Resolve("work",
              { { "Asset", "hull" }, { "task_name", "texturing" },
                { "version", std::int64_t { 3 } } }),
    "/projects/hull/texturing/work/hull_texturing.v003.spp");
}

//! Templates may be registered before the templates they reference.
NOLINT_TEST_F(TemplateRegistryTest, Build_ForwardReference_Resolves)
{
  builder_.RegisterTemplate("work", "@{root}/work/{Asset}.v{version}.spp")
    .RegisterTemplate("root", "/projects/{Asset}");

  const auto registry = builder_.Build();

  EXPECT_EQ(registry->Extract("work", "/projects/hull/work/hull.v012.spp"),
    (Fields { { "Asset", "hull" }, { "version", std::int64_t { 12 } } }));
}

//! Template names are listed in sorted order.
NOLINT_TEST_F(TemplateRegistryTest, TemplateNames_AreSorted)
{
  builder_.RegisterTemplate("work", "/w/{Asset}")
    .RegisterTemplate("area", "/a/{Asset}");

  const auto registry = builder_.Build();

  EXPECT_THAT(registry->TemplateNames(), ::testing::ElementsAre("area", "work"));
  EXPECT_TRUE(registry->HasTemplate("area"));
  EXPECT_FALSE(registry->HasTemplate("publish"));
  EXPECT_TRUE(registry->Keys().Contains("version"));
}

//=== Registration errors ===-------------------------------------------------//

//! A cycle is reported when the definition that closes it is registered.
NOLINT_TEST_F(TemplateRegistryTest, RegisterTemplate_ClosingCycle_Throws)
{
  // Arrange
  builder_.RegisterTemplate("a", "@b/x/{Asset}");

  // Act & Assert
  CAPTURE_THROW(builder_.RegisterTemplate("b", "@a/y"), CyclicTemplateError,
    error);
  EXPECT_THAT(error.Cycle(), ::testing::ElementsAre("b", "a", "b"));
  EXPECT_FALSE(builder_.HasTemplate("b"));
}

//! A template cannot use itself as its base.
NOLINT_TEST_F(TemplateRegistryTest, RegisterTemplate_SelfBase_Throws)
{
  CAPTURE_THROW(builder_.RegisterTemplate("c", "x/{Asset}", "c"),
    CyclicTemplateError, error);
  EXPECT_THAT(error.Cycle(), ::testing::ElementsAre("c", "c"));
}

//! Registering the same name twice is rejected.
NOLINT_TEST_F(TemplateRegistryTest, RegisterTemplate_DuplicateName_Throws)
{
  builder_.RegisterTemplate("work", "/w/{Asset}");

  NOLINT_EXPECT_THROW(
    builder_.RegisterTemplate("work", "/other/{Asset}"), DuplicateTemplateError);
}

//! Unregistered keys are reported when the template is registered.
NOLINT_TEST_F(TemplateRegistryTest, RegisterTemplate_UnknownKey_Throws)
{
  CAPTURE_THROW(builder_.RegisterTemplate("work", "/w/{Shot}"),
    UnknownKeyError, error);
  EXPECT_EQ(error.KeyName(), "Shot");
  EXPECT_EQ(error.TemplateName(), "work");
}

//! Template names are restricted to identifier characters.
NOLINT_TEST_F(TemplateRegistryTest, RegisterTemplate_InvalidName_Throws)
{
  NOLINT_EXPECT_THROW(
    builder_.RegisterTemplate("work area", "/w/{Asset}"), TemplateSyntaxError);
}

//! Re-registering a key with another definition is rejected.
NOLINT_TEST_F(TemplateRegistryTest, RegisterKey_Conflicting_Throws)
{
  NOLINT_EXPECT_NO_THROW(builder_.RegisterKey({ .name = "Asset" }));
  NOLINT_EXPECT_THROW(
    builder_.RegisterKey({ .name = "Asset", .type = KeyType::kAlphanumeric }),
    DuplicateKeyError);
}

//=== Build errors ===--------------------------------------------------------//

//! A reference to a template never registered fails the build.
NOLINT_TEST_F(TemplateRegistryTest, Build_UnknownReference_Throws)
{
  // Arrange
  builder_.RegisterTemplate("work", "@missing/{Asset}");

  // Act & Assert
  CAPTURE_THROW((void)builder_.Build(), UnknownTemplateError, error);
  EXPECT_EQ(error.TemplateName(), "missing");
  EXPECT_EQ(error.ReferencedBy(), "work");
}

//! Expansion that nests optional sections is a syntax error.
NOLINT_TEST_F(TemplateRegistryTest, Build_ExpandedNestedSections_Throws)
{
  builder_.RegisterTemplate("suffix", "[_{variant}]")
    .RegisterTemplate("out", "/x/{Asset}[@suffix]");

  NOLINT_EXPECT_THROW((void)builder_.Build(), TemplateSyntaxError);
}

//! Looking up an unknown template is an error.
NOLINT_TEST_F(TemplateRegistryTest, GetTemplate_Unknown_Throws)
{
  const auto registry = builder_.Build();

  NOLINT_EXPECT_THROW(
    (void)registry->GetTemplate("publish"), UnknownTemplateError);
  EXPECT_EQ(registry->FindTemplate("publish"), nullptr);
}

} // namespace
