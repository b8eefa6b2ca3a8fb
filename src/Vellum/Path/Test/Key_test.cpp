//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//


#include <Vellum/Testing/GTest.h>

#include <Vellum/Path/Key.h>
#include <Vellum/Path/KeyRegistry.h>
#include <Vellum/Path/PathErrors.h>

using vellum::path::DuplicateKeyError;
using vellum::path::FieldValue;
using vellum::path::InvalidKeyError;
using vellum::path::Key;
using vellum::path::KeyDefinition;
using vellum::path::KeyRegistry;
using vellum::path::KeyType;
using vellum::path::PathError;

namespace {

//=== Key ===-----------------------------------------------------------------//

class KeyTest : public ::testing::Test {
protected:
  const Key version_ { KeyDefinition {
    .name = "version", .type = KeyType::kInteger, .zero_pad = 3 } };
  const Key map_ { KeyDefinition {
    .name = "texture_map", .type = KeyType::kAlphanumeric } };
  const Key asset_ { KeyDefinition { .name = "Asset" } };
};

//! Integers are zero-padded to the declared width.
NOLINT_TEST_F(KeyTest, Format_PaddedInteger_PadsToWidth)
{
  EXPECT_EQ(version_.Format(FieldValue { std::int64_t { 7 } }), "007");
  EXPECT_EQ(version_.Format(FieldValue { std::int64_t { 1234 } }), "1234");
}

//! Parsing requires the exact padded form.
NOLINT_TEST_F(KeyTest, Parse_PaddedInteger_RequiresExactRoundTrip)
{
  EXPECT_EQ(version_.Parse("007"), FieldValue { std::int64_t { 7 } });
  EXPECT_EQ(version_.Parse("1000"), FieldValue { std::int64_t { 1000 } });
  EXPECT_FALSE(version_.Parse("07").has_value());
  EXPECT_FALSE(version_.Parse("7").has_value());
  EXPECT_FALSE(version_.Parse("0x7").has_value());
  EXPECT_FALSE(version_.Parse("").has_value());
}

//! Integer keys reject strings and negative values.
NOLINT_TEST_F(KeyTest, Validate_Integer_RejectsWrongTypeAndNegative)
{
  EXPECT_TRUE(version_.Validate(FieldValue { std::string("3") }).has_value());
  EXPECT_TRUE(version_.Validate(FieldValue { std::int64_t { -1 } }).has_value());
  EXPECT_FALSE(version_.Validate(FieldValue { std::int64_t { 0 } }).has_value());
}

//! Alphanumeric keys reject underscores, whitespace and punctuation.
NOLINT_TEST_F(KeyTest, Validate_Alphanumeric_RejectsNonAlnum)
{
  EXPECT_FALSE(map_.Validate(FieldValue { std::string("Normal01") }));
  EXPECT_TRUE(map_.Validate(FieldValue { std::string("Base_Color") }));
  EXPECT_TRUE(map_.Validate(FieldValue { std::string("Base Color") }));
  EXPECT_TRUE(map_.Validate(FieldValue { std::string("") }));
}

//! String keys reject path separators but allow other punctuation.
NOLINT_TEST_F(KeyTest, Validate_String_RejectsSeparators)
{
  EXPECT_FALSE(asset_.Validate(FieldValue { std::string("Hull-Main") }));
  EXPECT_TRUE(asset_.Validate(FieldValue { std::string("hull/main") }));
  EXPECT_TRUE(asset_.Validate(FieldValue { std::string("hull\\main") }));
  EXPECT_TRUE(asset_.Validate(FieldValue { std::int64_t { 1 } }));
}

//! Values outside the declared choices are rejected.
NOLINT_TEST(KeyChoicesTest, Validate_ValueNotInChoices_Rejects)
{
  // Arrange
  const Key colorspace { KeyDefinition {
    .name = "colorspace", .choices = { "sRGB", "linear" } } };

  // Act & Assert
  EXPECT_FALSE(colorspace.Validate(FieldValue { std::string("sRGB") }));
  const auto reason = colorspace.Validate(FieldValue { std::string("ACES") });
  ASSERT_TRUE(reason.has_value());
  EXPECT_THAT(*reason, ::testing::HasSubstr("sRGB, linear"));
}

//! The alias, when declared, is the field name.
NOLINT_TEST(KeyAliasTest, FieldName_WithAlias_ReturnsAlias)
{
  const Key key { KeyDefinition { .name = "version_four",
    .type = KeyType::kInteger,
    .zero_pad = 4,
    .alias = "version" } };

  EXPECT_EQ(key.Name(), "version_four");
  EXPECT_EQ(key.FieldName(), "version");
}

//! Malformed definitions are rejected at construction.
NOLINT_TEST(KeyDefinitionTest, Constructor_InvalidDefinition_Throws)
{
  NOLINT_EXPECT_THROW(Key(KeyDefinition { .name = "" }), InvalidKeyError);
  NOLINT_EXPECT_THROW(
    Key(KeyDefinition { .name = "bad-name" }), InvalidKeyError);
  NOLINT_EXPECT_THROW(
    Key(KeyDefinition { .name = "Asset", .zero_pad = 3 }), InvalidKeyError);
  NOLINT_EXPECT_THROW(
    Key(KeyDefinition { .name = "Asset", .alias = "" }), InvalidKeyError);
}

//! Invalid definitions are path errors that name the key and the reason.
NOLINT_TEST(KeyDefinitionTest, Register_InvalidDefinition_ThrowsPathError)
{
  KeyRegistry registry;

  CAPTURE_THROW([[maybe_unused]] const auto& key
    = registry.Register(KeyDefinition { .name = "bad-name" }),
    PathError, error);

  EXPECT_THAT(error.what(), ::testing::HasSubstr("bad-name"));
  EXPECT_THAT(error.what(), ::testing::HasSubstr("[A-Za-z0-9_]"));
}

//=== KeyRegistry ===---------------------------------------------------------//

//! Registering an identical definition twice is a no-op.
NOLINT_TEST(KeyRegistryTest, Register_IdenticalTwice_IsNoOp)
{
  // Arrange
  KeyRegistry registry;
  const KeyDefinition definition { .name = "Asset" };
  const auto& first = registry.Register(definition);

  // Act
  const auto& second = registry.Register(definition);

  // Assert
  EXPECT_EQ(&first, &second);
  EXPECT_EQ(registry.Size(), 1u);
}

//! A conflicting definition for an existing name is rejected.
NOLINT_TEST(KeyRegistryTest, Register_ConflictingDefinition_Throws)
{
  // Arrange
  KeyRegistry registry;
  registry.Register({ .name = "version", .type = KeyType::kInteger });

  // Act & Assert
  try {
    registry.Register(
      { .name = "version", .type = KeyType::kInteger, .zero_pad = 3 });
    FAIL() << "expected DuplicateKeyError";
  } catch (const DuplicateKeyError& error) {
    EXPECT_EQ(error.KeyName(), "version");
  }
  EXPECT_EQ(registry.Get("version").Definition().zero_pad, 0);
}

//! Lookups by name and sorted name listing.
NOLINT_TEST(KeyRegistryTest, FindAndNames_ReturnRegisteredKeys)
{
  // Arrange
  KeyRegistry registry;
  registry.Register({ .name = "texture_set" });
  registry.Register({ .name = "Asset" });

  // Act & Assert
  EXPECT_TRUE(registry.Contains("Asset"));
  EXPECT_EQ(registry.Find("missing"), nullptr);
  EXPECT_THAT(registry.Names(), ::testing::ElementsAre("Asset", "texture_set"));
}

} // namespace
