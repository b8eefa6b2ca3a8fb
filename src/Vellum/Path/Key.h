//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <Vellum/Path/FieldValue.h>
#include <Vellum/Path/api_export.h>

namespace vellum::path {

//! Semantic type of a template key.
enum class KeyType : uint8_t {
  //! Free text; may not contain path separators or control characters.
  kString = 0,

  //! Non-negative integer, optionally zero-padded when formatted.
  kInteger,

  //! Text restricted to `[A-Za-z0-9]`.
  kAlphanumeric,
};

//! String representation of enum values in `KeyType`.
VLLM_PATH_NDAPI auto to_string(KeyType value) -> const char*;

//! Definition of a named, typed placeholder usable inside templates.
/*!
 A key is the contract a field value must honor before it can be written into
 a path, and the parser used to recover the value when reading a path back.

 ### Field names

 Field maps are keyed by `FieldName()`: the alias when one is declared, the
 key name otherwise. Two keys sharing an alias (for example `version` and
 `version_four` with different paddings) bind the same field.

 ### Defaults

 When a field is absent, `default_value` is written verbatim into the path.
 Extraction accepts the verbatim default without binding the field. This is
 how abstract paths such as `hull_Normal.<UDIM>.exr` are produced.
*/
struct KeyDefinition {
  std::string name;
  KeyType type = KeyType::kString;

  //! Zero-padded width for integers (e.g. 3 renders 7 as `007`). 0 = none.
  uint8_t zero_pad = 0;

  //! Field name used instead of `name` in field maps.
  std::optional<std::string> alias;

  //! Allowed formatted values. Empty means unrestricted.
  std::vector<std::string> choices;

  //! Text emitted when the field is absent.
  std::optional<std::string> default_value;

  [[nodiscard]] auto operator==(const KeyDefinition& other) const -> bool
    = default;
};

//! Immutable, validated key.
class Key {
public:
  //! Build a key from its definition.
  /*!
   @throw InvalidKeyError if the name is empty or contains characters other
     than `[A-Za-z0-9_]`, or if padding is set on a non-integer key.
  */
  VLLM_PATH_API explicit Key(KeyDefinition definition);

  [[nodiscard]] auto Name() const noexcept -> const std::string&
  {
    return definition_.name;
  }

  [[nodiscard]] auto Type() const noexcept -> KeyType
  {
    return definition_.type;
  }

  [[nodiscard]] auto FieldName() const noexcept -> const std::string&
  {
    return definition_.alias ? *definition_.alias : definition_.name;
  }

  [[nodiscard]] auto Definition() const noexcept -> const KeyDefinition&
  {
    return definition_;
  }

  [[nodiscard]] auto DefaultValue() const noexcept
    -> const std::optional<std::string>&
  {
    return definition_.default_value;
  }

  //! Check a value against the key's type contract.
  /*!
   @return `std::nullopt` when valid, otherwise the reason it is rejected.
  */
  VLLM_PATH_NDAPI auto Validate(const FieldValue& value) const
    -> std::optional<std::string>;

  //! Format a value as it appears in a path. The value must be valid.
  VLLM_PATH_NDAPI auto Format(const FieldValue& value) const -> std::string;

  //! Parse a path fragment back into a value.
  /*!
   Integers must round-trip exactly through `Format()`, so `07` is rejected
   by a key padded to 3 and accepted by a key padded to 2.
  */
  VLLM_PATH_NDAPI auto Parse(std::string_view text) const
    -> std::optional<FieldValue>;

  [[nodiscard]] auto operator==(const Key& other) const -> bool = default;

private:
  KeyDefinition definition_;
};

} // namespace vellum::path
