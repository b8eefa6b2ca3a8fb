//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <Vellum/Path/FieldValue.h>
#include <Vellum/Path/Key.h>
#include <Vellum/Path/api_export.h>

namespace vellum::path {

class KeyRegistry;

//! Bidirectional mapping between field values and a path shape.
/*!
 A template is an ordered sequence of literal text and `{key}` placeholders,
 for example:

 ```text
 /projects/{Asset}/{task_name}/publish/{Asset}_{task_name}.v{version}.spp
 ```

 Parts of the pattern enclosed in `[...]` are optional: a section is emitted
 only when every field it uses is provided. Sections cannot be nested and must
 contain at least one key.

 ### Resolution

 `Apply()` formats every provided value through its key. A missing field is
 replaced by the key default when one exists, otherwise resolution fails.
 Values are rejected when they would make the path ambiguous to read back,
 which guarantees that `TryExtract(Apply(fields))` returns the provided fields
 (restricted to the fields the template uses).

 ### Extraction

 Extraction is a backtracking match of the whole path. Key values never span
 a `/`, integer values must round-trip through their key format, and a key
 used several times must carry the same value each time. Variants with more
 optional sections are tried first.

 @note Templates are immutable once constructed and safe to share between
 threads.
*/
class Template {
public:
  //! Parse a pattern. References (`@name`) must already be expanded.
  /*!
   @throw TemplateSyntaxError if the pattern is malformed.
   @throw UnknownKeyError if a placeholder is not registered in `keys`.
  */
  VLLM_PATH_API Template(
    std::string name, std::string pattern, const KeyRegistry& keys);

  [[nodiscard]] auto Name() const noexcept -> const std::string&
  {
    return name_;
  }

  //! Fully expanded pattern.
  [[nodiscard]] auto Pattern() const noexcept -> const std::string&
  {
    return pattern_;
  }

  //! Keys used by the template, in order of first appearance.
  [[nodiscard]] auto Keys() const noexcept -> const std::vector<Key>&
  {
    return keys_;
  }

  //! Sorted, distinct field names used by the template.
  VLLM_PATH_NDAPI auto FieldNames() const -> std::vector<std::string>;

  [[nodiscard]] auto HasOptionalSections() const noexcept -> bool
  {
    return variants_.size() > 1;
  }

  //! Resolve the template into a concrete path.
  /*!
   Fields not used by the template are ignored.

   @throw MissingFieldError if a required field is absent and has no default.
   @throw InvalidFieldValueError if a value breaks its key contract or would
     make the resolved path ambiguous.
  */
  VLLM_PATH_NDAPI auto Apply(const Fields& fields) const -> std::string;

  //! Read field values back from a path.
  VLLM_PATH_NDAPI auto TryExtract(std::string_view path) const
    -> std::optional<Fields>;

  //! Read field values back from a path.
  /*!
   @throw NoMatchError if the path does not conform to the template.
  */
  VLLM_PATH_NDAPI auto Extract(std::string_view path) const -> Fields;

  //! Returns true if the path conforms to the template.
  [[nodiscard]] auto Validate(const std::string_view path) const -> bool
  {
    return TryExtract(path).has_value();
  }

  //! Deepest directory fully determined by the given fields.
  /*!
   The prefix stops at the first optional section or at the first key whose
   field is not provided, then is cut back to the last `/`. It is the root
   under which every path matching the fields must live. Returns an empty
   string when no directory is determined.

   @throw InvalidFieldValueError if a provided value breaks its key contract.
  */
  VLLM_PATH_NDAPI auto ResolvePrefix(const Fields& fields) const
    -> std::string;

private:
  struct Token {
    bool is_key = false;
    std::string literal;
    std::size_t key_index = 0;
    //! Literals that may directly follow this key in some emitted variant.
    std::vector<std::string> followers;
  };

  struct Segment {
    std::vector<Token> tokens;
    bool optional = false;
  };

  using Variant = std::vector<Token>;

  [[nodiscard]] auto FormatValue(const Token& token, const Fields& fields) const
    -> std::optional<std::string>;

  [[nodiscard]] auto MatchTokens(const Variant& tokens, std::size_t index,
    std::string_view path, std::size_t pos, Fields& bound) const -> bool;

  [[nodiscard]] auto MatchKey(const Variant& tokens, std::size_t index,
    std::string_view path, std::size_t pos, Fields& bound) const -> bool;

  auto CheckRoundTrip(const std::string& path, const Fields& expected) const
    -> void;

  std::string name_;
  std::string pattern_;
  std::vector<Key> keys_;
  std::vector<Segment> segments_;
  std::vector<Variant> variants_;
};

} // namespace vellum::path
