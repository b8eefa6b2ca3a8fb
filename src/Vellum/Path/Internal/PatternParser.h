//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace vellum::path {
class KeyRegistry;

namespace detail {

  enum class TokenKind : uint8_t {
    kLiteral,
    kKey,
    kReference,
  };

  struct PatternToken {
    TokenKind kind = TokenKind::kLiteral;
    //! Literal text, key name or referenced template name.
    std::string text;
  };

  //! Run of tokens that is either always emitted or a `[...]` section.
  struct PatternSegment {
    std::vector<PatternToken> tokens;
    bool optional = false;
  };

  struct ParsedPattern {
    std::vector<PatternSegment> segments;
    //! Distinct referenced template names, in order of appearance.
    std::vector<std::string> references;
  };

  //! Tokenize a template pattern.
  /*!
   Grammar: literal text, `{key}` placeholders, `[...]` optional sections
   (not nested, at least one key or reference each) and, when
   `allow_references` is set, `@name` or `@{name}` template references.

   @throw TemplateSyntaxError for malformed patterns, including two keys that
     would be adjacent in any combination of optional sections.
   @throw UnknownKeyError if a placeholder names a key missing from `keys`.
  */
  auto ParsePattern(std::string_view template_name, std::string_view pattern,
    const KeyRegistry& keys, bool allow_references) -> ParsedPattern;

  [[nodiscard]] constexpr auto IsIdentifierChar(const char ch) noexcept -> bool
  {
    return (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z')
      || (ch >= '0' && ch <= '9') || ch == '_';
  }

} // namespace detail
} // namespace vellum::path
