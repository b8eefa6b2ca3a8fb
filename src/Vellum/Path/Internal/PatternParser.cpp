//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#include <algorithm>

#include <fmt/format.h>

#include <Vellum/Path/Internal/PatternParser.h>
#include <Vellum/Path/KeyRegistry.h>
#include <Vellum/Path/PathErrors.h>

namespace vellum::path::detail {

namespace {

  class PatternScanner {
  public:
    PatternScanner(std::string_view template_name, std::string_view pattern,
      const KeyRegistry& keys, const bool allow_references)
      : template_name_(template_name)
      , pattern_(pattern)
      , keys_(keys)
      , allow_references_(allow_references)
    {
    }

    auto Run() -> ParsedPattern
    {
      for (std::size_t pos = 0; pos < pattern_.size(); ++pos) {
        switch (const char ch = pattern_[pos]) {
        case '{':
          pos = ReadKey(pos);
          break;
        case '}':
          Fail("unbalanced '}'");
        case '[':
          OpenSection();
          break;
        case ']':
          CloseSection();
          break;
        case '@':
          pos = ReadReference(pos);
          break;
        default:
          AppendLiteral(ch);
          break;
        }
      }

      if (in_section_) {
        Fail("unbalanced '['");
      }
      Flush();
      if (result_.segments.empty()) {
        Fail("pattern is empty");
      }
      CheckAdjacentKeys();
      return std::move(result_);
    }

  private:
    [[noreturn]] auto Fail(const std::string& reason) const -> void
    {
      throw TemplateSyntaxError(
        std::string(template_name_), std::string(pattern_), reason);
    }

    auto ReadKey(const std::size_t open) -> std::size_t
    {
      const auto close = pattern_.find('}', open + 1);
      if (close == std::string_view::npos) {
        Fail("unbalanced '{'");
      }
      const auto name = pattern_.substr(open + 1, close - open - 1);
      if (name.empty()) {
        Fail("empty key name");
      }
      if (!std::ranges::all_of(name, IsIdentifierChar)) {
        Fail(fmt::format("invalid key name '{}'", name));
      }
      if (!keys_.Contains(name)) {
        throw UnknownKeyError(std::string(template_name_), std::string(name));
      }
      current_.tokens.push_back(
        { .kind = TokenKind::kKey, .text = std::string(name) });
      section_has_key_ = true;
      return close;
    }

    auto ReadReference(const std::size_t at) -> std::size_t
    {
      if (!allow_references_) {
        Fail("unresolved template reference");
      }
      std::string_view name;
      std::size_t last = at;
      if (at + 1 < pattern_.size() && pattern_[at + 1] == '{') {
        const auto close = pattern_.find('}', at + 2);
        if (close == std::string_view::npos) {
          Fail("unbalanced '{' in template reference");
        }
        name = pattern_.substr(at + 2, close - at - 2);
        last = close;
      } else {
        auto end = at + 1;
        while (end < pattern_.size() && IsIdentifierChar(pattern_[end])) {
          ++end;
        }
        name = pattern_.substr(at + 1, end - at - 1);
        last = end - 1;
      }
      if (name.empty() || !std::ranges::all_of(name, IsIdentifierChar)) {
        Fail("invalid template reference");
      }

      current_.tokens.push_back(
        { .kind = TokenKind::kReference, .text = std::string(name) });
      if (std::ranges::find(result_.references, name)
        == result_.references.end()) {
        result_.references.emplace_back(name);
      }
      section_has_key_ = true;
      return last;
    }

    auto OpenSection() -> void
    {
      if (in_section_) {
        Fail("nested optional sections are not supported");
      }
      Flush();
      in_section_ = true;
      section_has_key_ = false;
      current_.optional = true;
    }

    auto CloseSection() -> void
    {
      if (!in_section_) {
        Fail("unbalanced ']'");
      }
      if (!section_has_key_) {
        Fail("optional section without a key");
      }
      Flush();
      in_section_ = false;
      current_.optional = false;
    }

    auto AppendLiteral(const char ch) -> void
    {
      if (!current_.tokens.empty()
        && current_.tokens.back().kind == TokenKind::kLiteral) {
        current_.tokens.back().text.push_back(ch);
        return;
      }
      current_.tokens.push_back(
        { .kind = TokenKind::kLiteral, .text = std::string(1, ch) });
    }

    auto Flush() -> void
    {
      const bool optional = current_.optional;
      if (!current_.tokens.empty()) {
        result_.segments.push_back(std::move(current_));
      }
      current_ = PatternSegment { .tokens = {}, .optional = optional };
    }

    // A key may never be directly followed by another key, whichever
    // optional sections end up emitted.
    auto CheckAdjacentKeys() const -> void
    {
      const auto& segments = result_.segments;
      const auto starts_with_key = [](const PatternSegment& segment) {
        return segment.tokens.front().kind == TokenKind::kKey;
      };

      for (std::size_t i = 0; i < segments.size(); ++i) {
        const auto& tokens = segments[i].tokens;
        for (std::size_t t = 0; t + 1 < tokens.size(); ++t) {
          if (tokens[t].kind == TokenKind::kKey
            && tokens[t + 1].kind == TokenKind::kKey) {
            Fail(fmt::format("keys '{}' and '{}' are adjacent", tokens[t].text,
              tokens[t + 1].text));
          }
        }
        if (tokens.back().kind != TokenKind::kKey) {
          continue;
        }
        for (std::size_t j = i + 1; j < segments.size(); ++j) {
          if (starts_with_key(segments[j])) {
            Fail(fmt::format("keys '{}' and '{}' are adjacent",
              tokens.back().text, segments[j].tokens.front().text));
          }
          if (!segments[j].optional) {
            break;
          }
        }
      }
    }

    std::string_view template_name_;
    std::string_view pattern_;
    const KeyRegistry& keys_;
    bool allow_references_;

    ParsedPattern result_;
    PatternSegment current_;
    bool in_section_ = false;
    bool section_has_key_ = false;
  };

} // namespace

auto ParsePattern(const std::string_view template_name,
  const std::string_view pattern, const KeyRegistry& keys,
  const bool allow_references) -> ParsedPattern
{
  return PatternScanner(template_name, pattern, keys, allow_references).Run();
}

} // namespace vellum::path::detail
