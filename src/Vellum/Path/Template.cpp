//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#include <algorithm>
#include <bit>
#include <cstdint>
#include <utility>

#include <fmt/format.h>

#include <Vellum/Base/Logging.h>
#include <Vellum/Path/Internal/PatternParser.h>
#include <Vellum/Path/KeyRegistry.h>
#include <Vellum/Path/PathErrors.h>
#include <Vellum/Path/Template.h>

namespace {

// Each optional section doubles the number of extraction variants.
constexpr std::size_t kMaxOptionalSections = 12;

} // namespace

namespace vellum::path {

Template::Template(
  std::string name, std::string pattern, const KeyRegistry& keys)
  : name_(std::move(name))
  , pattern_(std::move(pattern))
{
  auto parsed = detail::ParsePattern(name_, pattern_, keys, false);

  for (auto& parsed_segment : parsed.segments) {
    Segment segment { .tokens = {}, .optional = parsed_segment.optional };
    for (auto& parsed_token : parsed_segment.tokens) {
      if (parsed_token.kind == detail::TokenKind::kLiteral) {
        segment.tokens.push_back({ .literal = std::move(parsed_token.text) });
        continue;
      }
      const auto it = std::ranges::find_if(keys_,
        [&](const Key& key) { return key.Name() == parsed_token.text; });
      auto index = static_cast<std::size_t>(it - keys_.begin());
      if (it == keys_.end()) {
        const auto* key = keys.Find(parsed_token.text);
        CHECK_NOTNULL_F(key);
        keys_.push_back(*key);
      }
      segment.tokens.push_back({ .is_key = true, .key_index = index });
    }
    segments_.push_back(std::move(segment));
  }

  // Collect the literals that can directly follow each key. The parser
  // guarantees a key is never followed by another key.
  for (std::size_t i = 0; i < segments_.size(); ++i) {
    auto& tokens = segments_[i].tokens;
    for (std::size_t t = 0; t < tokens.size(); ++t) {
      if (!tokens[t].is_key) {
        continue;
      }
      auto& followers = tokens[t].followers;
      if (t + 1 < tokens.size()) {
        followers.push_back(tokens[t + 1].literal);
        continue;
      }
      for (std::size_t j = i + 1; j < segments_.size(); ++j) {
        const auto& next = segments_[j].tokens.front().literal;
        if (std::ranges::find(followers, next) == followers.end()) {
          followers.push_back(next);
        }
        if (!segments_[j].optional) {
          break;
        }
      }
    }
  }

  std::vector<std::size_t> optional_segments;
  for (std::size_t i = 0; i < segments_.size(); ++i) {
    if (segments_[i].optional) {
      optional_segments.push_back(i);
    }
  }
  const auto section_count = optional_segments.size();
  if (section_count > kMaxOptionalSections) {
    throw TemplateSyntaxError(name_, pattern_,
      fmt::format("more than {} optional sections", kMaxOptionalSections));
  }

  // Bit (n - 1 - k) selects section k, so that among variants with the same
  // number of sections the ones including earlier sections sort first.
  std::vector<uint32_t> masks(std::size_t { 1 } << section_count);
  for (uint32_t mask = 0; mask < masks.size(); ++mask) {
    masks[mask] = mask;
  }
  std::ranges::sort(masks, [](const uint32_t lhs, const uint32_t rhs) {
    const auto lhs_count = std::popcount(lhs);
    const auto rhs_count = std::popcount(rhs);
    return lhs_count != rhs_count ? lhs_count > rhs_count : lhs > rhs;
  });

  variants_.reserve(masks.size());
  for (const auto mask : masks) {
    Variant variant;
    std::size_t section = 0;
    for (const auto& segment : segments_) {
      if (segment.optional) {
        const auto bit = uint32_t { 1 } << (section_count - 1 - section++);
        if ((mask & bit) == 0) {
          continue;
        }
      }
      for (const auto& token : segment.tokens) {
        if (!token.is_key && !variant.empty() && !variant.back().is_key) {
          variant.back().literal += token.literal;
        } else {
          variant.push_back(token);
        }
      }
    }
    variants_.push_back(std::move(variant));
  }

  DLOG_F(2, "template '{}': {} key(s), {} variant(s)", name_, keys_.size(),
    variants_.size());
}

auto Template::FieldNames() const -> std::vector<std::string>
{
  std::vector<std::string> names;
  names.reserve(keys_.size());
  for (const auto& key : keys_) {
    names.push_back(key.FieldName());
  }
  std::ranges::sort(names);
  const auto [first, last] = std::ranges::unique(names);
  names.erase(first, last);
  return names;
}

auto Template::FormatValue(const Token& token, const Fields& fields) const
  -> std::optional<std::string>
{
  const auto& key = keys_[token.key_index];
  const auto it = fields.find(key.FieldName());
  if (it == fields.end()) {
    return std::nullopt;
  }

  const auto& value = it->second;
  if (const auto reason = key.Validate(value)) {
    throw InvalidFieldValueError(name_, key.FieldName(), to_string(value),
      *reason);
  }

  auto text = key.Format(value);
  for (const auto& follower : token.followers) {
    if ((text + follower).find(follower) != text.size()) {
      throw InvalidFieldValueError(name_, key.FieldName(), to_string(value),
        fmt::format("value contains '{}' which delimits it", follower));
    }
  }
  return text;
}

auto Template::Apply(const Fields& fields) const -> std::string
{
  std::string path;
  Fields expected;

  for (const auto& segment : segments_) {
    if (segment.optional) {
      const bool provided
        = std::ranges::all_of(segment.tokens, [&](const Token& token) {
            return !token.is_key
              || fields.contains(keys_[token.key_index].FieldName());
          });
      if (!provided) {
        continue;
      }
    }

    for (const auto& token : segment.tokens) {
      if (!token.is_key) {
        path += token.literal;
        continue;
      }
      const auto& key = keys_[token.key_index];
      if (const auto text = FormatValue(token, fields)) {
        path += *text;
        expected.insert_or_assign(key.FieldName(), fields.at(key.FieldName()));
      } else if (const auto& fallback = key.DefaultValue()) {
        path += *fallback;
      } else {
        throw MissingFieldError(name_, key.FieldName());
      }
    }
  }

  CheckRoundTrip(path, expected);
  return path;
}

auto Template::CheckRoundTrip(
  const std::string& path, const Fields& expected) const -> void
{
  const auto extracted = TryExtract(path);
  if (extracted && *extracted == expected) {
    return;
  }

  if (!extracted) {
    if (expected.empty()) {
      throw NoMatchError(name_, path);
    }
    const auto& [field, value] = *expected.begin();
    throw InvalidFieldValueError(name_, field, to_string(value),
      "resolved path does not match its own template");
  }

  for (const auto& [field, value] : expected) {
    const auto it = extracted->find(field);
    if (it == extracted->end() || it->second != value) {
      throw InvalidFieldValueError(name_, field, to_string(value),
        "value makes the resolved path ambiguous");
    }
  }
  // Only extra bindings are left; blame the first of them.
  const auto& [field, value] = *extracted->begin();
  throw InvalidFieldValueError(name_, field, to_string(value),
    "resolved path reads back with an unexpected field");
}

auto Template::TryExtract(const std::string_view path) const
  -> std::optional<Fields>
{
  for (const auto& variant : variants_) {
    Fields bound;
    if (MatchTokens(variant, 0, path, 0, bound)) {
      return bound;
    }
  }
  return std::nullopt;
}

auto Template::Extract(const std::string_view path) const -> Fields
{
  auto fields = TryExtract(path);
  if (!fields) {
    throw NoMatchError(name_, std::string(path));
  }
  return std::move(*fields);
}

auto Template::MatchTokens(const Variant& tokens, const std::size_t index,
  const std::string_view path, const std::size_t pos, Fields& bound) const
  -> bool
{
  if (index == tokens.size()) {
    return pos == path.size();
  }
  const auto& token = tokens[index];
  if (token.is_key) {
    return MatchKey(tokens, index, path, pos, bound);
  }
  if (!path.substr(pos).starts_with(token.literal)) {
    return false;
  }
  return MatchTokens(tokens, index + 1, path, pos + token.literal.size(), bound);
}

auto Template::MatchKey(const Variant& tokens, const std::size_t index,
  const std::string_view path, const std::size_t pos, Fields& bound) const
  -> bool
{
  const auto& key = keys_[tokens[index].key_index];
  const auto& field = key.FieldName();
  const auto rest = path.substr(pos);

  // A verbatim default stands for "any value" and binds nothing.
  if (const auto& fallback = key.DefaultValue();
    fallback && rest.starts_with(*fallback)
    && MatchTokens(tokens, index + 1, path, pos + fallback->size(), bound)) {
    return true;
  }

  const bool is_last = index + 1 == tokens.size();
  const std::string_view next_literal
    = is_last ? std::string_view {} : std::string_view(tokens[index + 1].literal);
  const auto limit = std::min(rest.find('/'), rest.size());

  for (std::size_t length = is_last ? rest.size() : 1; length <= limit;
    ++length) {
    if (!is_last && !rest.substr(length).starts_with(next_literal)) {
      continue;
    }
    const auto value = key.Parse(rest.substr(0, length));
    if (!value) {
      continue;
    }
    if (const auto it = bound.find(field); it != bound.end()) {
      if (it->second == *value
        && MatchTokens(tokens, index + 1, path, pos + length, bound)) {
        return true;
      }
      continue;
    }
    bound.emplace(field, *value);
    if (MatchTokens(tokens, index + 1, path, pos + length, bound)) {
      return true;
    }
    bound.erase(field);
  }
  return false;
}

auto Template::ResolvePrefix(const Fields& fields) const -> std::string
{
  std::string prefix;
  const auto build = [&]() {
    for (const auto& segment : segments_) {
      if (segment.optional) {
        return;
      }
      for (const auto& token : segment.tokens) {
        if (!token.is_key) {
          prefix += token.literal;
          continue;
        }
        const auto text = FormatValue(token, fields);
        if (!text) {
          return;
        }
        prefix += *text;
      }
    }
  };
  build();

  const auto slash = prefix.rfind('/');
  if (slash == std::string::npos) {
    return {};
  }
  if (slash == 0) {
    return "/";
  }
  return prefix.substr(0, slash);
}

} // namespace vellum::path
