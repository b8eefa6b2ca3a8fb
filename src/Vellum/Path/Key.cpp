//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#include <algorithm>
#include <charconv>
#include <utility>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <Vellum/Path/Key.h>
#include <Vellum/Path/PathErrors.h>

namespace {

auto IsAsciiAlnum(const char ch) -> bool
{
  return (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z')
    || (ch >= '0' && ch <= '9');
}

auto IsControl(const char ch) -> bool
{
  const auto uch = static_cast<unsigned char>(ch);
  return uch < 0x20 || uch == 0x7F;
}

// Longest digit run accepted when parsing, keeps std::from_chars in range.
constexpr std::size_t kMaxIntegerDigits = 18;

} // namespace

namespace vellum::path {

auto to_string(const KeyType value) -> const char*
{
  switch (value) {
  case KeyType::kString:
    return "String";
  case KeyType::kInteger:
    return "Integer";
  case KeyType::kAlphanumeric:
    return "Alphanumeric";
  }
  return "__NotSupported__";
}

Key::Key(KeyDefinition definition)
  : definition_(std::move(definition))
{
  if (definition_.name.empty()) {
    throw InvalidKeyError({}, "key name must not be empty");
  }
  const auto valid_char
    = [](const char ch) { return IsAsciiAlnum(ch) || ch == '_'; };
  if (!std::ranges::all_of(definition_.name, valid_char)) {
    throw InvalidKeyError(
      definition_.name, "name must only contain [A-Za-z0-9_]");
  }
  if (definition_.alias && definition_.alias->empty()) {
    throw InvalidKeyError(definition_.name, "alias must not be empty");
  }
  if (definition_.zero_pad != 0 && definition_.type != KeyType::kInteger) {
    throw InvalidKeyError(
      definition_.name, "zero padding only applies to integer keys");
  }
}

auto Key::Validate(const FieldValue& value) const -> std::optional<std::string>
{
  if (definition_.type == KeyType::kInteger) {
    const auto* number = std::get_if<std::int64_t>(&value);
    if (number == nullptr) {
      return "expected an integer";
    }
    if (*number < 0) {
      return "integer must not be negative";
    }
  } else {
    const auto* text = std::get_if<std::string>(&value);
    if (text == nullptr) {
      return "expected a string";
    }
    if (text->empty()) {
      return "value must not be empty";
    }
    if (definition_.type == KeyType::kAlphanumeric) {
      if (!std::ranges::all_of(*text, IsAsciiAlnum)) {
        return "value must only contain [A-Za-z0-9]";
      }
    } else {
      if (text->find_first_of("/\\") != std::string::npos) {
        return "value must not contain path separators";
      }
      if (std::ranges::any_of(*text, IsControl)) {
        return "value must not contain control characters";
      }
    }
  }

  if (!definition_.choices.empty()) {
    const auto formatted = Format(value);
    if (std::ranges::find(definition_.choices, formatted)
      == definition_.choices.end()) {
      return fmt::format("value is not one of the allowed choices [{}]",
        fmt::join(definition_.choices, ", "));
    }
  }
  return std::nullopt;
}

auto Key::Format(const FieldValue& value) const -> std::string
{
  if (const auto* number = std::get_if<std::int64_t>(&value)) {
    if (definition_.zero_pad > 0) {
      return fmt::format(
        "{:0{}d}", *number, static_cast<int>(definition_.zero_pad));
    }
    return fmt::format("{}", *number);
  }
  return std::get<std::string>(value);
}

auto Key::Parse(const std::string_view text) const -> std::optional<FieldValue>
{
  if (text.empty()) {
    return std::nullopt;
  }

  FieldValue value;
  if (definition_.type == KeyType::kInteger) {
    if (text.size() > kMaxIntegerDigits) {
      return std::nullopt;
    }
    std::int64_t number = 0;
    const auto* first = text.data();
    const auto* last = text.data() + text.size();
    const auto [ptr, ec] = std::from_chars(first, last, number);
    if (ec != std::errc {} || ptr != last) {
      return std::nullopt;
    }
    value = number;
    if (Format(value) != text) {
      return std::nullopt;
    }
  } else {
    value = std::string(text);
  }

  if (Validate(value).has_value()) {
    return std::nullopt;
  }
  return value;
}

} // namespace vellum::path
