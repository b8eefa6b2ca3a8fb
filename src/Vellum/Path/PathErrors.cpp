//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <Vellum/Path/PathErrors.h>

namespace vellum::path {

DuplicateKeyError::DuplicateKeyError(std::string key_name)
  : PathError({},
      fmt::format("key '{}' is already registered with a different definition",
        key_name))
  , key_name_(std::move(key_name))
{
}

InvalidKeyError::InvalidKeyError(std::string key_name, std::string reason)
  : PathError({},
      key_name.empty()
        ? fmt::format("invalid key definition: {}", reason)
        : fmt::format("invalid key '{}': {}", key_name, reason))
  , key_name_(std::move(key_name))
  , reason_(std::move(reason))
{
}

UnknownKeyError::UnknownKeyError(std::string template_name, std::string key_name)
  : PathError(template_name,
      template_name.empty()
        ? fmt::format("key '{}' is not registered", key_name)
        : fmt::format("template '{}' references unregistered key '{}'",
            template_name, key_name))
  , key_name_(std::move(key_name))
{
}

UnknownTemplateError::UnknownTemplateError(
  std::string template_name, std::string referenced_by)
  : PathError(template_name,
      referenced_by.empty()
        ? fmt::format("template '{}' is not registered", template_name)
        : fmt::format("template '{}' referenced by '{}' is not registered",
            template_name, referenced_by))
  , referenced_by_(std::move(referenced_by))
{
}

DuplicateTemplateError::DuplicateTemplateError(std::string template_name)
  : PathError(template_name,
      fmt::format("template '{}' is already registered", template_name))
{
}

CyclicTemplateError::CyclicTemplateError(
  std::string template_name, std::vector<std::string> cycle)
  : PathError(template_name,
      fmt::format("template '{}' closes a reference cycle: {}", template_name,
        fmt::join(cycle, " -> ")))
  , cycle_(std::move(cycle))
{
}

TemplateSyntaxError::TemplateSyntaxError(
  std::string template_name, std::string pattern, std::string reason)
  : PathError(template_name,
      fmt::format(
        "template '{}' has invalid pattern '{}': {}", template_name, pattern,
        reason))
  , pattern_(std::move(pattern))
  , reason_(std::move(reason))
{
}

MissingFieldError::MissingFieldError(std::string template_name, std::string field)
  : PathError(template_name,
      fmt::format(
        "template '{}' requires field '{}' which was not provided",
        template_name, field))
  , field_(std::move(field))
{
}

InvalidFieldValueError::InvalidFieldValueError(std::string template_name,
  std::string field, std::string value, std::string reason)
  : PathError(template_name,
      fmt::format("template '{}': invalid value '{}' for field '{}': {}",
        template_name, value, field, reason))
  , field_(std::move(field))
  , value_(std::move(value))
  , reason_(std::move(reason))
{
}

NoMatchError::NoMatchError(std::string template_name, std::string path)
  : PathError(template_name,
      fmt::format("path '{}' does not match template '{}'", path, template_name))
  , path_(std::move(path))
{
}

} // namespace vellum::path
