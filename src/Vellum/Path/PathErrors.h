//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <Vellum/Path/api_export.h>

namespace vellum::path {

//! Base class for all key and template errors.
/*!
 Every error carries the name of the template involved (empty when the error
 concerns a key definition only) so callers can render an actionable message
 without parsing `what()`.
*/
class PathError : public std::runtime_error {
public:
  PathError(std::string template_name, const std::string& message)
    : std::runtime_error(message)
    , template_name_(std::move(template_name))
  {
  }

  [[nodiscard]] auto TemplateName() const noexcept -> const std::string&
  {
    return template_name_;
  }

private:
  std::string template_name_;
};

//! A key was registered twice with conflicting definitions.
class DuplicateKeyError final : public PathError {
public:
  VLLM_PATH_API explicit DuplicateKeyError(std::string key_name);

  [[nodiscard]] auto KeyName() const noexcept -> const std::string&
  {
    return key_name_;
  }

private:
  std::string key_name_;
};

//! A key definition is malformed.
class InvalidKeyError final : public PathError {
public:
  VLLM_PATH_API InvalidKeyError(std::string key_name, std::string reason);

  [[nodiscard]] auto KeyName() const noexcept -> const std::string&
  {
    return key_name_;
  }

  [[nodiscard]] auto Reason() const noexcept -> const std::string&
  {
    return reason_;
  }

private:
  std::string key_name_;
  std::string reason_;
};

//! A template pattern references a key that is not registered.
class UnknownKeyError final : public PathError {
public:
  VLLM_PATH_API UnknownKeyError(std::string template_name, std::string key_name);

  [[nodiscard]] auto KeyName() const noexcept -> const std::string&
  {
    return key_name_;
  }

private:
  std::string key_name_;
};

//! A template name is not registered (lookup, `@reference` or base).
class UnknownTemplateError final : public PathError {
public:
  VLLM_PATH_API UnknownTemplateError(
    std::string template_name, std::string referenced_by = {});

  //! Template whose definition holds the dangling reference, if any.
  [[nodiscard]] auto ReferencedBy() const noexcept -> const std::string&
  {
    return referenced_by_;
  }

private:
  std::string referenced_by_;
};

//! A template name was registered twice.
class DuplicateTemplateError final : public PathError {
public:
  VLLM_PATH_API explicit DuplicateTemplateError(std::string template_name);
};

//! Template references or bases form a cycle.
class CyclicTemplateError final : public PathError {
public:
  VLLM_PATH_API CyclicTemplateError(
    std::string template_name, std::vector<std::string> cycle);

  //! The cycle, starting and ending with the same template name.
  [[nodiscard]] auto Cycle() const noexcept -> const std::vector<std::string>&
  {
    return cycle_;
  }

private:
  std::vector<std::string> cycle_;
};

//! A template pattern is malformed.
class TemplateSyntaxError final : public PathError {
public:
  VLLM_PATH_API TemplateSyntaxError(
    std::string template_name, std::string pattern, std::string reason);

  [[nodiscard]] auto Pattern() const noexcept -> const std::string&
  {
    return pattern_;
  }

  [[nodiscard]] auto Reason() const noexcept -> const std::string&
  {
    return reason_;
  }

private:
  std::string pattern_;
  std::string reason_;
};

//! A field required by a template was not provided and has no default.
class MissingFieldError final : public PathError {
public:
  VLLM_PATH_API MissingFieldError(std::string template_name, std::string field);

  [[nodiscard]] auto Field() const noexcept -> const std::string&
  {
    return field_;
  }

private:
  std::string field_;
};

//! A field value failed its key's type or format contract.
class InvalidFieldValueError final : public PathError {
public:
  VLLM_PATH_API InvalidFieldValueError(std::string template_name,
    std::string field, std::string value, std::string reason);

  [[nodiscard]] auto Field() const noexcept -> const std::string&
  {
    return field_;
  }

  [[nodiscard]] auto Value() const noexcept -> const std::string&
  {
    return value_;
  }

  [[nodiscard]] auto Reason() const noexcept -> const std::string&
  {
    return reason_;
  }

private:
  std::string field_;
  std::string value_;
  std::string reason_;
};

//! A path does not conform to a template.
class NoMatchError final : public PathError {
public:
  VLLM_PATH_API NoMatchError(std::string template_name, std::string path);

  [[nodiscard]] auto Path() const noexcept -> const std::string&
  {
    return path_;
  }

private:
  std::string path_;
};

} // namespace vellum::path
