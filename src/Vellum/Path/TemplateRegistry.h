//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include <Vellum/Path/FieldValue.h>
#include <Vellum/Path/Internal/PatternParser.h>
#include <Vellum/Path/KeyRegistry.h>
#include <Vellum/Path/Template.h>
#include <Vellum/Path/api_export.h>

namespace vellum::path {

//! Immutable set of keys and fully expanded templates.
/*!
 A registry is produced once by a `TemplateRegistry::Builder` (usually from
 the pipeline configuration) and then shared read-only, typically as
 `std::shared_ptr<const TemplateRegistry>`, by every component that needs to
 resolve or parse paths. All member functions are safe to call concurrently.

 ### Composition

 A template definition may embed another template with `@name` (or
 `@{name}`), and may declare a base template. The effective pattern of a
 template with a base is the base pattern, a `/`, then its own pattern.
 References and bases are expanded recursively when the registry is built.

 ```cpp
 TemplateRegistry::Builder builder;
 builder.RegisterKey({ .name = "Asset" })
   .RegisterKey({ .name = "version", .type = KeyType::kInteger, .zero_pad = 3 })
   .RegisterTemplate("asset_root", "/projects/{Asset}")
   .RegisterTemplate("work", "work/{Asset}.v{version}.spp", "asset_root");
 const auto registry = builder.Build();
 const auto path = registry->Resolve(
   "work", { { "Asset", "hull" }, { "version", std::int64_t { 3 } } });
 // path == "/projects/hull/work/hull.v003.spp"
 ```
*/
class TemplateRegistry {
public:
  class Builder;

  [[nodiscard]] auto Keys() const noexcept -> const KeyRegistry&
  {
    return keys_;
  }

  [[nodiscard]] auto HasTemplate(const std::string_view name) const -> bool
  {
    return FindTemplate(name) != nullptr;
  }

  VLLM_PATH_NDAPI auto FindTemplate(std::string_view name) const
    -> const Template*;

  //! Get a template by name.
  /*!
   @throw UnknownTemplateError if no template has that name.
  */
  VLLM_PATH_NDAPI auto GetTemplate(std::string_view name) const
    -> const Template&;

  //! Registered template names, sorted.
  VLLM_PATH_NDAPI auto TemplateNames() const -> std::vector<std::string>;

  //! Resolve the named template. See `Template::Apply()`.
  VLLM_PATH_NDAPI auto Resolve(std::string_view template_name,
    const Fields& fields) const -> std::string;

  //! Parse a path with the named template. See `Template::Extract()`.
  VLLM_PATH_NDAPI auto Extract(std::string_view template_name,
    std::string_view path) const -> Fields;

private:
  explicit TemplateRegistry(KeyRegistry keys);

  KeyRegistry keys_;
  std::map<std::string, Template, std::less<>> templates_;
};

//! Accumulates key and template definitions, then builds a registry.
/*!
 Keys must be registered before the templates that use them. Errors that can
 be detected from a single definition (syntax, unknown keys, duplicates, and
 cycles closed by the new definition) are reported when it is registered.
 References to templates that were never registered are reported by
 `Build()`.
*/
class TemplateRegistry::Builder {
public:
  //! Register a key. See `KeyRegistry::Register()`.
  VLLM_PATH_API auto RegisterKey(KeyDefinition definition) -> Builder&;

  //! Register a template definition.
  /*!
   @param name Template name, `[A-Za-z0-9_]+`.
   @param pattern Pattern, possibly with `@name` references.
   @param base Optional base template the pattern is appended to.

   @throw TemplateSyntaxError if the name or the pattern is malformed.
   @throw UnknownKeyError if the pattern uses an unregistered key.
   @throw DuplicateTemplateError if the name is already registered.
   @throw CyclicTemplateError if the definition closes a reference cycle.
  */
  VLLM_PATH_API auto RegisterTemplate(std::string name, std::string pattern,
    std::optional<std::string> base = std::nullopt) -> Builder&;

  [[nodiscard]] auto HasTemplate(const std::string_view name) const -> bool
  {
    return definitions_.contains(name);
  }

  //! Expand every definition and build the registry.
  /*!
   @throw UnknownTemplateError if a reference or base names a template that
     was never registered.
   @throw TemplateSyntaxError if an expanded pattern is malformed.
  */
  VLLM_PATH_NDAPI auto Build() const -> std::shared_ptr<const TemplateRegistry>;

private:
  struct Definition {
    std::string pattern;
    std::optional<std::string> base;
    detail::ParsedPattern parsed;
  };

  [[nodiscard]] auto Dependencies(const Definition& definition) const
    -> std::vector<std::string>;

  auto FindPathTo(const std::string& node, const std::string& target,
    std::set<std::string>& visited, std::vector<std::string>& path) const
    -> bool;

  auto Expand(const std::string& name, const std::string& referenced_by,
    std::map<std::string, std::string>& expanded) const -> const std::string&;

  KeyRegistry keys_;
  std::map<std::string, Definition, std::less<>> definitions_;
};

} // namespace vellum::path
