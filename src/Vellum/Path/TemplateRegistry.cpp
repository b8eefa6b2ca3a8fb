//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#include <algorithm>
#include <utility>

#include <Vellum/Base/Logging.h>
#include <Vellum/Path/PathErrors.h>
#include <Vellum/Path/TemplateRegistry.h>

namespace vellum::path {

//=== TemplateRegistry ===----------------------------------------------------//

TemplateRegistry::TemplateRegistry(KeyRegistry keys)
  : keys_(std::move(keys))
{
}

auto TemplateRegistry::FindTemplate(const std::string_view name) const
  -> const Template*
{
  const auto it = templates_.find(name);
  return it == templates_.end() ? nullptr : &it->second;
}

auto TemplateRegistry::GetTemplate(const std::string_view name) const
  -> const Template&
{
  const auto* found = FindTemplate(name);
  if (found == nullptr) {
    throw UnknownTemplateError(std::string(name));
  }
  return *found;
}

auto TemplateRegistry::TemplateNames() const -> std::vector<std::string>
{
  std::vector<std::string> names;
  names.reserve(templates_.size());
  for (const auto& [name, tmpl] : templates_) {
    names.push_back(name);
  }
  return names;
}

auto TemplateRegistry::Resolve(const std::string_view template_name,
  const Fields& fields) const -> std::string
{
  return GetTemplate(template_name).Apply(fields);
}

auto TemplateRegistry::Extract(const std::string_view template_name,
  const std::string_view path) const -> Fields
{
  return GetTemplate(template_name).Extract(path);
}

//=== Builder ===-------------------------------------------------------------//

auto TemplateRegistry::Builder::RegisterKey(KeyDefinition definition)
  -> Builder&
{
  keys_.Register(std::move(definition));
  return *this;
}

auto TemplateRegistry::Builder::RegisterTemplate(std::string name,
  std::string pattern, std::optional<std::string> base) -> Builder&
{
  if (name.empty() || !std::ranges::all_of(name, detail::IsIdentifierChar)) {
    throw TemplateSyntaxError(name, pattern, "invalid template name");
  }
  if (definitions_.contains(name)) {
    throw DuplicateTemplateError(name);
  }
  if (base && base->empty()) {
    throw TemplateSyntaxError(name, pattern, "empty base template name");
  }

  auto parsed = detail::ParsePattern(name, pattern, keys_, true);
  const auto [it, inserted] = definitions_.emplace(name,
    Definition {
      .pattern = std::move(pattern),
      .base = std::move(base),
      .parsed = std::move(parsed),
    });

  // Only the new definition can close a cycle, so it suffices to look for a
  // path from it back to itself.
  std::set<std::string> visited;
  std::vector<std::string> cycle { name };
  if (FindPathTo(name, name, visited, cycle)) {
    definitions_.erase(it);
    throw CyclicTemplateError(name, std::move(cycle));
  }

  DLOG_F(1, "registered template '{}'", name);
  return *this;
}

auto TemplateRegistry::Builder::Dependencies(const Definition& definition) const
  -> std::vector<std::string>
{
  auto dependencies = definition.parsed.references;
  if (definition.base) {
    dependencies.push_back(*definition.base);
  }
  return dependencies;
}

auto TemplateRegistry::Builder::FindPathTo(const std::string& node,
  const std::string& target, std::set<std::string>& visited,
  std::vector<std::string>& path) const -> bool
{
  const auto it = definitions_.find(node);
  if (it == definitions_.end()) {
    return false;
  }
  for (const auto& next : Dependencies(it->second)) {
    if (next == target) {
      path.push_back(next);
      return true;
    }
    if (!visited.insert(next).second) {
      continue;
    }
    path.push_back(next);
    if (FindPathTo(next, target, visited, path)) {
      return true;
    }
    path.pop_back();
  }
  return false;
}

auto TemplateRegistry::Builder::Expand(const std::string& name,
  const std::string& referenced_by,
  std::map<std::string, std::string>& expanded) const -> const std::string&
{
  if (const auto it = expanded.find(name); it != expanded.end()) {
    return it->second;
  }
  const auto it = definitions_.find(name);
  if (it == definitions_.end()) {
    throw UnknownTemplateError(name, referenced_by);
  }
  const auto& definition = it->second;

  std::string own;
  for (const auto& segment : definition.parsed.segments) {
    if (segment.optional) {
      own += '[';
    }
    for (const auto& token : segment.tokens) {
      switch (token.kind) {
      case detail::TokenKind::kLiteral:
        own += token.text;
        break;
      case detail::TokenKind::kKey:
        own += '{';
        own += token.text;
        own += '}';
        break;
      case detail::TokenKind::kReference:
        own += Expand(token.text, name, expanded);
        break;
      }
    }
    if (segment.optional) {
      own += ']';
    }
  }

  if (definition.base) {
    auto prefix = Expand(*definition.base, name, expanded);
    while (prefix.size() > 1 && prefix.ends_with('/')) {
      prefix.pop_back();
    }
    const auto start = own.find_first_not_of('/');
    own = prefix + (prefix.ends_with('/') ? "" : "/")
      + (start == std::string::npos ? std::string {} : own.substr(start));
  }

  return expanded.emplace(name, std::move(own)).first->second;
}

auto TemplateRegistry::Builder::Build() const
  -> std::shared_ptr<const TemplateRegistry>
{
  std::shared_ptr<TemplateRegistry> registry(new TemplateRegistry(keys_));

  std::map<std::string, std::string> expanded;
  for (const auto& [name, definition] : definitions_) {
    const auto& pattern = Expand(name, {}, expanded);
    registry->templates_.emplace(
      name, Template(name, pattern, registry->keys_));
    DLOG_F(2, "template '{}' -> '{}'", name, pattern);
  }

  LOG_F(INFO, "template registry built: {} key(s), {} template(s)",
    registry->keys_.Size(), registry->templates_.size());
  return registry;
}

} // namespace vellum::path
