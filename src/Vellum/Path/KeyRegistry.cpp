//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#include <Vellum/Base/Logging.h>
#include <Vellum/Path/KeyRegistry.h>
#include <Vellum/Path/PathErrors.h>

namespace vellum::path {

auto KeyRegistry::Register(KeyDefinition definition) -> const Key&
{
  Key key(std::move(definition));

  if (const auto it = keys_.find(key.Name()); it != keys_.end()) {
    if (it->second == key) {
      DLOG_F(2, "key '{}' registered again with identical definition",
        key.Name());
      return it->second;
    }
    throw DuplicateKeyError(key.Name());
  }

  const auto name = key.Name();
  const auto [it, inserted] = keys_.emplace(name, std::move(key));
  DLOG_F(1, "registered key '{}' ({})", name, to_string(it->second.Type()));
  return it->second;
}

auto KeyRegistry::Find(const std::string_view name) const -> const Key*
{
  const auto it = keys_.find(name);
  return it == keys_.end() ? nullptr : &it->second;
}

auto KeyRegistry::Get(const std::string_view name) const -> const Key&
{
  const auto* key = Find(name);
  if (key == nullptr) {
    throw UnknownKeyError({}, std::string(name));
  }
  return *key;
}

auto KeyRegistry::Names() const -> std::vector<std::string>
{
  std::vector<std::string> names;
  names.reserve(keys_.size());
  for (const auto& [name, key] : keys_) {
    names.push_back(name);
  }
  return names;
}

} // namespace vellum::path
