//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <map>
#include <string>
#include <string_view>
#include <vector>

#include <Vellum/Path/Key.h>
#include <Vellum/Path/api_export.h>

namespace vellum::path {

//! Set of keys available to templates, indexed by key name.
/*!
 Registration is idempotent for identical definitions. Keys are never removed
 or replaced, so a `const Key&` obtained from the registry stays valid for the
 registry's lifetime.
*/
class KeyRegistry final {
public:
  //! Register a key.
  /*!
   @return The registered key (the existing one if the definition is
     identical).
   @throw DuplicateKeyError if a different definition already uses the name.
   @throw InvalidKeyError if the definition is not a valid key.
  */
  VLLM_PATH_API auto Register(KeyDefinition definition) -> const Key&;

  //! Find a key by name.
  VLLM_PATH_NDAPI auto Find(std::string_view name) const -> const Key*;

  //! Get a key by name.
  /*!
   @throw UnknownKeyError if no key has that name.
  */
  VLLM_PATH_NDAPI auto Get(std::string_view name) const -> const Key&;

  [[nodiscard]] auto Contains(std::string_view name) const -> bool
  {
    return Find(name) != nullptr;
  }

  [[nodiscard]] auto Size() const noexcept -> size_t { return keys_.size(); }

  //! Registered key names, sorted.
  VLLM_PATH_NDAPI auto Names() const -> std::vector<std::string>;

private:
  std::map<std::string, Key, std::less<>> keys_;
};

} // namespace vellum::path
