//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

#include <Vellum/Publish/api_export.h>

namespace vellum::publish {

//! Kind of published artifact a template produces.
enum class TemplateFamily : uint8_t {
  //! Single project (scene) file.
  kProject = 0,

  //! One texture map, possibly a UDIM tile sequence.
  kTextureMap,

  //! Parent artifact grouping the maps of one texture set.
  kTextureSet,
};

//! String representation of enum values in `TemplateFamily`.
VLLM_PUBL_NDAPI auto to_string(TemplateFamily value) -> const char*;

//! Scope of version numbering.
/*!
 Two publishes with the same identity share one version sequence and must
 never be assigned the same version; publishes with different identities are
 fully independent.
*/
struct PublishIdentity {
  std::string asset;
  std::string task;
  std::string base_name;
  TemplateFamily family = TemplateFamily::kProject;

  [[nodiscard]] auto operator==(const PublishIdentity&) const -> bool
    = default;
};

//! Render as `Family(asset/task/base_name)` for logs and error messages.
VLLM_PUBL_NDAPI auto to_string(const PublishIdentity& identity) -> std::string;

//! Hash functor for unordered containers keyed by identity.
struct PublishIdentityHash {
  VLLM_PUBL_NDAPI auto operator()(const PublishIdentity& identity) const noexcept
    -> std::size_t;
};

} // namespace vellum::publish
