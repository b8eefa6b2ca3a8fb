//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include <Vellum/Path/FieldValue.h>
#include <Vellum/Path/TemplateRegistry.h>
#include <Vellum/Publish/PublishIdentity.h>
#include <Vellum/Publish/RegistryClient.h>
#include <Vellum/Publish/api_export.h>

namespace vellum::publish {

//! What to look for when computing a version.
struct VersionQuery {
  PublishIdentity identity;

  //! Template whose resolved paths carry the version.
  std::string template_name;

  //! Values of every identity field of the template, without the version.
  path::Fields fields;

  //! Field holding the version number.
  std::string version_field = "version";

  //! Bound on the directory scan.
  std::chrono::milliseconds timeout { std::chrono::minutes(5) };
};

//! Computes publish versions from what exists on disk.
/*!
 The publish area is the source of truth. The scan starts at the deepest
 directory fully determined by the query fields (see
 `Template::ResolvePrefix()`), visits every entry below it, and keeps the
 entries that the template extracts with the same value for every query
 field. Entries that merely share a prefix are ignored. A scan root that
 does not exist means no version exists.

 When a registry client is supplied, its highest version for the identity is
 also taken into account. A registry failure is fatal: no version is guessed.

 `NextVersion()` does not reserve anything. Callers serialize allocation and
 commit per identity with `IdentityLockTable`.
*/
class VersionResolver {
public:
  VLLM_PUBL_API explicit VersionResolver(
    std::shared_ptr<const path::TemplateRegistry> templates,
    std::shared_ptr<IRegistryClient> registry = nullptr);

  //! Highest existing version plus one, or 1 if none exists.
  /*!
   @throw VersionQueryError if the registry query fails, or if the template
     does not determine a directory to scan.
   @throw path::PathError if the template is unknown or a query field is
     invalid.
  */
  VLLM_PUBL_NDAPI auto NextVersion(const VersionQuery& query) const -> int;

  //! Distinct versions found on disk, sorted.
  VLLM_PUBL_NDAPI auto CurrentVersions(const VersionQuery& query) const
    -> std::vector<int>;

private:
  std::shared_ptr<const path::TemplateRegistry> templates_;
  std::shared_ptr<IRegistryClient> registry_;
};

} // namespace vellum::publish
