//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#include <functional>

#include <fmt/format.h>

#include <Vellum/Publish/PublishIdentity.h>

namespace {

auto HashCombine(std::size_t seed, const std::size_t value) noexcept
  -> std::size_t
{
  seed ^= value + static_cast<std::size_t>(0x9e3779b97f4a7c15ULL) + (seed << 6)
    + (seed >> 2);
  return seed;
}

} // namespace

namespace vellum::publish {

auto to_string(const TemplateFamily value) -> const char*
{
  switch (value) {
  case TemplateFamily::kProject:
    return "Project";
  case TemplateFamily::kTextureMap:
    return "TextureMap";
  case TemplateFamily::kTextureSet:
    return "TextureSet";
  }
  return "__NotSupported__";
}

auto to_string(const PublishIdentity& identity) -> std::string
{
  return fmt::format("{}({}/{}/{})", to_string(identity.family),
    identity.asset, identity.task, identity.base_name);
}

auto PublishIdentityHash::operator()(
  const PublishIdentity& identity) const noexcept -> std::size_t
{
  const std::hash<std::string> hasher;
  auto seed = static_cast<std::size_t>(identity.family);
  seed = HashCombine(seed, hasher(identity.asset));
  seed = HashCombine(seed, hasher(identity.task));
  seed = HashCombine(seed, hasher(identity.base_name));
  return seed;
}

} // namespace vellum::publish
