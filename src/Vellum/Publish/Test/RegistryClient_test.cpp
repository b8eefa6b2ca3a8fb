//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#include <set>
#include <string>
#include <thread>
#include <vector>

#include <Vellum/Testing/GTest.h>

#include <Vellum/Publish/RegistryClient.h>

using vellum::publish::InMemoryRegistryClient;
using vellum::publish::PendingRegistration;
using vellum::publish::PublishIdentity;
using vellum::publish::RecordId;
using vellum::publish::RecordRequest;
using vellum::publish::TemplateFamily;

namespace {

auto MakeRequest(const std::string& base_name, const int version)
  -> RecordRequest
{
  return RecordRequest {
    .family = TemplateFamily::kTextureSet,
    .publish_type = "Texture Set",
    .name = "hull_texturing_" + base_name,
    .path = "/publish/hull/textures/" + base_name,
    .version = version,
    .identity = {
      .asset = "hull",
      .task = "texturing",
      .base_name = base_name,
      .family = TemplateFamily::kTextureSet,
    },
  };
}

//! Ids start at 1 and records keep what was requested.
NOLINT_TEST(InMemoryRegistryClientTest, CreateRecord_AssignsIncreasingIds)
{
  InMemoryRegistryClient registry;

  const auto first = registry.CreateRecord(MakeRequest("hull", 1));
  const auto second = registry.CreateRecord(MakeRequest("hull", 2));

  EXPECT_EQ(first, 1);
  EXPECT_EQ(second, 2);
  ASSERT_EQ(registry.Size(), 2U);
  const auto found = registry.Find(second);
  ASSERT_TRUE(found.has_value());
  EXPECT_EQ(found->request, MakeRequest("hull", 2));
  EXPECT_FALSE(registry.Find(42).has_value());
}

//! The highest version is tracked per identity.
NOLINT_TEST(InMemoryRegistryClientTest, QueryMaxVersion_PerIdentity)
{
  InMemoryRegistryClient registry;
  [[maybe_unused]] auto id = registry.CreateRecord(MakeRequest("hull", 3));
  id = registry.CreateRecord(MakeRequest("hull", 1));
  id = registry.CreateRecord(MakeRequest("sails", 7));

  EXPECT_EQ(registry.QueryMaxVersion(MakeRequest("hull", 0).identity), 3);
  EXPECT_EQ(registry.QueryMaxVersion(MakeRequest("sails", 0).identity), 7);
  EXPECT_FALSE(
    registry.QueryMaxVersion(MakeRequest("deck", 0).identity).has_value());
}

//! Concurrent publishes never receive the same id.
NOLINT_TEST(InMemoryRegistryClientTest, CreateRecord_Concurrent_UniqueIds)
{
  InMemoryRegistryClient registry;
  std::vector<std::vector<RecordId>> ids(4);

  {
    std::vector<std::jthread> threads;
    for (std::size_t t = 0; t < ids.size(); ++t) {
      threads.emplace_back([&registry, &ids, t]() {
        for (int i = 0; i < 25; ++i) {
          ids[t].push_back(registry.CreateRecord(MakeRequest("hull", i)));
        }
      });
    }
  }

  std::set<RecordId> unique;
  for (const auto& batch : ids) {
    unique.insert(batch.begin(), batch.end());
  }
  EXPECT_EQ(unique.size(), 100U);
  EXPECT_EQ(registry.Records().size(), 100U);
}

//! A pending registration is complete once every record has an id.
NOLINT_TEST(PendingRegistrationTest, IsComplete_TracksCreatedRecords)
{
  PendingRegistration pending {
    .records = { MakeRequest("hull", 1), MakeRequest("hull", 1) },
  };

  EXPECT_FALSE(pending.IsComplete());
  pending.created.push_back(1);
  EXPECT_FALSE(pending.IsComplete());
  pending.created.push_back(2);
  EXPECT_TRUE(pending.IsComplete());
}

} // namespace
