// Copyright 2023 Intrinsic Innovation LLC

#include "clientboot/nameresolver/static_name_resolver_provider.h"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <memory>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "clientboot/nameresolver/endpoint.h"
#include "clientboot/nameresolver/name_resolver.h"
#include "clientboot/nameresolver/target_uri.h"

namespace clientboot {
namespace {

using ::testing::ElementsAre;

absl::StatusOr<std::unique_ptr<NameResolver>> NewResolver(
    absl::string_view target, const NameResolverArgs& args = {}) {
  auto uri = TargetUri::Parse(target);
  EXPECT_TRUE(uri.ok()) << uri.status();
  return StaticNameResolverProvider().NewNameResolver(*uri, args);
}

std::vector<EndpointGroup> StartAndCollect(NameResolver& resolver) {
  std::vector<EndpointGroup> delivered;
  resolver.Start(
      [&delivered](const std::vector<EndpointGroup>& groups,
                   const Attributes&) { delivered = groups; });
  return delivered;
}

TEST(StaticNameResolverProvider, AdvertisesSchemeAndPriority) {
  StaticNameResolverProvider provider;
  EXPECT_EQ(provider.DefaultScheme(), "static");
  EXPECT_EQ(provider.Priority(), 5);
  EXPECT_TRUE(provider.IsAvailable());
}

TEST(StaticNameResolverProvider, ClaimsStaticTargets) {
  auto resolver = NewResolver("static://a:1");
  ASSERT_TRUE(resolver.ok()) << resolver.status();
  ASSERT_NE(*resolver, nullptr);
  EXPECT_EQ((*resolver)->GetServiceAuthority(), "a:1");
}

TEST(StaticNameResolverProvider, OtherSchemesAreNotApplicable) {
  for (absl::string_view target :
       {"dns:///a", "discovery:///a", "ipv4:127.0.0.1:1", "Static://a:1",
        "a:1", "unix:///tmp/socket"}) {
    auto resolver = NewResolver(target);
    ASSERT_TRUE(resolver.ok()) << target << ": " << resolver.status();
    EXPECT_EQ(*resolver, nullptr) << target;
  }
}

TEST(StaticNameResolverProvider, InvalidStaticTargetIsAnError) {
  for (absl::string_view target : {"static://", "static:///", "static://a:x"}) {
    auto resolver = NewResolver(target);
    EXPECT_EQ(resolver.status().code(), absl::StatusCode::kInvalidArgument)
        << target;
  }
}

TEST(StaticNameResolverProvider, ResolvesTwoEndpointScenario) {
  auto resolver = NewResolver("static://192.168.1.1:8080,10.0.0.1:1337");
  ASSERT_TRUE(resolver.ok()) << resolver.status();
  ASSERT_NE(*resolver, nullptr);
  EXPECT_EQ((*resolver)->GetServiceAuthority(),
            "192.168.1.1:8080,10.0.0.1:1337");

  std::vector<EndpointGroup> groups = StartAndCollect(**resolver);
  ASSERT_EQ(groups.size(), 1u);
  EXPECT_THAT(groups[0].endpoints(),
              ElementsAre(Endpoint("192.168.1.1", 8080),
                          Endpoint("10.0.0.1", 1337)));
  (*resolver)->Shutdown();
}

TEST(StaticNameResolverProvider, PassesDefaultPort) {
  NameResolverArgs args;
  args.default_port = 1234;
  auto resolver = NewResolver("static://a,b:5", args);
  ASSERT_TRUE(resolver.ok()) << resolver.status();
  std::vector<EndpointGroup> groups = StartAndCollect(**resolver);
  ASSERT_EQ(groups.size(), 1u);
  EXPECT_THAT(groups[0].endpoints(),
              ElementsAre(Endpoint("a", 1234), Endpoint("b", 5)));
}

TEST(StaticNameResolverProvider, AcceptsTargetInPath) {
  auto resolver = NewResolver("static:///a:1,b:2");
  ASSERT_TRUE(resolver.ok()) << resolver.status();
  ASSERT_NE(*resolver, nullptr);
  EXPECT_EQ((*resolver)->GetServiceAuthority(), "a:1,b:2");
}

}  // namespace
}  // namespace clientboot
