// Copyright 2023 Intrinsic Innovation LLC

#include "clientboot/nameresolver/endpoint.h"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <sstream>
#include <vector>

#include "absl/hash/hash_testing.h"
#include "absl/status/status.h"

namespace clientboot {
namespace {

using ::testing::ElementsAre;

TEST(Endpoint, ToStringFormatsHostAndPort) {
  EXPECT_EQ(Endpoint("192.168.1.1", 8080).ToString(), "192.168.1.1:8080");
  EXPECT_EQ(Endpoint("backend.local", 9090).ToString(), "backend.local:9090");
  EXPECT_EQ(Endpoint("::1", 50051).ToString(), "[::1]:50051");
}

TEST(Endpoint, StreamsLikeToString) {
  std::ostringstream os;
  os << Endpoint("fe80::1", 443);
  EXPECT_EQ(os.str(), "[fe80::1]:443");
}

TEST(Endpoint, Equality) {
  EXPECT_EQ(Endpoint("a", 1), Endpoint("a", 1));
  EXPECT_NE(Endpoint("a", 1), Endpoint("a", 2));
  EXPECT_NE(Endpoint("a", 1), Endpoint("b", 1));
}

TEST(Endpoint, SupportsAbslHash) {
  EXPECT_TRUE(absl::VerifyTypeImplementsAbslHashCorrectly({
      Endpoint("a", 1),
      Endpoint("a", 2),
      Endpoint("b", 1),
      Endpoint("::1", 1),
  }));
}

TEST(EndpointGroup, RejectsEmptyList) {
  auto group = EndpointGroup::Create({});
  EXPECT_EQ(group.status().code(), absl::StatusCode::kInvalidArgument);
}

TEST(EndpointGroup, KeepsOrder) {
  auto group =
      EndpointGroup::Create({Endpoint("10.0.0.2", 2), Endpoint("10.0.0.1", 1)});
  ASSERT_TRUE(group.ok()) << group.status();
  EXPECT_THAT(group->endpoints(),
              ElementsAre(Endpoint("10.0.0.2", 2), Endpoint("10.0.0.1", 1)));
  EXPECT_EQ(group->size(), 2u);

  std::ostringstream os;
  os << *group;
  EXPECT_EQ(os.str(), "[10.0.0.2:2, 10.0.0.1:1]");
}

TEST(IpLiterals, DetectsAddressFamilies) {
  EXPECT_TRUE(IsIpv4Literal("127.0.0.1"));
  EXPECT_FALSE(IsIpv4Literal("localhost"));
  EXPECT_FALSE(IsIpv4Literal("::1"));
  EXPECT_FALSE(IsIpv4Literal("256.0.0.1"));

  EXPECT_TRUE(IsIpv6Literal("::1"));
  EXPECT_TRUE(IsIpv6Literal("2001:db8::8a2e:370:7334"));
  EXPECT_FALSE(IsIpv6Literal("[::1]"));
  EXPECT_FALSE(IsIpv6Literal("127.0.0.1"));
}

}  // namespace
}  // namespace clientboot
