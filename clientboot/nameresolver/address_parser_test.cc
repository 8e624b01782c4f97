// Copyright 2023 Intrinsic Innovation LLC

#include "clientboot/nameresolver/address_parser.h"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "absl/status/status.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "clientboot/nameresolver/endpoint.h"
#include "clientboot/nameresolver/name_resolver.h"

namespace clientboot {
namespace {

using ::testing::ElementsAre;
using ::testing::HasSubstr;

TEST(ParseStaticAuthority, ParsesHostsAndPortsInOrder) {
  auto endpoints = ParseStaticAuthority("192.168.1.1:8080,10.0.0.1:1337",
                                        NameResolverArgs());
  ASSERT_TRUE(endpoints.ok()) << endpoints.status();
  EXPECT_THAT(*endpoints, ElementsAre(Endpoint("192.168.1.1", 8080),
                                      Endpoint("10.0.0.1", 1337)));
}

TEST(ParseStaticAuthority, ProducesOneEndpointPerEntry) {
  std::vector<std::string> entries;
  for (int i = 1; i <= 20; ++i) {
    entries.push_back(absl::StrCat("host-", i, ".example.com:", 1000 + i));
  }
  auto endpoints =
      ParseStaticAuthority(absl::StrJoin(entries, ","), NameResolverArgs());
  ASSERT_TRUE(endpoints.ok()) << endpoints.status();
  ASSERT_EQ(endpoints->size(), entries.size());
  for (int i = 0; i < 20; ++i) {
    EXPECT_EQ((*endpoints)[i].host(),
              absl::StrCat("host-", i + 1, ".example.com"));
    EXPECT_EQ((*endpoints)[i].port(), 1001 + i);
  }
}

TEST(ParseStaticAuthority, UsesDefaultPortArgument) {
  NameResolverArgs args;
  args.default_port = 50051;
  auto endpoints = ParseStaticAuthority("backend,10.0.0.1:1337", args);
  ASSERT_TRUE(endpoints.ok()) << endpoints.status();
  EXPECT_THAT(*endpoints, ElementsAre(Endpoint("backend", 50051),
                                      Endpoint("10.0.0.1", 1337)));
}

TEST(ParseStaticAuthority, FallsBackToDefaultGrpcPort) {
  auto endpoints = ParseStaticAuthority("localhost", NameResolverArgs());
  ASSERT_TRUE(endpoints.ok()) << endpoints.status();
  EXPECT_THAT(*endpoints, ElementsAre(Endpoint("localhost", kDefaultGrpcPort)));
  EXPECT_EQ(kDefaultGrpcPort, 9090);
}

TEST(ParseStaticAuthority, EmptyPortUsesDefault) {
  auto endpoints = ParseStaticAuthority("localhost:", NameResolverArgs());
  ASSERT_TRUE(endpoints.ok()) << endpoints.status();
  EXPECT_THAT(*endpoints, ElementsAre(Endpoint("localhost", 9090)));
}

TEST(ParseStaticAuthority, ParsesBracketedIpv6) {
  NameResolverArgs args;
  args.default_port = 7000;
  auto endpoints = ParseStaticAuthority("[::1]:8080,[2001:db8::1]", args);
  ASSERT_TRUE(endpoints.ok()) << endpoints.status();
  EXPECT_THAT(*endpoints, ElementsAre(Endpoint("::1", 8080),
                                      Endpoint("2001:db8::1", 7000)));
}

TEST(ParseStaticAuthority, RejectsEmptyAuthority) {
  auto endpoints = ParseStaticAuthority("", NameResolverArgs());
  EXPECT_EQ(endpoints.status().code(), absl::StatusCode::kInvalidArgument);
  EXPECT_THAT(std::string(endpoints.status().message()),
              HasSubstr("at least one endpoint"));
}

TEST(ParseStaticAuthority, RejectsMalformedEntries) {
  for (const char* authority : {
           ",",
           "a:1,",
           ",a:1",
           "a:1,,b:2",
           "a:port",
           "a:0",
           "a:65536",
           "a:-1",
           "a:1:2",
           "::1",
           "[::1",
           "[::1]x",
           "[not-ipv6]:1",
           "a b:1",
           " a:1",
           "a/b:1",
       }) {
    auto endpoints = ParseStaticAuthority(authority, NameResolverArgs());
    EXPECT_EQ(endpoints.status().code(), absl::StatusCode::kInvalidArgument)
        << "authority: \"" << authority << "\"";
    EXPECT_THAT(std::string(endpoints.status().message()),
                HasSubstr(authority));
  }
}

TEST(ParseStaticAuthority, RejectsDefaultPortOutOfRange) {
  NameResolverArgs args;
  args.default_port = 0;
  EXPECT_EQ(ParseStaticAuthority("a", args).status().code(),
            absl::StatusCode::kInvalidArgument);
  EXPECT_TRUE(ParseStaticAuthority("a:1", args).ok());
}

}  // namespace
}  // namespace clientboot
