// Copyright 2023 Intrinsic Innovation LLC

#include "clientboot/nameresolver/static_name_resolver.h"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <memory>
#include <vector>

#include "absl/status/status.h"
#include "clientboot/nameresolver/endpoint.h"
#include "clientboot/nameresolver/name_resolver.h"

namespace clientboot {
namespace {

using ::testing::_;
using ::testing::ElementsAre;
using ::testing::IsEmpty;
using ::testing::MockFunction;

using State = StaticNameResolver::State;

std::unique_ptr<StaticNameResolver> MakeResolver(const char* authority) {
  auto resolver = StaticNameResolver::FromAuthority(authority, {});
  EXPECT_TRUE(resolver.ok()) << resolver.status();
  return *std::move(resolver);
}

TEST(StaticNameResolver, DeliversAllEndpointsOnceOnStart) {
  auto resolver = MakeResolver("192.168.1.1:8080,10.0.0.1:1337");
  EXPECT_EQ(resolver->state(), State::kCreated);

  MockFunction<void(const std::vector<EndpointGroup>&, const Attributes&)>
      listener;
  std::vector<EndpointGroup> delivered;
  Attributes attributes = {{"unset", "marker"}};
  EXPECT_CALL(listener, Call(_, _))
      .WillOnce(
          [&](const std::vector<EndpointGroup>& groups, const Attributes& a) {
            delivered = groups;
            attributes = a;
          });

  resolver->Start(listener.AsStdFunction());

  EXPECT_EQ(resolver->state(), State::kStarted);
  ASSERT_EQ(delivered.size(), 1u);
  EXPECT_THAT(delivered[0].endpoints(),
              ElementsAre(Endpoint("192.168.1.1", 8080),
                          Endpoint("10.0.0.1", 1337)));
  EXPECT_THAT(attributes, IsEmpty());

  resolver->Shutdown();
  EXPECT_EQ(resolver->state(), State::kShutdown);
}

TEST(StaticNameResolver, RefreshNeverNotifiesAgain) {
  auto resolver = MakeResolver("a:1");
  int calls = 0;
  resolver->Start(
      [&calls](const std::vector<EndpointGroup>&, const Attributes&) {
        ++calls;
      });
  for (int i = 0; i < 5; ++i) resolver->Refresh();
  EXPECT_EQ(calls, 1);
  EXPECT_EQ(resolver->state(), State::kStarted);
}

TEST(StaticNameResolver, SecondStartIsIgnored) {
  auto resolver = MakeResolver("a:1");
  MockFunction<void(const std::vector<EndpointGroup>&, const Attributes&)>
      first;
  MockFunction<void(const std::vector<EndpointGroup>&, const Attributes&)>
      second;
  EXPECT_CALL(first, Call(_, _)).Times(1);
  EXPECT_CALL(second, Call(_, _)).Times(0);

  resolver->Start(first.AsStdFunction());
  resolver->Start(second.AsStdFunction());
}

TEST(StaticNameResolver, ShutdownIsIdempotentAndFinal) {
  auto resolver = MakeResolver("a:1");
  resolver->Shutdown();
  resolver->Shutdown();
  EXPECT_EQ(resolver->state(), State::kShutdown);

  MockFunction<void(const std::vector<EndpointGroup>&, const Attributes&)>
      listener;
  EXPECT_CALL(listener, Call(_, _)).Times(0);
  resolver->Start(listener.AsStdFunction());
  resolver->Refresh();
  EXPECT_EQ(resolver->state(), State::kShutdown);
}

TEST(StaticNameResolver, StartWithoutListenerDoesNotCrash) {
  auto resolver = MakeResolver("a:1");
  resolver->Start(nullptr);
  EXPECT_EQ(resolver->state(), State::kStarted);
}

TEST(StaticNameResolver, PreservesAuthorityInEveryState) {
  constexpr char kAuthority[] = "192.168.1.1:8080,10.0.0.1:1337";
  auto resolver = MakeResolver(kAuthority);
  EXPECT_EQ(resolver->GetServiceAuthority(), kAuthority);
  resolver->Start([](const std::vector<EndpointGroup>&, const Attributes&) {});
  EXPECT_EQ(resolver->GetServiceAuthority(), kAuthority);
  resolver->Shutdown();
  EXPECT_EQ(resolver->GetServiceAuthority(), kAuthority);
}

TEST(StaticNameResolver, CreateRejectsEmptyGroupList) {
  auto resolver = StaticNameResolver::Create("a:1", {});
  EXPECT_EQ(resolver.status().code(), absl::StatusCode::kInvalidArgument);
}

TEST(StaticNameResolver, CreateKeepsGivenGroups) {
  auto first = EndpointGroup::Create({Endpoint("a", 1)});
  auto second = EndpointGroup::Create({Endpoint("b", 2), Endpoint("c", 3)});
  ASSERT_TRUE(first.ok());
  ASSERT_TRUE(second.ok());
  auto resolver = StaticNameResolver::Create("custom", {*first, *second});
  ASSERT_TRUE(resolver.ok()) << resolver.status();

  std::vector<EndpointGroup> delivered;
  (*resolver)->Start(
      [&](const std::vector<EndpointGroup>& groups, const Attributes&) {
        delivered = groups;
      });
  EXPECT_THAT(delivered, ElementsAre(*first, *second));
  EXPECT_EQ((*resolver)->GetServiceAuthority(), "custom");
}

TEST(StaticNameResolver, FromAuthorityRejectsEmptyAuthority) {
  auto resolver = StaticNameResolver::FromAuthority("", {});
  EXPECT_EQ(resolver.status().code(), absl::StatusCode::kInvalidArgument);
}

}  // namespace
}  // namespace clientboot
