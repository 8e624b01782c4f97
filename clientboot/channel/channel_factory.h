// Copyright 2023 Intrinsic Innovation LLC

#ifndef CLIENTBOOT_CHANNEL_CHANNEL_FACTORY_H_
#define CLIENTBOOT_CHANNEL_CHANNEL_FACTORY_H_

#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "absl/base/thread_annotations.h"
#include "absl/container/flat_hash_map.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "absl/synchronization/mutex.h"
#include "clientboot/config/channel_properties.pb.h"
#include "clientboot/config/channels_properties.h"
#include "clientboot/nameresolver/name_resolver.h"
#include "clientboot/nameresolver/name_resolver_registry.h"
#include "clientboot/util/grpc/channel.h"
#include "grpcpp/support/channel_arguments.h"

namespace clientboot {

// Hook that customizes the channel arguments of the client `name` before its
// channel is created.
using ChannelConfigurer =
    std::function<void(absl::string_view name, ::grpc::ChannelArguments& args)>;

// The outcome of resolving the target of a client.
struct ResolvedTarget {
  // Merged properties of the client.
  config::GrpcChannelProperties properties;
  // The target after the default scheme was applied.
  std::string target;
  // Identity of the resolved service, see NameResolver::GetServiceAuthority().
  std::string service_authority;
  // The target handed to gRPC.
  std::string native_target;
  // The started resolver, or nullptr if gRPC resolves the target itself.
  std::unique_ptr<NameResolver> resolver;
};

// Creates and caches one gRPC channel per client name, configured from
// ChannelsProperties.
//
// Targets claimed by a provider of the NameResolverRegistry are resolved
// through it; the resolved endpoints are then handed to gRPC as an "ipv4:",
// "ipv6:" or "dns:" target. Other targets are passed to gRPC unchanged.
// Providers must report their endpoints from within NameResolver::Start().
//
// All methods are thread-safe.
class ChannelFactory {
 public:
  explicit ChannelFactory(
      ChannelsProperties properties,
      NameResolverRegistry* registry = &NameResolverRegistry::Default(),
      std::vector<ChannelConfigurer> configurers = {});

  ChannelFactory(const ChannelFactory&) = delete;
  ChannelFactory& operator=(const ChannelFactory&) = delete;

  // Calls Close().
  ~ChannelFactory();

  // Returns the channel of the client `name`, creating it on first use.
  //
  // The channel is built without holding the factory's lock, so configurers
  // may create channels for other clients. When two threads create the same
  // client concurrently, both receive the channel that was cached first.
  //
  // Returns an InvalidArgumentError if the target is invalid, e.g. a static
  // target without endpoints, an UnavailableError if an immediate connect
  // timed out, and a FailedPreconditionError after Close().
  absl::StatusOr<std::shared_ptr<Channel>> CreateChannel(absl::string_view name)
      ABSL_LOCKS_EXCLUDED(mutex_);

  // Resolves the target of the client `name` without creating a channel. The
  // caller owns the returned resolver and must shut it down.
  absl::StatusOr<ResolvedTarget> ResolveTarget(absl::string_view name) const;

  // Shuts down all resolvers and forgets all channels. Channels still
  // referenced elsewhere remain usable.
  void Close() ABSL_LOCKS_EXCLUDED(mutex_);

 private:
  struct Entry {
    std::shared_ptr<Channel> channel;
    std::unique_ptr<NameResolver> resolver;
  };

  absl::StatusOr<Entry> NewEntry(absl::string_view name) const;

  const ChannelsProperties properties_;
  NameResolverRegistry* const registry_;
  const std::vector<ChannelConfigurer> configurers_;

  absl::Mutex mutex_;
  absl::flat_hash_map<std::string, Entry> channels_ ABSL_GUARDED_BY(mutex_);
  bool closed_ ABSL_GUARDED_BY(mutex_) = false;
};

}  // namespace clientboot

#endif  // CLIENTBOOT_CHANNEL_CHANNEL_FACTORY_H_
