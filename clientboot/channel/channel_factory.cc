// Copyright 2023 Intrinsic Innovation LLC

#include "clientboot/channel/channel_factory.h"

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "absl/log/log.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "absl/synchronization/mutex.h"
#include "absl/time/clock.h"
#include "absl/time/time.h"
#include "clientboot/channel/channel_arguments.h"
#include "clientboot/channel/native_target.h"
#include "clientboot/config/channel_properties.pb.h"
#include "clientboot/config/channels_properties.h"
#include "clientboot/nameresolver/endpoint.h"
#include "clientboot/nameresolver/name_resolver.h"
#include "clientboot/nameresolver/name_resolver_registry.h"
#include "clientboot/nameresolver/target_uri.h"
#include "clientboot/util/grpc/channel.h"
#include "clientboot/util/grpc/grpc.h"
#include "clientboot/util/status/annotate.h"
#include "clientboot/util/status/status_macros.h"
#include "grpcpp/create_channel.h"
#include "grpcpp/security/credentials.h"
#include "grpcpp/support/channel_arguments.h"

namespace clientboot {

namespace {

absl::Status ClosedError(absl::string_view name) {
  return absl::FailedPreconditionError(absl::StrCat(
      "cannot create channel for client ", name, ": factory is closed"));
}

}  // namespace

ChannelFactory::ChannelFactory(ChannelsProperties properties,
                               NameResolverRegistry* registry,
                               std::vector<ChannelConfigurer> configurers)
    : properties_(std::move(properties)),
      registry_(registry),
      configurers_(std::move(configurers)) {}

ChannelFactory::~ChannelFactory() { Close(); }

absl::StatusOr<ResolvedTarget> ChannelFactory::ResolveTarget(
    absl::string_view name) const {
  ResolvedTarget resolved;
  resolved.properties = properties_.GetChannel(name);
  const config::GrpcChannelProperties& properties = resolved.properties;

  resolved.target =
      properties.has_address() ? properties.address() : std::string(name);
  CLIENTBOOT_ASSIGN_OR_RETURN(TargetUri uri, TargetUri::Parse(resolved.target));
  if (!uri.HasScheme()) {
    std::string scheme = properties.has_default_scheme()
                             ? properties.default_scheme()
                             : registry_->DefaultScheme();
    resolved.target = TargetUri::WithDefaultScheme(scheme, resolved.target);
  }

  NameResolverArgs args;
  if (properties.has_default_port()) {
    args.default_port = properties.default_port();
  }
  CLIENTBOOT_ASSIGN_OR_RETURN(
      resolved.resolver, registry_->NewNameResolver(resolved.target, args));
  if (resolved.resolver == nullptr) {
    resolved.service_authority = resolved.target;
    resolved.native_target = resolved.target;
    return resolved;
  }

  resolved.service_authority = resolved.resolver->GetServiceAuthority();
  std::vector<EndpointGroup> groups;
  resolved.resolver->Start(
      [&groups](const std::vector<EndpointGroup>& delivered,
                const Attributes&) { groups = delivered; });
  absl::StatusOr<std::string> native_target = ToNativeTarget(groups);
  if (!native_target.ok()) {
    resolved.resolver->Shutdown();
    return AnnotateError(native_target.status(),
                         absl::StrCat("for target ", resolved.target));
  }
  resolved.native_target = *std::move(native_target);
  return resolved;
}

absl::StatusOr<ChannelFactory::Entry> ChannelFactory::NewEntry(
    absl::string_view name) const {
  CLIENTBOOT_ASSIGN_OR_RETURN(ResolvedTarget resolved, ResolveTarget(name));

  ::grpc::ChannelArguments channel_args =
      ChannelArgumentsFromProperties(resolved.properties);
  for (const ChannelConfigurer& configurer : configurers_) {
    configurer(name, channel_args);
  }

  std::shared_ptr<::grpc::Channel> grpc_channel = ::grpc::CreateCustomChannel(
      resolved.native_target,
      ::grpc::                       // NOLINTNEXTLINE
      InsecureChannelCredentials(),  // NO_LINT(grpc_insecure_credential_linter)
      channel_args);

  if (absl::Duration timeout = ImmediateConnectTimeout(resolved.properties);
      timeout > absl::ZeroDuration()) {
    absl::Status status = WaitForChannelConnected(
        resolved.native_target, grpc_channel, absl::Now() + timeout);
    if (!status.ok()) {
      if (resolved.resolver != nullptr) resolved.resolver->Shutdown();
      return status;
    }
  }

  Entry entry;
  entry.channel = std::make_shared<Channel>(std::move(grpc_channel), name,
                                            resolved.service_authority,
                                            resolved.native_target);
  entry.resolver = std::move(resolved.resolver);
  return entry;
}

absl::StatusOr<std::shared_ptr<Channel>> ChannelFactory::CreateChannel(
    absl::string_view name) {
  {
    absl::MutexLock l(&mutex_);
    if (closed_) return ClosedError(name);
    if (auto it = channels_.find(name); it != channels_.end()) {
      return it->second.channel;
    }
  }

  // Configurers and the immediate connect run without the lock held, so they
  // may create channels for other clients.
  absl::StatusOr<Entry> entry = NewEntry(name);
  if (!entry.ok()) {
    LOG(ERROR) << "Failed to create channel for client " << name << ": "
               << entry.status();
    return AnnotateError(
        entry.status(),
        absl::StrCat("while creating channel for client ", name));
  }

  absl::MutexLock l(&mutex_);
  if (closed_) {
    if (entry->resolver != nullptr) entry->resolver->Shutdown();
    return ClosedError(name);
  }
  auto [it, inserted] = channels_.try_emplace(std::string(name));
  if (!inserted) {
    // Another thread created the channel first.
    if (entry->resolver != nullptr) entry->resolver->Shutdown();
    return it->second.channel;
  }
  it->second = *std::move(entry);
  LOG(INFO) << "Created channel " << *it->second.channel;
  return it->second.channel;
}

void ChannelFactory::Close() {
  absl::MutexLock l(&mutex_);
  if (closed_) return;
  closed_ = true;
  for (auto& [name, entry] : channels_) {
    if (entry.resolver != nullptr) entry.resolver->Shutdown();
  }
  if (!channels_.empty()) {
    LOG(INFO) << "Closed " << channels_.size() << " channels";
  }
  channels_.clear();
}

}  // namespace clientboot
