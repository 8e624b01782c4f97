// Copyright 2023 Intrinsic Innovation LLC

#ifndef CLIENTBOOT_UTIL_GRPC_CHANNEL_INTERFACE_H_
#define CLIENTBOOT_UTIL_GRPC_CHANNEL_INTERFACE_H_

#include <functional>
#include <memory>

#include "grpcpp/channel.h"
#include "grpcpp/client_context.h"

namespace clientboot {

// Factory function that produces a ::grpc::ClientContext.
using ClientContextFactory =
    std::function<std::unique_ptr<::grpc::ClientContext>()>;

// Returns a ::grpc::ClientContext configured with ConfigureClientContext().
std::unique_ptr<::grpc::ClientContext> DefaultClientContextFactory();

// Provides a channel to a gRPC server.
class ChannelInterface {
 public:
  virtual ~ChannelInterface() = default;

  // Returns a grpc::channel to the server.
  virtual std::shared_ptr<grpc::Channel> GetChannel() const = 0;

  // Returns a factory function that produces a ::grpc::ClientContext. This may
  // be overridden in order to set client metadata, or other ClientContext
  // settings, for all requests that use this channel.
  virtual ClientContextFactory GetClientContextFactory() const {
    return DefaultClientContextFactory;
  }
};

}  // namespace clientboot

#endif  // CLIENTBOOT_UTIL_GRPC_CHANNEL_INTERFACE_H_
