// Copyright 2023 Intrinsic Innovation LLC

#ifndef CLIENTBOOT_UTIL_GRPC_GRPC_H_
#define CLIENTBOOT_UTIL_GRPC_GRPC_H_

#include <memory>

#include "absl/status/status.h"
#include "absl/strings/string_view.h"
#include "absl/time/clock.h"
#include "absl/time/time.h"
#include "grpcpp/grpcpp.h"

namespace clientboot {

/**
 * Apply the default configuration of our project to the given ClientContext.
 */
void ConfigureClientContext(::grpc::ClientContext* client_context);

/**
 * Wait for a newly created channel to be connected
 */
absl::Status WaitForChannelConnected(absl::string_view address,
                                     std::shared_ptr<::grpc::Channel> channel,
                                     absl::Time deadline = absl::Now());

// Returns a readable name for `state`, e.g. "GRPC_CHANNEL_IDLE".
absl::string_view ConnectivityStateName(grpc_connectivity_state state);

// Get recommended default gRPC channel arguments.
::grpc::ChannelArguments DefaultGrpcChannelArgs();

}  // namespace clientboot

#endif  // CLIENTBOOT_UTIL_GRPC_GRPC_H_
