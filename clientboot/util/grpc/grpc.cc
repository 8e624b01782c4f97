// Copyright 2023 Intrinsic Innovation LLC

#include "clientboot/util/grpc/grpc.h"

#include <memory>
#include <string>

#include "absl/status/status.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "absl/time/clock.h"
#include "absl/time/time.h"
#include "grpcpp/grpcpp.h"

namespace clientboot {

void ConfigureClientContext(::grpc::ClientContext* client_context) {
  // Calls block until the channel is ready instead of failing right away while
  // the server is still starting.
  client_context->set_wait_for_ready(true);
}

absl::string_view ConnectivityStateName(grpc_connectivity_state state) {
  switch (state) {
    case GRPC_CHANNEL_IDLE:
      return "GRPC_CHANNEL_IDLE";
    case GRPC_CHANNEL_CONNECTING:
      return "GRPC_CHANNEL_CONNECTING";
    case GRPC_CHANNEL_READY:
      return "GRPC_CHANNEL_READY";
    case GRPC_CHANNEL_TRANSIENT_FAILURE:
      return "GRPC_CHANNEL_TRANSIENT_FAILURE";
    case GRPC_CHANNEL_SHUTDOWN:
      return "GRPC_CHANNEL_SHUTDOWN";
  }
  return "UNKNOWN";
}

absl::Status WaitForChannelConnected(absl::string_view address,
                                     std::shared_ptr<::grpc::Channel> channel,
                                     absl::Time deadline) {
  if (channel->GetState(true) == GRPC_CHANNEL_READY) {
    return absl::OkStatus();
  }
  channel->WaitForConnected(absl::ToChronoTime(deadline));
  grpc_connectivity_state channel_state = channel->GetState(false);
  if (channel_state == GRPC_CHANNEL_READY) {
    return absl::OkStatus();
  }
  return absl::UnavailableError(
      absl::StrCat("gRPC channel to ", address, " is unavailable.  State is ",
                   ConnectivityStateName(channel_state)));
}

::grpc::ChannelArguments DefaultGrpcChannelArgs() {
  ::grpc::ChannelArguments channel_args;
  channel_args.SetInt(GRPC_ARG_MAX_RECONNECT_BACKOFF_MS, 1000);

  // Increase metadata size, this includes, for example, the size of the
  // information gathered from an absl::Status on error. Default is 8KB.
  channel_args.SetInt(GRPC_ARG_MAX_METADATA_SIZE, 16 * 1024);

  // Service configs are never looked up through DNS TXT records.
  channel_args.SetInt(GRPC_ARG_SERVICE_CONFIG_DISABLE_RESOLUTION, 1);
  return channel_args;
}

}  // namespace clientboot
