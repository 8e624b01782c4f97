// Copyright 2023 Intrinsic Innovation LLC

#include "clientboot/channel/channel_arguments.h"

#include <climits>
#include <cstdint>

#include "absl/time/time.h"
#include "clientboot/config/channel_properties.pb.h"
#include "clientboot/config/channels_properties.h"
#include "clientboot/util/grpc/grpc.h"
#include "grpcpp/grpcpp.h"
#include "grpcpp/support/channel_arguments.h"

namespace clientboot {

namespace {

int ToClampedMillis(absl::Duration duration) {
  int64_t millis = absl::ToInt64Milliseconds(duration);
  if (millis > INT_MAX) return INT_MAX;
  if (millis < 0) return 0;
  return static_cast<int>(millis);
}

}  // namespace

::grpc::ChannelArguments ChannelArgumentsFromProperties(
    const config::GrpcChannelProperties& properties) {
  ::grpc::ChannelArguments channel_args = DefaultGrpcChannelArgs();

  if (properties.enable_keep_alive()) {
    channel_args.SetInt(GRPC_ARG_KEEPALIVE_TIME_MS,
                        ToClampedMillis(KeepAliveTime(properties)));
    channel_args.SetInt(GRPC_ARG_KEEPALIVE_TIMEOUT_MS,
                        ToClampedMillis(KeepAliveTimeout(properties)));
    channel_args.SetInt(GRPC_ARG_KEEPALIVE_PERMIT_WITHOUT_CALLS,
                        properties.keep_alive_without_calls() ? 1 : 0);
  } else {
    // A keepalive time of INT_MAX disables client side keepalive pings.
    channel_args.SetInt(GRPC_ARG_KEEPALIVE_TIME_MS, INT_MAX);
  }

  if (properties.has_max_inbound_message_size()) {
    channel_args.SetMaxReceiveMessageSize(
        properties.max_inbound_message_size());
  }

  if (!properties.default_load_balancing_policy().empty()) {
    channel_args.SetLoadBalancingPolicyName(
        properties.default_load_balancing_policy());
  }
  return channel_args;
}

}  // namespace clientboot
