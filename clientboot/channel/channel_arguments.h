// Copyright 2023 Intrinsic Innovation LLC

#ifndef CLIENTBOOT_CHANNEL_CHANNEL_ARGUMENTS_H_
#define CLIENTBOOT_CHANNEL_CHANNEL_ARGUMENTS_H_

#include "clientboot/config/channel_properties.pb.h"
#include "grpcpp/support/channel_arguments.h"

namespace clientboot {

// Returns DefaultGrpcChannelArgs() extended with the keepalive, message size
// and load balancing settings of `properties`.
::grpc::ChannelArguments ChannelArgumentsFromProperties(
    const config::GrpcChannelProperties& properties);

}  // namespace clientboot

#endif  // CLIENTBOOT_CHANNEL_CHANNEL_ARGUMENTS_H_
