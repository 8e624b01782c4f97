// Copyright 2023 Intrinsic Innovation LLC

#ifndef CLIENTBOOT_UTIL_GRPC_CHANNEL_H_
#define CLIENTBOOT_UTIL_GRPC_CHANNEL_H_

#include <memory>
#include <ostream>
#include <string>

#include "absl/strings/string_view.h"
#include "clientboot/util/grpc/channel_interface.h"
#include "grpcpp/channel.h"

namespace clientboot {

// A gRPC channel created for a named client.
class Channel : public ChannelInterface {
 public:
  // `service_authority` identifies the resolved service in logs, and
  // `native_target` is the target string handed to gRPC.
  Channel(std::shared_ptr<grpc::Channel> channel, absl::string_view name,
          absl::string_view service_authority, absl::string_view native_target);

  std::shared_ptr<grpc::Channel> GetChannel() const override;

  const std::string& name() const { return name_; }
  const std::string& service_authority() const { return service_authority_; }
  const std::string& native_target() const { return native_target_; }

  friend std::ostream& operator<<(std::ostream& os, const Channel& c);

 private:
  std::shared_ptr<grpc::Channel> channel_;
  std::string name_;
  std::string service_authority_;
  std::string native_target_;
};

}  // namespace clientboot

#endif  // CLIENTBOOT_UTIL_GRPC_CHANNEL_H_
