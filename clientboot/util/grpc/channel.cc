// Copyright 2023 Intrinsic Innovation LLC

#include "clientboot/util/grpc/channel.h"

#include <memory>
#include <ostream>
#include <utility>

#include "absl/strings/str_format.h"
#include "absl/strings/string_view.h"
#include "grpcpp/channel.h"

namespace clientboot {

Channel::Channel(std::shared_ptr<grpc::Channel> channel, absl::string_view name,
                 absl::string_view service_authority,
                 absl::string_view native_target)
    : channel_(std::move(channel)),
      name_(name),
      service_authority_(service_authority),
      native_target_(native_target) {}

std::shared_ptr<grpc::Channel> Channel::GetChannel() const { return channel_; }

std::ostream& operator<<(std::ostream& os, const Channel& c) {
  return os << absl::StreamFormat("%s (%s via %s)", c.name_,
                                  c.service_authority_, c.native_target_);
}

}  // namespace clientboot
