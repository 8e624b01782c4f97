// Copyright 2023 Intrinsic Innovation LLC

#include "clientboot/config/channels_properties.h"

#include <algorithm>
#include <string>
#include <utility>
#include <vector>

#include "absl/log/log.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "absl/time/time.h"
#include "clientboot/config/channel_properties.pb.h"
#include "clientboot/util/proto/get_text_proto.h"
#include "clientboot/util/proto/merge.h"
#include "clientboot/util/status/status_macros.h"
#include "google/protobuf/duration.pb.h"

namespace clientboot {

namespace {

absl::Duration FromDurationProto(const google::protobuf::Duration& proto) {
  return absl::Seconds(proto.seconds()) + absl::Nanoseconds(proto.nanos());
}

}  // namespace

ChannelsProperties::ChannelsProperties(config::GrpcChannelsProperties proto)
    : proto_(std::move(proto)) {}

// static
absl::StatusOr<ChannelsProperties> ChannelsProperties::FromTextProtoFile(
    absl::string_view filename) {
  config::GrpcChannelsProperties proto;
  CLIENTBOOT_RETURN_IF_ERROR(GetTextProto(filename, proto));
  LOG(INFO) << "Loaded channel properties for " << proto.client_size()
            << " entries from " << filename;
  return ChannelsProperties(std::move(proto));
}

// static
absl::StatusOr<ChannelsProperties> ChannelsProperties::FromTextProto(
    absl::string_view text) {
  config::GrpcChannelsProperties proto;
  CLIENTBOOT_RETURN_IF_ERROR(ParseTextProto(text, proto));
  return ChannelsProperties(std::move(proto));
}

config::GrpcChannelProperties ChannelsProperties::GetRawChannel(
    absl::string_view name) const {
  auto it = proto_.client().find(std::string(name));
  if (it == proto_.client().end()) {
    return config::GrpcChannelProperties();
  }
  return it->second;
}

config::GrpcChannelProperties ChannelsProperties::GetChannel(
    absl::string_view name) const {
  config::GrpcChannelProperties properties = GetRawChannel(name);
  if (name == kGlobalPropertiesKey) {
    return properties;
  }
  absl::Status status =
      MergeUnset(GetRawChannel(kGlobalPropertiesKey), properties);
  if (!status.ok()) {
    // Both messages have the same type, so merging cannot fail.
    LOG(ERROR) << "Failed to apply GLOBAL channel properties to " << name
               << ": " << status;
  }
  return properties;
}

std::vector<std::string> ChannelsProperties::ClientNames() const {
  std::vector<std::string> names;
  for (const auto& [name, _] : proto_.client()) {
    if (name != kGlobalPropertiesKey) names.push_back(name);
  }
  std::sort(names.begin(), names.end());
  return names;
}

absl::Duration KeepAliveTime(const config::GrpcChannelProperties& properties) {
  return properties.has_keep_alive_time()
             ? FromDurationProto(properties.keep_alive_time())
             : kDefaultKeepAliveTime;
}

absl::Duration KeepAliveTimeout(
    const config::GrpcChannelProperties& properties) {
  return properties.has_keep_alive_timeout()
             ? FromDurationProto(properties.keep_alive_timeout())
             : kDefaultKeepAliveTimeout;
}

absl::Duration ImmediateConnectTimeout(
    const config::GrpcChannelProperties& properties) {
  return properties.has_immediate_connect_timeout()
             ? FromDurationProto(properties.immediate_connect_timeout())
             : absl::ZeroDuration();
}

}  // namespace clientboot
