// Copyright 2023 Intrinsic Innovation LLC

#ifndef CLIENTBOOT_CONFIG_CHANNELS_PROPERTIES_H_
#define CLIENTBOOT_CONFIG_CHANNELS_PROPERTIES_H_

#include <string>
#include <vector>

#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "absl/time/time.h"
#include "clientboot/config/channel_properties.pb.h"

namespace clientboot {

// Name of the properties entry that provides defaults for all clients.
inline constexpr absl::string_view kGlobalPropertiesKey = "GLOBAL";

inline constexpr absl::Duration kDefaultKeepAliveTime = absl::Minutes(5);
inline constexpr absl::Duration kDefaultKeepAliveTimeout = absl::Seconds(20);

// Channel properties of all clients.
//
// Properties of a named client override the "GLOBAL" properties field by
// field; a field left unset for the client is taken from "GLOBAL".
class ChannelsProperties {
 public:
  ChannelsProperties() = default;
  explicit ChannelsProperties(config::GrpcChannelsProperties proto);

  // Loads properties from a text format GrpcChannelsProperties file.
  static absl::StatusOr<ChannelsProperties> FromTextProtoFile(
      absl::string_view filename);

  // Parses properties from a text format GrpcChannelsProperties.
  static absl::StatusOr<ChannelsProperties> FromTextProto(
      absl::string_view text);

  // Returns the merged properties for the client `name`. For an unknown
  // client, returns the "GLOBAL" properties.
  config::GrpcChannelProperties GetChannel(absl::string_view name) const;

  // Returns the properties of `name` exactly as configured, without "GLOBAL"
  // defaults.
  config::GrpcChannelProperties GetRawChannel(absl::string_view name) const;

  // Returns the configured client names, sorted, "GLOBAL" excluded.
  std::vector<std::string> ClientNames() const;

  const config::GrpcChannelsProperties& proto() const { return proto_; }

 private:
  config::GrpcChannelsProperties proto_;
};

// Accessors that apply the documented default for unset fields.
absl::Duration KeepAliveTime(const config::GrpcChannelProperties& properties);
absl::Duration KeepAliveTimeout(
    const config::GrpcChannelProperties& properties);
absl::Duration ImmediateConnectTimeout(
    const config::GrpcChannelProperties& properties);

}  // namespace clientboot

#endif  // CLIENTBOOT_CONFIG_CHANNELS_PROPERTIES_H_
