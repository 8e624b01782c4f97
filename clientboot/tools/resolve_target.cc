// Copyright 2023 Intrinsic Innovation LLC

#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "absl/flags/flag.h"
#include "absl/log/check.h"
#include "absl/log/log.h"
#include "absl/status/status.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "clientboot/channel/channel_factory.h"
#include "clientboot/config/channels_properties.h"
#include "clientboot/nameresolver/endpoint.h"
#include "clientboot/nameresolver/name_resolver.h"
#include "clientboot/nameresolver/name_resolver_registry.h"
#include "clientboot/util/init/init_clientboot.h"
#include "clientboot/util/status/status_macros.h"
#include "google/protobuf/text_format.h"

ABSL_FLAG(std::string, target, "",
          "Target to resolve, e.g. static://10.0.0.1:8080,10.0.0.2.");
ABSL_FLAG(std::optional<int>, default_port, std::nullopt,
          "Port of endpoints in --target that do not specify one.");
ABSL_FLAG(std::string, config, "",
          "Text format GrpcChannelsProperties file.");
ABSL_FLAG(std::string, client, "",
          "Name of the client in --config whose channel target is resolved.");

const char* UsageString() {
  return R"(
Usage: resolve_target --target=<target> [--default_port=<port>]
       resolve_target --config=<file> --client=<name>

Resolves a target with the registered name resolvers and prints the resulting
endpoints. With --config, prints the merged channel properties of the client
and the target handed to gRPC. No connection is made.
)";
}

namespace clientboot {
namespace {

absl::Status ResolveTarget(absl::string_view target,
                           std::optional<int> default_port) {
  NameResolverArgs args;
  args.default_port = default_port;
  CLIENTBOOT_ASSIGN_OR_RETURN(
      std::unique_ptr<NameResolver> resolver,
      NameResolverRegistry::Default().NewNameResolver(target, args));
  if (resolver == nullptr) {
    return absl::NotFoundError(
        absl::StrCat("No name resolver accepts target ", target));
  }

  std::cout << "authority: " << resolver->GetServiceAuthority() << std::endl;
  resolver->Start([](const std::vector<EndpointGroup>& groups,
                     const Attributes&) {
    for (const EndpointGroup& group : groups) {
      std::cout << "group:" << std::endl;
      for (const Endpoint& endpoint : group.endpoints()) {
        std::cout << "  " << endpoint << std::endl;
      }
    }
  });
  resolver->Shutdown();
  return absl::OkStatus();
}

absl::Status ResolveClient(absl::string_view config, absl::string_view client) {
  if (client.empty()) {
    return absl::InvalidArgumentError("--config requires --client=<name>.");
  }
  CLIENTBOOT_ASSIGN_OR_RETURN(ChannelsProperties properties,
                              ChannelsProperties::FromTextProtoFile(config));
  ChannelFactory factory(std::move(properties));
  CLIENTBOOT_ASSIGN_OR_RETURN(ResolvedTarget resolved,
                              factory.ResolveTarget(client));
  if (resolved.resolver != nullptr) resolved.resolver->Shutdown();

  std::string text;
  if (!google::protobuf::TextFormat::PrintToString(resolved.properties,
                                                   &text)) {
    return absl::InternalError("Failed to print channel properties.");
  }
  std::cout << text;
  std::cout << "target: " << resolved.target << std::endl;
  std::cout << "authority: " << resolved.service_authority << std::endl;
  std::cout << "native target: " << resolved.native_target << std::endl;
  return absl::OkStatus();
}

absl::Status MainImpl() {
  std::string target = absl::GetFlag(FLAGS_target);
  std::string config = absl::GetFlag(FLAGS_config);
  if (target.empty() == config.empty()) {
    return absl::InvalidArgumentError(
        "Exactly one of --target and --config is required.");
  }
  if (!target.empty()) {
    return ResolveTarget(target, absl::GetFlag(FLAGS_default_port));
  }
  return ResolveClient(config, absl::GetFlag(FLAGS_client));
}

}  // namespace
}  // namespace clientboot

int main(int argc, char** argv) {
  InitClientboot(UsageString(), argc, argv);
  QCHECK_OK(clientboot::MainImpl());
  return 0;
}
