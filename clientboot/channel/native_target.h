// Copyright 2023 Intrinsic Innovation LLC

#ifndef CLIENTBOOT_CHANNEL_NATIVE_TARGET_H_
#define CLIENTBOOT_CHANNEL_NATIVE_TARGET_H_

#include <functional>
#include <string>
#include <vector>

#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "clientboot/nameresolver/endpoint.h"

namespace clientboot {

// Returns the IP literals `host` resolves to, in resolver order. IPv6
// addresses are returned without brackets.
using HostLookup = std::function<absl::StatusOr<std::vector<std::string>>(
    absl::string_view host)>;

// Resolves `host` with getaddrinfo(). Returns an UnavailableError if the host
// cannot be resolved.
absl::StatusOr<std::vector<std::string>> LookupHost(absl::string_view host);

// Converts resolved endpoint groups into a target that gRPC resolves with its
// built-in resolvers:
//
//   only IPv4 literals        -> "ipv4:10.0.0.1:80,10.0.0.2:80"
//   only IPv6 literals        -> "ipv6:[::1]:80,[::2]:80"
//   a single hostname         -> "dns:///backend.local:80"
//
// With several endpoints, hostnames are looked up once with `lookup` and
// replaced by their first address. IPv4 addresses are preferred unless all
// literal endpoints are IPv6.
//
// Returns an UnimplementedError for mixed address families, an
// UnavailableError if a hostname cannot be resolved, and an
// InvalidArgumentError if there are no endpoints.
absl::StatusOr<std::string> ToNativeTarget(
    const std::vector<EndpointGroup>& groups,
    const HostLookup& lookup = LookupHost);

}  // namespace clientboot

#endif  // CLIENTBOOT_CHANNEL_NATIVE_TARGET_H_
