// Copyright 2023 Intrinsic Innovation LLC

#include "clientboot/channel/native_target.h"

#include <arpa/inet.h>
#include <netdb.h>
#include <sys/socket.h>

#include <algorithm>
#include <cstddef>
#include <string>
#include <utility>
#include <vector>

#include "absl/log/log.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "absl/strings/string_view.h"
#include "clientboot/nameresolver/endpoint.h"
#include "clientboot/util/status/annotate.h"
#include "clientboot/util/status/status_macros.h"

namespace clientboot {

namespace {

bool IsIpLiteral(absl::string_view host) {
  return IsIpv4Literal(host) || IsIpv6Literal(host);
}

// Picks the first address of the preferred family, or else the first IP
// address of the other family.
absl::StatusOr<std::string> PickAddress(absl::string_view host,
                                        const std::vector<std::string>& found,
                                        bool prefer_ipv6) {
  auto preferred = std::find_if(found.begin(), found.end(),
                                [prefer_ipv6](const std::string& address) {
                                  return prefer_ipv6 ? IsIpv6Literal(address)
                                                     : IsIpv4Literal(address);
                                });
  if (preferred != found.end()) return *preferred;
  auto other = std::find_if(found.begin(), found.end(), IsIpLiteral);
  if (other != found.end()) return *other;
  return absl::UnavailableError(
      absl::StrCat("host ", host, " resolved to no IP addresses"));
}

}  // namespace

absl::StatusOr<std::vector<std::string>> LookupHost(absl::string_view host) {
  addrinfo hints = {};
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;

  addrinfo* info = nullptr;
  int result = getaddrinfo(std::string(host).c_str(), nullptr, &hints, &info);
  if (result != 0) {
    return absl::UnavailableError(absl::StrCat(
        "failed to resolve host ", host, ": ", gai_strerror(result)));
  }

  std::vector<std::string> addresses;
  for (const addrinfo* current = info; current != nullptr;
       current = current->ai_next) {
    char buffer[INET6_ADDRSTRLEN];
    const void* address = nullptr;
    if (current->ai_family == AF_INET) {
      address = &reinterpret_cast<const sockaddr_in*>(current->ai_addr)
                     ->sin_addr;
    } else if (current->ai_family == AF_INET6) {
      address = &reinterpret_cast<const sockaddr_in6*>(current->ai_addr)
                     ->sin6_addr;
    } else {
      continue;
    }
    if (inet_ntop(current->ai_family, address, buffer, sizeof(buffer)) ==
        nullptr) {
      continue;
    }
    std::string text(buffer);
    if (std::find(addresses.begin(), addresses.end(), text) ==
        addresses.end()) {
      addresses.push_back(std::move(text));
    }
  }
  freeaddrinfo(info);
  return addresses;
}

absl::StatusOr<std::string> ToNativeTarget(
    const std::vector<EndpointGroup>& groups, const HostLookup& lookup) {
  std::vector<Endpoint> endpoints;
  for (const EndpointGroup& group : groups) {
    endpoints.insert(endpoints.end(), group.endpoints().begin(),
                     group.endpoints().end());
  }
  if (endpoints.empty()) {
    return absl::InvalidArgumentError("no endpoints to connect to");
  }

  // gRPC keeps re-resolving a single hostname by itself.
  if (endpoints.size() == 1 && !IsIpLiteral(endpoints.front().host())) {
    return absl::StrCat("dns:///", endpoints.front().ToString());
  }

  size_t ipv4_literals = 0;
  size_t ipv6_literals = 0;
  for (const Endpoint& endpoint : endpoints) {
    if (IsIpv4Literal(endpoint.host())) {
      ++ipv4_literals;
    } else if (IsIpv6Literal(endpoint.host())) {
      ++ipv6_literals;
    }
  }
  const bool prefer_ipv6 = ipv6_literals > 0 && ipv4_literals == 0;

  std::vector<Endpoint> addresses;
  addresses.reserve(endpoints.size());
  for (const Endpoint& endpoint : endpoints) {
    if (IsIpLiteral(endpoint.host())) {
      addresses.push_back(endpoint);
      continue;
    }
    absl::StatusOr<std::vector<std::string>> found = lookup(endpoint.host());
    if (!found.ok()) {
      return AnnotateError(found.status(),
                           absl::StrCat("for endpoint ", endpoint.ToString()));
    }
    CLIENTBOOT_ASSIGN_OR_RETURN(
        std::string address, PickAddress(endpoint.host(), *found, prefer_ipv6));
    LOG(INFO) << "Resolved " << endpoint << " to " << address;
    addresses.emplace_back(std::move(address), endpoint.port());
  }

  size_t ipv4 = 0;
  for (const Endpoint& address : addresses) {
    if (IsIpv4Literal(address.host())) ++ipv4;
  }
  const std::string joined =
      absl::StrJoin(addresses, ",", [](std::string* out, const Endpoint& e) {
        absl::StrAppend(out, e.ToString());
      });
  if (ipv4 == addresses.size()) {
    return absl::StrCat("ipv4:", joined);
  }
  if (ipv4 == 0) {
    return absl::StrCat("ipv6:", joined);
  }
  return absl::UnimplementedError(absl::StrCat(
      "cannot mix IPv4 and IPv6 endpoints in one channel: ", joined));
}

}  // namespace clientboot
