// Copyright 2023 Intrinsic Innovation LLC

#include "clientboot/nameresolver/endpoint.h"

#include <arpa/inet.h>
#include <netinet/in.h>

#include <ostream>
#include <string>
#include <utility>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "absl/strings/string_view.h"

namespace clientboot {

std::string Endpoint::ToString() const {
  if (IsIpv6Literal(host_)) {
    return absl::StrCat("[", host_, "]:", port_);
  }
  return absl::StrCat(host_, ":", port_);
}

std::ostream& operator<<(std::ostream& os, const Endpoint& e) {
  return os << e.ToString();
}

// static
absl::StatusOr<EndpointGroup> EndpointGroup::Create(
    std::vector<Endpoint> endpoints) {
  if (endpoints.empty()) {
    return absl::InvalidArgumentError(
        "an endpoint group must contain at least one endpoint");
  }
  return EndpointGroup(std::move(endpoints));
}

std::ostream& operator<<(std::ostream& os, const EndpointGroup& g) {
  return os << "["
            << absl::StrJoin(g.endpoints(), ", ",
                             [](std::string* out, const Endpoint& e) {
                               absl::StrAppend(out, e.ToString());
                             })
            << "]";
}

bool IsIpv4Literal(absl::string_view host) {
  in_addr addr;
  return inet_pton(AF_INET, std::string(host).c_str(), &addr) == 1;
}

bool IsIpv6Literal(absl::string_view host) {
  in6_addr addr;
  return inet_pton(AF_INET6, std::string(host).c_str(), &addr) == 1;
}

}  // namespace clientboot
