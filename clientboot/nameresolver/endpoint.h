// Copyright 2023 Intrinsic Innovation LLC

#ifndef CLIENTBOOT_NAMERESOLVER_ENDPOINT_H_
#define CLIENTBOOT_NAMERESOLVER_ENDPOINT_H_

#include <cstddef>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"

namespace clientboot {

// A network address of a single server: an IPv4 literal, an IPv6 literal
// (without brackets) or a hostname, plus a port. Hostnames are not resolved.
class Endpoint {
 public:
  Endpoint(std::string host, int port) : host_(std::move(host)), port_(port) {}

  const std::string& host() const { return host_; }
  int port() const { return port_; }

  // Returns "host:port", or "[host]:port" for IPv6 literals.
  std::string ToString() const;

  friend bool operator==(const Endpoint& lhs, const Endpoint& rhs) {
    return lhs.host_ == rhs.host_ && lhs.port_ == rhs.port_;
  }

  friend bool operator!=(const Endpoint& lhs, const Endpoint& rhs) {
    return !(lhs == rhs);
  }

  template <typename H>
  friend H AbslHashValue(H h, const Endpoint& e) {
    return H::combine(std::move(h), e.host_, e.port_);
  }

  friend std::ostream& operator<<(std::ostream& os, const Endpoint& e);

 private:
  std::string host_;
  int port_;
};

// A non-empty set of endpoints that the connection layer treats as one
// logical destination.
class EndpointGroup {
 public:
  // Returns an InvalidArgumentError if `endpoints` is empty.
  static absl::StatusOr<EndpointGroup> Create(std::vector<Endpoint> endpoints);

  const std::vector<Endpoint>& endpoints() const { return endpoints_; }
  size_t size() const { return endpoints_.size(); }

  friend bool operator==(const EndpointGroup& lhs, const EndpointGroup& rhs) {
    return lhs.endpoints_ == rhs.endpoints_;
  }

  friend bool operator!=(const EndpointGroup& lhs, const EndpointGroup& rhs) {
    return !(lhs == rhs);
  }

  friend std::ostream& operator<<(std::ostream& os, const EndpointGroup& g);

 private:
  explicit EndpointGroup(std::vector<Endpoint> endpoints)
      : endpoints_(std::move(endpoints)) {}

  std::vector<Endpoint> endpoints_;
};

// Returns true if `host` is a dotted-quad IPv4 address.
bool IsIpv4Literal(absl::string_view host);

// Returns true if `host` is an IPv6 address, without surrounding brackets.
bool IsIpv6Literal(absl::string_view host);

}  // namespace clientboot

#endif  // CLIENTBOOT_NAMERESOLVER_ENDPOINT_H_
