// Copyright 2023 Intrinsic Innovation LLC

#include "clientboot/nameresolver/address_parser.h"

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/ascii.h"
#include "absl/strings/numbers.h"
#include "absl/strings/str_format.h"
#include "absl/strings/str_split.h"
#include "absl/strings/string_view.h"
#include "clientboot/nameresolver/endpoint.h"
#include "clientboot/nameresolver/name_resolver.h"
#include "clientboot/util/status/status_macros.h"

namespace clientboot {

namespace {

constexpr int kMinPort = 1;
constexpr int kMaxPort = 65535;

bool IsValidHostname(absl::string_view host) {
  for (char c : host) {
    if (!absl::ascii_isalnum(c) && c != '-' && c != '.' && c != '_') {
      return false;
    }
  }
  return !host.empty();
}

absl::StatusOr<int> ParsePort(absl::string_view token, absl::string_view port,
                              const NameResolverArgs& args) {
  if (port.empty()) {
    int fallback = args.DefaultPortOrFallback();
    if (fallback < kMinPort || fallback > kMaxPort) {
      return absl::InvalidArgumentError(
          absl::StrFormat("default port %d is out of range", fallback));
    }
    return fallback;
  }
  for (char c : port) {
    if (!absl::ascii_isdigit(c)) {
      return absl::InvalidArgumentError(
          absl::StrFormat("port of \"%s\" is not a number", token));
    }
  }
  int value;
  if (!absl::SimpleAtoi(port, &value) || value < kMinPort ||
      value > kMaxPort) {
    return absl::InvalidArgumentError(absl::StrFormat(
        "port of \"%s\" must be in [%d, %d]", token, kMinPort, kMaxPort));
  }
  return value;
}

absl::StatusOr<Endpoint> ParseHostPort(absl::string_view token,
                                       const NameResolverArgs& args) {
  if (token.empty()) {
    return absl::InvalidArgumentError("empty host entry");
  }

  absl::string_view host;
  absl::string_view port;
  if (token.front() == '[') {
    size_t close = token.find(']');
    if (close == absl::string_view::npos) {
      return absl::InvalidArgumentError(
          absl::StrFormat("missing ']' in \"%s\"", token));
    }
    host = token.substr(1, close - 1);
    absl::string_view after = token.substr(close + 1);
    if (!after.empty()) {
      if (after.front() != ':') {
        return absl::InvalidArgumentError(absl::StrFormat(
            "unexpected characters after ']' in \"%s\"", token));
      }
      port = after.substr(1);
    }
    if (!IsIpv6Literal(host)) {
      return absl::InvalidArgumentError(
          absl::StrFormat("\"%s\" is not a valid IPv6 address", host));
    }
  } else {
    std::vector<absl::string_view> parts = absl::StrSplit(token, ':');
    if (parts.size() > 2) {
      return absl::InvalidArgumentError(absl::StrFormat(
          "IPv6 addresses must be enclosed in brackets: \"%s\"", token));
    }
    host = parts[0];
    if (parts.size() == 2) port = parts[1];
    if (!IsValidHostname(host)) {
      return absl::InvalidArgumentError(
          absl::StrFormat("invalid host in \"%s\"", token));
    }
  }

  CLIENTBOOT_ASSIGN_OR_RETURN(int port_number, ParsePort(token, port, args));
  return Endpoint(std::string(host), port_number);
}

}  // namespace

absl::StatusOr<std::vector<Endpoint>> ParseStaticAuthority(
    absl::string_view authority, const NameResolverArgs& args) {
  if (authority.empty()) {
    return absl::InvalidArgumentError(
        "static target must have at least one endpoint, but the authority is "
        "empty");
  }

  std::vector<Endpoint> endpoints;
  for (absl::string_view token : absl::StrSplit(authority, ',')) {
    absl::StatusOr<Endpoint> endpoint = ParseHostPort(token, args);
    if (!endpoint.ok()) {
      return absl::InvalidArgumentError(
          absl::StrFormat("invalid static target \"%s\": %s", authority,
                          endpoint.status().message()));
    }
    endpoints.push_back(*std::move(endpoint));
  }
  return endpoints;
}

}  // namespace clientboot
