// Copyright 2023 Intrinsic Innovation LLC

#ifndef CLIENTBOOT_NAMERESOLVER_ADDRESS_PARSER_H_
#define CLIENTBOOT_NAMERESOLVER_ADDRESS_PARSER_H_

#include <vector>

#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "clientboot/nameresolver/endpoint.h"
#include "clientboot/nameresolver/name_resolver.h"

namespace clientboot {

// Parses a comma separated list of `host[:port]` entries, e.g.
// "10.0.0.1:8080,[::1]:8081,backend.local", into endpoints in input order.
// IPv6 literals must be bracketed. Entries without a port get
// `args.DefaultPortOrFallback()`. Whitespace is not trimmed.
//
// Returns an InvalidArgumentError for the whole authority if it is empty or if
// any entry is malformed.
absl::StatusOr<std::vector<Endpoint>> ParseStaticAuthority(
    absl::string_view authority, const NameResolverArgs& args);

}  // namespace clientboot

#endif  // CLIENTBOOT_NAMERESOLVER_ADDRESS_PARSER_H_
