// Copyright 2023 Intrinsic Innovation LLC

#ifndef CLIENTBOOT_NAMERESOLVER_NAME_RESOLVER_H_
#define CLIENTBOOT_NAMERESOLVER_NAME_RESOLVER_H_

#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "clientboot/nameresolver/endpoint.h"

namespace clientboot {

// Port used for endpoints that specify none when the resolution parameters do
// not carry a default port either.
inline constexpr int kDefaultGrpcPort = 9090;

// Parameters that customize a single resolution.
struct NameResolverArgs {
  // Port for endpoints without an explicit port. If unset, kDefaultGrpcPort
  // is used.
  std::optional<int> default_port;

  int DefaultPortOrFallback() const {
    return default_port.value_or(kDefaultGrpcPort);
  }
};

// Free-form attributes attached to a resolution result.
using Attributes = absl::flat_hash_map<std::string, std::string>;

// Turns a target into endpoint groups and reports them to a listener.
//
// The owning channel calls Start() once, Refresh() any number of times and
// Shutdown() once, never concurrently on the same instance.
class NameResolver {
 public:
  // Receives the complete list of endpoint groups on every update.
  using Listener = std::function<void(const std::vector<EndpointGroup>& groups,
                                      const Attributes& attributes)>;

  virtual ~NameResolver() = default;

  // Returns the authority used to identify the resolved service, e.g. in
  // logs. Valid in any state.
  virtual std::string GetServiceAuthority() const = 0;

  // Starts resolution. `listener` is invoked with the resolution results, for
  // some implementations before Start() returns.
  virtual void Start(Listener listener) = 0;

  // Asks for a new resolution. Implementations whose results cannot change may
  // ignore this.
  virtual void Refresh() = 0;

  // Stops resolution. No listener calls happen afterwards.
  virtual void Shutdown() = 0;
};

}  // namespace clientboot

#endif  // CLIENTBOOT_NAMERESOLVER_NAME_RESOLVER_H_
