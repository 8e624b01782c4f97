// Copyright 2023 Intrinsic Innovation LLC

#ifndef CLIENTBOOT_NAMERESOLVER_STATIC_NAME_RESOLVER_H_
#define CLIENTBOOT_NAMERESOLVER_STATIC_NAME_RESOLVER_H_

#include <memory>
#include <string>
#include <vector>

#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "clientboot/nameresolver/endpoint.h"
#include "clientboot/nameresolver/name_resolver.h"

namespace clientboot {

// A NameResolver that always reports the same, fixed list of endpoint groups.
//
// Start() reports the groups exactly once, synchronously. Refresh() and
// Shutdown() have nothing to do. Calling Start() a second time, or Start() or
// Refresh() after Shutdown(), logs a warning and is otherwise ignored.
class StaticNameResolver : public NameResolver {
 public:
  enum class State { kCreated, kStarted, kShutdown };

  // Creates a resolver for `authority` that reports `groups`. Returns an
  // InvalidArgumentError if `groups` is empty.
  static absl::StatusOr<std::unique_ptr<StaticNameResolver>> Create(
      absl::string_view authority, std::vector<EndpointGroup> groups);

  // Parses `authority` (see ParseStaticAuthority()) and creates a resolver
  // that reports all endpoints as a single group.
  static absl::StatusOr<std::unique_ptr<StaticNameResolver>> FromAuthority(
      absl::string_view authority, const NameResolverArgs& args);

  std::string GetServiceAuthority() const override { return authority_; }

  void Start(Listener listener) override;

  void Refresh() override;

  void Shutdown() override;

  State state() const { return state_; }

  const std::vector<EndpointGroup>& groups() const { return groups_; }

 private:
  StaticNameResolver(absl::string_view authority,
                     std::vector<EndpointGroup> groups);

  const std::string authority_;
  const std::vector<EndpointGroup> groups_;
  State state_ = State::kCreated;
};

}  // namespace clientboot

#endif  // CLIENTBOOT_NAMERESOLVER_STATIC_NAME_RESOLVER_H_
