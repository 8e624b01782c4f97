// Copyright 2023 Intrinsic Innovation LLC

#include "clientboot/nameresolver/static_name_resolver.h"

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "absl/log/log.h"
#include "absl/memory/memory.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "clientboot/nameresolver/address_parser.h"
#include "clientboot/nameresolver/endpoint.h"
#include "clientboot/nameresolver/name_resolver.h"
#include "clientboot/util/status/status_macros.h"

namespace clientboot {

// static
absl::StatusOr<std::unique_ptr<StaticNameResolver>> StaticNameResolver::Create(
    absl::string_view authority, std::vector<EndpointGroup> groups) {
  if (groups.empty()) {
    return absl::InvalidArgumentError(
        "a static name resolver must have at least one target");
  }
  return absl::WrapUnique(new StaticNameResolver(authority, std::move(groups)));
}

// static
absl::StatusOr<std::unique_ptr<StaticNameResolver>>
StaticNameResolver::FromAuthority(absl::string_view authority,
                                  const NameResolverArgs& args) {
  CLIENTBOOT_ASSIGN_OR_RETURN(std::vector<Endpoint> endpoints,
                              ParseStaticAuthority(authority, args));
  CLIENTBOOT_ASSIGN_OR_RETURN(EndpointGroup group,
                              EndpointGroup::Create(std::move(endpoints)));
  std::vector<EndpointGroup> groups;
  groups.push_back(std::move(group));
  return Create(authority, std::move(groups));
}

StaticNameResolver::StaticNameResolver(absl::string_view authority,
                                       std::vector<EndpointGroup> groups)
    : authority_(authority), groups_(std::move(groups)) {}

void StaticNameResolver::Start(Listener listener) {
  if (state_ != State::kCreated) {
    LOG(WARNING) << "[static_resolver " << this << "] Start() called on a "
                 << (state_ == State::kStarted ? "started" : "shut down")
                 << " resolver for " << authority_ << "; ignoring";
    return;
  }
  state_ = State::kStarted;
  if (!listener) {
    LOG(ERROR) << "[static_resolver " << this << "] started without a listener";
    return;
  }
  listener(groups_, Attributes());
}

void StaticNameResolver::Refresh() {
  // The targets never change, so there is nothing to report again.
  if (state_ == State::kShutdown) {
    LOG(WARNING) << "[static_resolver " << this
                 << "] Refresh() called after Shutdown() for " << authority_;
  }
}

void StaticNameResolver::Shutdown() { state_ = State::kShutdown; }

}  // namespace clientboot
