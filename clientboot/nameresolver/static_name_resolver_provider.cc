// Copyright 2023 Intrinsic Innovation LLC

#include "clientboot/nameresolver/static_name_resolver_provider.h"

#include <memory>

#include "absl/log/log.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "absl/strings/strip.h"
#include "clientboot/nameresolver/name_resolver.h"
#include "clientboot/nameresolver/static_name_resolver.h"
#include "clientboot/nameresolver/target_uri.h"
#include "clientboot/util/status/status_macros.h"

namespace clientboot {

absl::StatusOr<std::unique_ptr<NameResolver>>
StaticNameResolverProvider::NewNameResolver(
    const TargetUri& uri, const NameResolverArgs& args) const {
  if (uri.scheme() != kStaticScheme) {
    return nullptr;
  }
  absl::string_view authority = uri.authority();
  if (authority.empty()) {
    authority = absl::StripPrefix(uri.path(), "/");
  }
  CLIENTBOOT_ASSIGN_OR_RETURN(
      std::unique_ptr<NameResolver> resolver,
      StaticNameResolver::FromAuthority(authority, args));
  LOG(INFO) << "Created static name resolver for " << authority;
  return resolver;
}

}  // namespace clientboot
