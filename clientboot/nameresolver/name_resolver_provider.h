// Copyright 2023 Intrinsic Innovation LLC

#ifndef CLIENTBOOT_NAMERESOLVER_NAME_RESOLVER_PROVIDER_H_
#define CLIENTBOOT_NAMERESOLVER_NAME_RESOLVER_PROVIDER_H_

#include <memory>

#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "clientboot/nameresolver/name_resolver.h"
#include "clientboot/nameresolver/target_uri.h"

namespace clientboot {

// A name resolution strategy that can be registered with a
// NameResolverRegistry.
class NameResolverProvider {
 public:
  virtual ~NameResolverProvider() = default;

  // Creates a resolver for `uri`.
  //
  // Returns nullptr if this provider does not handle `uri`, so that the
  // registry can try the next provider. Returns an error if the provider
  // handles the scheme of `uri` but the target is invalid; the registry does
  // not try other providers in that case.
  virtual absl::StatusOr<std::unique_ptr<NameResolver>> NewNameResolver(
      const TargetUri& uri, const NameResolverArgs& args) const = 0;

  // The scheme handled by this provider.
  virtual absl::string_view DefaultScheme() const = 0;

  // Priority in [0, 10]. Providers with a higher priority are asked first.
  virtual int Priority() const = 0;

  // Whether this provider can be used in the current process.
  virtual bool IsAvailable() const = 0;
};

}  // namespace clientboot

#endif  // CLIENTBOOT_NAMERESOLVER_NAME_RESOLVER_PROVIDER_H_
