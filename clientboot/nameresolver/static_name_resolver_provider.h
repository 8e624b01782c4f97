// Copyright 2023 Intrinsic Innovation LLC

#ifndef CLIENTBOOT_NAMERESOLVER_STATIC_NAME_RESOLVER_PROVIDER_H_
#define CLIENTBOOT_NAMERESOLVER_STATIC_NAME_RESOLVER_PROVIDER_H_

#include <memory>

#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "clientboot/nameresolver/name_resolver.h"
#include "clientboot/nameresolver/name_resolver_provider.h"
#include "clientboot/nameresolver/target_uri.h"

namespace clientboot {

inline constexpr absl::string_view kStaticScheme = "static";

// Provides StaticNameResolvers for targets of the form
// "static://host1[:port1][,host2[:port2]...]".
class StaticNameResolverProvider : public NameResolverProvider {
 public:
  static constexpr int kPriority = 5;

  // Uses the authority of `uri` as the list of endpoints. "static:///a:1" is
  // accepted as well and treated like "static://a:1".
  absl::StatusOr<std::unique_ptr<NameResolver>> NewNameResolver(
      const TargetUri& uri, const NameResolverArgs& args) const override;

  absl::string_view DefaultScheme() const override { return kStaticScheme; }

  int Priority() const override { return kPriority; }

  bool IsAvailable() const override { return true; }
};

}  // namespace clientboot

#endif  // CLIENTBOOT_NAMERESOLVER_STATIC_NAME_RESOLVER_PROVIDER_H_
