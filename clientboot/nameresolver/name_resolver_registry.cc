// Copyright 2023 Intrinsic Innovation LLC

#include "clientboot/nameresolver/name_resolver_registry.h"

#include <algorithm>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "absl/log/log.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "absl/synchronization/mutex.h"
#include "clientboot/nameresolver/name_resolver.h"
#include "clientboot/nameresolver/name_resolver_provider.h"
#include "clientboot/nameresolver/static_name_resolver_provider.h"
#include "clientboot/nameresolver/target_uri.h"
#include "clientboot/util/status/annotate.h"
#include "clientboot/util/status/status_macros.h"

namespace clientboot {

// static
NameResolverRegistry& NameResolverRegistry::Default() {
  static NameResolverRegistry* registry = [] {
    auto* registry = new NameResolverRegistry;
    registry->Register(std::make_unique<StaticNameResolverProvider>());
    return registry;
  }();
  return *registry;
}

void NameResolverRegistry::Register(
    std::unique_ptr<NameResolverProvider> provider) {
  if (provider == nullptr) {
    LOG(ERROR) << "Ignoring registration of a null name resolver provider";
    return;
  }
  absl::MutexLock l(&mutex_);
  const int priority = provider->Priority();
  auto position = std::find_if(
      providers_.begin(), providers_.end(),
      [priority](const std::unique_ptr<NameResolverProvider>& p) {
        return p->Priority() < priority;
      });
  LOG(INFO) << "Registering name resolver provider for scheme \""
            << provider->DefaultScheme() << "\" with priority " << priority;
  providers_.insert(position, std::move(provider));
}

std::vector<const NameResolverProvider*> NameResolverRegistry::Providers()
    const {
  absl::MutexLock l(&mutex_);
  std::vector<const NameResolverProvider*> providers;
  providers.reserve(providers_.size());
  for (const auto& provider : providers_) {
    if (provider->IsAvailable()) {
      providers.push_back(provider.get());
    }
  }
  return providers;
}

std::string NameResolverRegistry::DefaultScheme() const {
  std::vector<const NameResolverProvider*> providers = Providers();
  if (providers.empty()) {
    return std::string(kFallbackScheme);
  }
  return std::string(providers.front()->DefaultScheme());
}

absl::StatusOr<std::unique_ptr<NameResolver>>
NameResolverRegistry::NewNameResolver(absl::string_view target,
                                      const NameResolverArgs& args) const {
  CLIENTBOOT_ASSIGN_OR_RETURN(TargetUri uri, TargetUri::Parse(target));
  // Providers are never removed, so the pointers stay valid without the lock.
  for (const NameResolverProvider* provider : Providers()) {
    absl::StatusOr<std::unique_ptr<NameResolver>> resolver =
        provider->NewNameResolver(uri, args);
    if (!resolver.ok()) {
      return AnnotateError(
          resolver.status(),
          absl::StrCat("while resolving \"", target, "\" with the \"",
                       provider->DefaultScheme(), "\" provider"));
    }
    if (*resolver != nullptr) {
      return resolver;
    }
  }
  return nullptr;
}

int RegisterNameResolverProvider(
    std::unique_ptr<NameResolverProvider> provider) {
  NameResolverRegistry::Default().Register(std::move(provider));
  return 0;
}

}  // namespace clientboot
