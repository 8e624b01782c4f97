// Copyright 2023 Intrinsic Innovation LLC

#ifndef CLIENTBOOT_NAMERESOLVER_NAME_RESOLVER_REGISTRY_H_
#define CLIENTBOOT_NAMERESOLVER_NAME_RESOLVER_REGISTRY_H_

#include <memory>
#include <string>
#include <vector>

#include "absl/base/thread_annotations.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "absl/synchronization/mutex.h"
#include "clientboot/nameresolver/name_resolver.h"
#include "clientboot/nameresolver/name_resolver_provider.h"

namespace clientboot {

// Scheme reported by a registry without available providers. Such targets are
// left to gRPC's own DNS resolver.
inline constexpr absl::string_view kFallbackScheme = "dns";

// An ordered collection of NameResolverProviders.
//
// Providers are kept in descending priority order; providers with equal
// priority keep their registration order. Providers that are not available are
// never asked. All methods are thread-safe.
class NameResolverRegistry {
 public:
  NameResolverRegistry() = default;

  NameResolverRegistry(const NameResolverRegistry&) = delete;
  NameResolverRegistry& operator=(const NameResolverRegistry&) = delete;

  // Returns the process-wide registry. It is created on first use with the
  // built-in providers (currently the "static" scheme) registered.
  static NameResolverRegistry& Default();

  void Register(std::unique_ptr<NameResolverProvider> provider)
      ABSL_LOCKS_EXCLUDED(mutex_);

  // Returns the available providers in the order they are asked.
  std::vector<const NameResolverProvider*> Providers() const
      ABSL_LOCKS_EXCLUDED(mutex_);

  // Returns the scheme of the highest priority available provider, or
  // kFallbackScheme if there is none.
  std::string DefaultScheme() const ABSL_LOCKS_EXCLUDED(mutex_);

  // Asks each available provider in order for a resolver for `target`.
  //
  // Returns the first resolver created. Returns nullptr if no provider
  // handles the target. If a provider handles the target but fails, its error
  // is returned and no further provider is asked.
  absl::StatusOr<std::unique_ptr<NameResolver>> NewNameResolver(
      absl::string_view target, const NameResolverArgs& args) const
      ABSL_LOCKS_EXCLUDED(mutex_);

 private:
  mutable absl::Mutex mutex_;
  // Sorted by descending priority.
  std::vector<std::unique_ptr<NameResolverProvider>> providers_
      ABSL_GUARDED_BY(mutex_);
};

// Adds `provider` to NameResolverRegistry::Default().
//
// Typical usage, at namespace scope in the file defining the provider:
// ```
//   static const int kRegistered = clientboot::RegisterNameResolverProvider(
//       std::make_unique<MyProvider>());
// ```
int RegisterNameResolverProvider(
    std::unique_ptr<NameResolverProvider> provider);

}  // namespace clientboot

#endif  // CLIENTBOOT_NAMERESOLVER_NAME_RESOLVER_REGISTRY_H_
