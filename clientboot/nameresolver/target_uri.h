// Copyright 2023 Intrinsic Innovation LLC

#ifndef CLIENTBOOT_NAMERESOLVER_TARGET_URI_H_
#define CLIENTBOOT_NAMERESOLVER_TARGET_URI_H_

#include <ostream>
#include <string>

#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"

namespace clientboot {

// A channel target split into its scheme, authority and path, e.g.
//
//   "static://10.0.0.1:80,10.0.0.2:80"  -> {"static", "10.0.0.1:80,...", ""}
//   "dns:///service.local:443"          -> {"dns", "", "/service.local:443"}
//   "ipv4:127.0.0.1:50051"              -> {"ipv4", "", "127.0.0.1:50051"}
//   "service.local:443"                 -> {"", "", "service.local:443"}
//   "a.local:80,b.local:80"             -> {"", "", "a.local:80,b.local:80"}
//
// Query and fragment components are not supported and stay part of the path.
class TargetUri {
 public:
  // Parses `target`. A target without a valid scheme prefix is returned as a
  // scheme-less URI whose path is the whole target. Returns an
  // InvalidArgumentError for an empty target.
  static absl::StatusOr<TargetUri> Parse(absl::string_view target);

  // Returns "<scheme>:///<target>", the form a scheme-less target takes once
  // a default scheme is applied.
  static std::string WithDefaultScheme(absl::string_view scheme,
                                       absl::string_view target);

  bool HasScheme() const { return !scheme_.empty(); }
  const std::string& scheme() const { return scheme_; }
  bool HasAuthority() const { return has_authority_; }
  const std::string& authority() const { return authority_; }
  const std::string& path() const { return path_; }

  // Returns the target string this URI was parsed from.
  std::string ToString() const;

  friend std::ostream& operator<<(std::ostream& os, const TargetUri& uri) {
    return os << uri.ToString();
  }

 private:
  TargetUri() = default;

  std::string scheme_;
  bool has_authority_ = false;
  std::string authority_;
  std::string path_;
};

}  // namespace clientboot

#endif  // CLIENTBOOT_NAMERESOLVER_TARGET_URI_H_
