// Copyright 2023 Intrinsic Innovation LLC

#include "clientboot/nameresolver/target_uri.h"

#include <cstddef>
#include <string>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/ascii.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "absl/strings/strip.h"

namespace clientboot {

namespace {

// scheme = ALPHA *( ALPHA / DIGIT / "+" / "-" / "." )
bool IsValidScheme(absl::string_view scheme) {
  if (scheme.empty() || !absl::ascii_isalpha(scheme.front())) return false;
  for (char c : scheme) {
    if (!absl::ascii_isalnum(c) && c != '+' && c != '-' && c != '.') {
      return false;
    }
  }
  return true;
}

bool IsAllDigits(absl::string_view s) {
  if (s.empty()) return false;
  for (char c : s) {
    if (!absl::ascii_isdigit(c)) return false;
  }
  return true;
}

}  // namespace

// static
absl::StatusOr<TargetUri> TargetUri::Parse(absl::string_view target) {
  if (target.empty()) {
    return absl::InvalidArgumentError("target must not be empty");
  }

  TargetUri uri;
  absl::string_view rest = target;
  if (size_t colon = target.find(':'); colon != absl::string_view::npos) {
    absl::string_view scheme = target.substr(0, colon);
    absl::string_view remainder = target.substr(colon + 1);
    // "host:1234" and "host1:80,host2:80" are hosts and ports, not URIs with
    // scheme "host".
    absl::string_view first_port = remainder.substr(0, remainder.find(','));
    if (IsValidScheme(scheme) && !IsAllDigits(first_port)) {
      uri.scheme_ = std::string(scheme);
      rest = remainder;
    }
  }

  if (uri.HasScheme() && absl::ConsumePrefix(&rest, "//")) {
    uri.has_authority_ = true;
    size_t path_start = rest.find('/');
    uri.authority_ = std::string(rest.substr(0, path_start));
    rest = path_start == absl::string_view::npos ? absl::string_view()
                                                 : rest.substr(path_start);
  }
  uri.path_ = std::string(rest);
  return uri;
}

// static
std::string TargetUri::WithDefaultScheme(absl::string_view scheme,
                                         absl::string_view target) {
  return absl::StrCat(scheme, ":///", target);
}

std::string TargetUri::ToString() const {
  std::string out;
  if (HasScheme()) absl::StrAppend(&out, scheme_, ":");
  if (has_authority_) absl::StrAppend(&out, "//", authority_);
  absl::StrAppend(&out, path_);
  return out;
}

}  // namespace clientboot
