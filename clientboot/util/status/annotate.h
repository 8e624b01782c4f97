// Copyright 2023 Intrinsic Innovation LLC

#ifndef CLIENTBOOT_UTIL_STATUS_ANNOTATE_H_
#define CLIENTBOOT_UTIL_STATUS_ANNOTATE_H_

#include "absl/status/status.h"
#include "absl/strings/string_view.h"

namespace clientboot {

// Appends message to the current message in status. Does nothing if the status
// is OK. Payloads are carried over to the returned status.
//
// Example:
//   status.message() = "error1."
//   message = "error2."
//   resulting status.message() = "error1.; error2."
absl::Status AnnotateError(const absl::Status& status,
                           absl::string_view message);

}  // namespace clientboot

#endif  // CLIENTBOOT_UTIL_STATUS_ANNOTATE_H_
