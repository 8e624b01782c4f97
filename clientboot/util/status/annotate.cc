// Copyright 2023 Intrinsic Innovation LLC

#include "clientboot/util/status/annotate.h"

#include "absl/status/status.h"
#include "absl/strings/cord.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"

namespace clientboot {

absl::Status AnnotateError(const absl::Status& status,
                           absl::string_view message) {
  if (status.ok()) {
    return status;
  }
  auto new_status = absl::Status(status.code(),
                                 absl::StrCat(status.message(), "; ", message));
  status.ForEachPayload(
      [&new_status](absl::string_view type_url, const absl::Cord& payload) {
        new_status.SetPayload(type_url, payload);
      });
  return new_status;
}

}  // namespace clientboot
