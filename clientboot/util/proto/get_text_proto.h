// Copyright 2023 Intrinsic Innovation LLC

#ifndef CLIENTBOOT_UTIL_PROTO_GET_TEXT_PROTO_H_
#define CLIENTBOOT_UTIL_PROTO_GET_TEXT_PROTO_H_

#include <type_traits>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "clientboot/util/status/status_macros.h"
#include "google/protobuf/message.h"

namespace clientboot {

// Loads a text proto file and parses it into proto.
//
// Returns a NotFoundError if the file cannot be read.  Returns an
// InvalidArgumentError if parsing fails. Errors during parsing are reported in
// the returned status.  Warnings during parsing are logged.
absl::Status GetTextProto(absl::string_view filename,
                          google::protobuf::Message& proto);

// Parses `text` in protobuf text format into proto. Errors are reported the
// same way as for GetTextProto(), using `source_name` to label them.
absl::Status ParseTextProto(absl::string_view text,
                            google::protobuf::Message& proto,
                            absl::string_view source_name = "<text>");

template <typename T>
absl::StatusOr<T> GetTextProto(absl::string_view filename) {
  static_assert(std::is_base_of<google::protobuf::Message, T>::value,
                "GetTextProto() template parameter T must be a "
                "google::protobuf::Message.");
  T proto;
  CLIENTBOOT_RETURN_IF_ERROR(GetTextProto(filename, proto));
  return proto;
}

}  // namespace clientboot

#endif  // CLIENTBOOT_UTIL_PROTO_GET_TEXT_PROTO_H_
