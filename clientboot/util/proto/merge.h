// Copyright 2023 Intrinsic Innovation LLC

#ifndef CLIENTBOOT_UTIL_PROTO_MERGE_H_
#define CLIENTBOOT_UTIL_PROTO_MERGE_H_

#include "absl/status/status.h"
#include "google/protobuf/message.h"

namespace clientboot {

// For any field set in `from` that isn't set in `to`, copies the field from
// `from` to `to`, except for unknown fields. Submessages are copied as a
// whole; fields inside a submessage that is already present in `to` are left
// alone.
//
// Singular fields are only considered set if
// google::protobuf::Reflection::HasField(field) would return true, and repeated
// fields will only be listed if google::protobuf::Reflection::FieldSize(field)
// would return non-zero.
absl::Status MergeUnset(const google::protobuf::Message& from,
                        google::protobuf::Message& to);

}  // namespace clientboot

#endif  // CLIENTBOOT_UTIL_PROTO_MERGE_H_
