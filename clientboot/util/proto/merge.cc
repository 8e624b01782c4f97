// Copyright 2023 Intrinsic Innovation LLC

#include "clientboot/util/proto/merge.h"

#include <memory>
#include <vector>

#include "absl/status/status.h"
#include "absl/strings/str_cat.h"
#include "google/protobuf/descriptor.h"
#include "google/protobuf/message.h"

namespace clientboot {

namespace {

bool IsSet(const google::protobuf::Message& message,
           const google::protobuf::FieldDescriptor* field) {
  const google::protobuf::Reflection* reflection = message.GetReflection();
  if (field->is_repeated()) {
    return reflection->FieldSize(message, field) > 0;
  }
  return reflection->HasField(message, field);
}

}  // namespace

absl::Status MergeUnset(const google::protobuf::Message& from,
                        google::protobuf::Message& to) {
  if (from.GetDescriptor() != to.GetDescriptor()) {
    return absl::InvalidArgumentError(
        absl::StrCat("`from` and `to` must be the same type, got ",
                     from.GetTypeName(), " and ", to.GetTypeName()));
  }

  const google::protobuf::Reflection* to_reflection = to.GetReflection();

  std::vector<const google::protobuf::FieldDescriptor*> from_fields;
  from.GetReflection()->ListFields(from, &from_fields);

  std::vector<const google::protobuf::FieldDescriptor*> fields_to_copy;
  for (const google::protobuf::FieldDescriptor* field : from_fields) {
    if (IsSet(to, field)) continue;
    // Don't overwrite a oneof of which a different member is set.
    if (const google::protobuf::OneofDescriptor* oneof =
            field->real_containing_oneof();
        oneof != nullptr && to_reflection->HasOneof(to, oneof)) {
      continue;
    }
    fields_to_copy.push_back(field);
  }
  if (fields_to_copy.empty()) {
    return absl::OkStatus();
  }

  std::unique_ptr<google::protobuf::Message> swap_space(from.New());
  swap_space->CopyFrom(from);
  to_reflection->SwapFields(swap_space.get(), &to, fields_to_copy);
  return absl::OkStatus();
}

}  // namespace clientboot
