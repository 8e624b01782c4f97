// Copyright 2023 Intrinsic Innovation LLC

#include "clientboot/util/status/status_macros.h"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <memory>
#include <string>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/cord.h"
#include "clientboot/util/status/annotate.h"

namespace clientboot {
namespace {

using ::testing::HasSubstr;

absl::Status ReturnIfError(const absl::Status& status, int* reached) {
  CLIENTBOOT_RETURN_IF_ERROR(status);
  ++*reached;
  return absl::OkStatus();
}

absl::StatusOr<int> Twice(absl::StatusOr<int> value) {
  CLIENTBOOT_ASSIGN_OR_RETURN(int v, value);
  return 2 * v;
}

absl::StatusOr<std::unique_ptr<int>> MakeBoxed(int v) {
  return std::make_unique<int>(v);
}

absl::StatusOr<int> Unbox(int v) {
  CLIENTBOOT_ASSIGN_OR_RETURN(std::unique_ptr<int> boxed, MakeBoxed(v));
  return *boxed;
}

TEST(ReturnIfError, ProceedsOnOk) {
  int reached = 0;
  EXPECT_TRUE(ReturnIfError(absl::OkStatus(), &reached).ok());
  EXPECT_EQ(reached, 1);
}

TEST(ReturnIfError, ReturnsError) {
  int reached = 0;
  absl::Status status = ReturnIfError(absl::NotFoundError("gone"), &reached);
  EXPECT_EQ(status.code(), absl::StatusCode::kNotFound);
  EXPECT_EQ(status.message(), "gone");
  EXPECT_EQ(reached, 0);
}

TEST(AssignOrReturn, AssignsValue) {
  absl::StatusOr<int> result = Twice(21);
  ASSERT_TRUE(result.ok());
  EXPECT_EQ(*result, 42);
}

TEST(AssignOrReturn, ReturnsError) {
  absl::StatusOr<int> result = Twice(absl::InvalidArgumentError("bad"));
  EXPECT_EQ(result.status().code(), absl::StatusCode::kInvalidArgument);
}

TEST(AssignOrReturn, MovesOnlyTypes) {
  absl::StatusOr<int> result = Unbox(7);
  ASSERT_TRUE(result.ok());
  EXPECT_EQ(*result, 7);
}

TEST(AnnotateError, AddsMessage) {
  absl::Status original_status = absl::InvalidArgumentError("Foo");
  absl::Status annotated_status = AnnotateError(original_status, "Bar");

  EXPECT_EQ(annotated_status.message(), "Foo; Bar");
  EXPECT_EQ(annotated_status.code(), original_status.code());
}

TEST(AnnotateError, IgnoresOnOkStatus) {
  absl::Status annotated_status = AnnotateError(absl::OkStatus(), "Bar");

  EXPECT_TRUE(annotated_status.ok());
  EXPECT_EQ(annotated_status.message(), "");
}

TEST(AnnotateError, CopiesPayload) {
  absl::Status original_status = absl::UnavailableError("down");
  original_status.SetPayload("type.example/clientboot", absl::Cord("payload"));
  absl::Status annotated_status =
      AnnotateError(original_status, "while creating channel");

  EXPECT_THAT(std::string(annotated_status.message()),
              HasSubstr("while creating channel"));
  auto payload = annotated_status.GetPayload("type.example/clientboot");
  ASSERT_TRUE(payload.has_value());
  EXPECT_EQ(std::string(*payload), "payload");
}

}  // namespace
}  // namespace clientboot
