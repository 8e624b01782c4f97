// Copyright 2023 Intrinsic Innovation LLC

#ifndef CLIENTBOOT_UTIL_STATUS_STATUS_MACROS_H_
#define CLIENTBOOT_UTIL_STATUS_STATUS_MACROS_H_

#include <utility>

#include "absl/base/optimization.h"
#include "absl/status/status.h"

// Early-returns the status if it is in error; otherwise, proceeds.
//
// The argument expression is guaranteed to be evaluated exactly once.
#define CLIENTBOOT_RETURN_IF_ERROR(__status)             \
  do {                                                   \
    auto __clientboot_status = (__status);               \
    if (ABSL_PREDICT_FALSE(!__clientboot_status.ok())) { \
      return __clientboot_status;                        \
    }                                                    \
  } while (false)

// Identifier concatenation helper macros.
#define CLIENTBOOT_MACRO_CONCAT_INNER(__x, __y) __x##__y
#define CLIENTBOOT_MACRO_CONCAT(__x, __y) \
  CLIENTBOOT_MACRO_CONCAT_INNER(__x, __y)

// Implementation of CLIENTBOOT_ASSIGN_OR_RETURN that uses a unique temporary
// identifier for avoiding collision in the enclosing scope.
#define CLIENTBOOT_ASSIGN_OR_RETURN_IMPL(__lhs, __rhs, __name) \
  auto __name = (__rhs);                                       \
  if (ABSL_PREDICT_FALSE(!__name.ok())) {                      \
    return std::move(__name).status();                         \
  }                                                            \
  __lhs = std::move(__name).value();

// Early-returns the status if it is in error; otherwise, assigns the
// right-hand-side expression to the left-hand-side expression.
//
// The right-hand-side expression is guaranteed to be evaluated exactly once.
//
// Example:
//   CLIENTBOOT_ASSIGN_OR_RETURN(TargetUri uri, TargetUri::Parse(target));
#define CLIENTBOOT_ASSIGN_OR_RETURN(__lhs, __rhs) \
  CLIENTBOOT_ASSIGN_OR_RETURN_IMPL(               \
      __lhs, __rhs, CLIENTBOOT_MACRO_CONCAT(__status_or_value, __COUNTER__))

#endif  // CLIENTBOOT_UTIL_STATUS_STATUS_MACROS_H_
