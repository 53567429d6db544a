#ifndef __PROTOSYM_COMMON_UTILITIES_H__
#define __PROTOSYM_COMMON_UTILITIES_H__

#include <utility>  // IWYU pragma: keep

#include "absl/status/status.h"
#include "absl/status/statusor.h"

namespace protosym {
namespace util {
namespace internal {

inline absl::Status ReturnIfError_GetStatus(absl::Status const& status) { return status; }

template <typename T>
inline absl::Status ReturnIfError_GetStatus(absl::StatusOr<T> const& status_or) {
  return status_or.status();
}

}  // namespace internal
}  // namespace util
}  // namespace protosym

// Evaluates an expression returning `absl::Status` or `absl::StatusOr` and returns the status
// prematurely if it's an error. The value wrapped in an OK `absl::StatusOr` is discarded.
//
// Example:
//
//   absl::Status Bar() {
//     RETURN_IF_ERROR(Foo());
//     RETURN_IF_ERROR(Baz());
//     return absl::OkStatus();
//   }
//
#define RETURN_IF_ERROR(expression)                                       \
  do {                                                                    \
    auto status = (expression);                                           \
    if (!status.ok()) {                                                   \
      return ::protosym::util::internal::ReturnIfError_GetStatus(status); \
    }                                                                     \
  } while (false)

// Evaluates `expression`, which must return an `absl::StatusOr`. On success the wrapped value is
// bound to a new mutable reference called `name`, otherwise the error status is returned.
//
// Example:
//
//   absl::StatusOr<Loader> Load();
//
//   absl::Status Bar() {
//     DEFINE_VAR_OR_RETURN(loader, Load());
//     Baz(std::move(loader));
//     return absl::OkStatus();
//   }
//
// NOTE: this macro also defines an intermediate variable called `status_or_##name`.
#define DEFINE_VAR_OR_RETURN(name, expression)   \
  auto status_or_##name = (expression);          \
  if (!(status_or_##name).ok()) {                \
    return std::move(status_or_##name).status(); \
  }                                              \
  auto& name = status_or_##name.value();

// Like `DEFINE_VAR_OR_RETURN` but the resulting variable is const.
#define DEFINE_CONST_OR_RETURN(name, expression) \
  auto status_or_##name = (expression);          \
  if (!(status_or_##name).ok()) {                \
    return std::move(status_or_##name).status(); \
  }                                              \
  auto const& name = status_or_##name.value();

#endif  // __PROTOSYM_COMMON_UTILITIES_H__
