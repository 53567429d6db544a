#ifndef __PROTOSYM_COMMON_TESTING_H__
#define __PROTOSYM_COMMON_TESTING_H__

#include <string>
#include <string_view>

#include "absl/log/check.h"
#include "absl/status/status.h"           // IWYU pragma: export
#include "absl/status/status_matchers.h"  // IWYU pragma: export
#include "absl/status/statusor.h"         // IWYU pragma: export
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "google/protobuf/text_format.h"

namespace testing {

// Parses a protobuf message from its text format representation. Malformed input fails the current
// test binary immediately, so this is meant for hard-coded fixtures only.
//
// Example:
//
//   auto const file_set = ParseTextProtoOrDie<google::protobuf::FileDescriptorSet>(R"pb(
//     file { name: "lorem.proto" package: "lorem" }
//   )pb");
//
template <typename Message>
Message ParseTextProtoOrDie(std::string_view const text) {
  Message message;
  CHECK(google::protobuf::TextFormat::ParseFromString(std::string(text), &message))
      << "invalid text proto: " << text;
  return message;
}

}  // namespace testing

// Macros for testing the results of functions that return absl::Status or absl::StatusOr<T> (for
// any type T).
#define EXPECT_OK(expression) EXPECT_THAT((expression), ::absl_testing::IsOk())
#define ASSERT_OK(expression) ASSERT_THAT((expression), ::absl_testing::IsOk())

#endif  // __PROTOSYM_COMMON_TESTING_H__
