#ifndef __PROTOSYM_PROTO_TESTING_H__
#define __PROTOSYM_PROTO_TESTING_H__

#include <string_view>

#include "google/protobuf/descriptor.h"
#include "proto/descriptor_loader.h"

namespace protosym {
namespace proto {
namespace testing {

// Text format `FileDescriptorSet` with the following files:
//
//   * `foo/bar/nested.proto`: proto2, package `foo.bar`, `java_package = "com.example.foobar"`.
//     Declares `Outer`, `Outer.Inner`, `Outer.Inner.Innermost`, and `Outer.Color`, plus extensions
//     of `Outer` at every nesting level: `top_note` (top-level), `outer_note` (in `Outer`),
//     `inner_ids` (repeated, in `Outer.Inner`), and `deep_flag` (in `Outer.Inner.Innermost`).
//
//   * `color.proto`: proto3, no package. Declares the `Color` enum and the `Palette` message, so
//     the default outer class name clashes.
//
//   * `lorem/ipsum.proto`: proto2, package `lorem.ipsum`, `java_multiple_files = true`,
//     `java_outer_classname = "IpsumProtos"`. Declares `Dolor` and its top-level extension `amet`.
//
//   * `webutil/html/types/html.proto` and `page.proto`: a few safe-types protos and a proto2
//     message using them.
//
//   * `memo.proto`: proto2, no package. Declares `Memo` and `Memo.Detail` (the default outer class
//     name clashes) plus extensions of `Memo`: `note` (top-level), `memo_note` (in `Memo`), and
//     `detail_note` (in `Memo.Detail`).
//
extern std::string_view const kTestSchemas;

// Builds the files of a text format `FileDescriptorSet`. Failures are fatal.
DescriptorLoader LoadSchemasOrDie(std::string_view file_descriptor_set);

// Builds `kTestSchemas`. Failures are fatal.
DescriptorLoader LoadTestSchemasOrDie();

google::protobuf::Descriptor const& FindMessageOrDie(DescriptorLoader const& loader,
                                                     std::string_view full_name);

google::protobuf::EnumDescriptor const& FindEnumOrDie(DescriptorLoader const& loader,
                                                      std::string_view full_name);

google::protobuf::FieldDescriptor const& FindFieldOrDie(DescriptorLoader const& loader,
                                                        std::string_view full_name);

google::protobuf::FieldDescriptor const& FindExtensionOrDie(DescriptorLoader const& loader,
                                                            std::string_view full_name);

}  // namespace testing
}  // namespace proto
}  // namespace protosym

#endif  // __PROTOSYM_PROTO_TESTING_H__
