#ifndef __PROTOSYM_PROTO_EXTENSION_SCOPE_H__
#define __PROTOSYM_PROTO_EXTENSION_SCOPE_H__

#include <string>
#include <string_view>

#include "absl/status/statusor.h"
#include "google/protobuf/descriptor.h"

namespace protosym {
namespace proto {

// The host runtimes generated code can reference extensions from.
enum class TargetRuntime {
  // Generated extensions are static members of a holder class mirroring the *immediate* declaration
  // scope of the extension (or the outer class of the file for top-level extensions).
  kClassBased,

  // Generated extensions hang off the namespace object of the *outermost* message enclosing the
  // declaration (or off the file namespace for top-level extensions).
  kNamespacedObject,
};

// Returns "class" or "namespaced".
std::string_view TargetRuntimeName(TargetRuntime runtime);

// Inverse of `TargetRuntimeName`.
absl::StatusOr<TargetRuntime> ParseTargetRuntime(std::string_view name);

// Walks the chain of containing types up to the outermost one. Returns `descriptor` itself if it's
// a top-level message.
google::protobuf::Descriptor const& GetOutermostContainingType(
    google::protobuf::Descriptor const& descriptor);

// Returns the message the access path of the extension is rooted at in the specified runtime:
// the immediate extension scope for `kClassBased`, its outermost containing type for
// `kNamespacedObject`. Returns nullptr for top-level extensions.
//
// REQUIRES: `field.is_extension()`.
google::protobuf::Descriptor const* GetExtensionHolderScope(
    google::protobuf::FieldDescriptor const& field, TargetRuntime runtime);

// Returns the expression generated code uses to reference the extension in the specified runtime.
//
// For `kClassBased` that's the descriptor getter of the static extension member, e.g.
// `com.example.Outer.Inner.myExtension.getDescriptor()` or, for a top-level extension,
// `com.example.OuterClassname.myExtension.getDescriptor()`.
//
// For `kNamespacedObject` that's the extension member of the outermost namespace object, e.g.
// `proto.example.Outer.myExtension`, or `proto.example.myExtension` for top-level extensions.
//
// REQUIRES: `field.is_extension()`.
std::string GetExtensionAccessPath(google::protobuf::FieldDescriptor const& field,
                                   TargetRuntime runtime);

}  // namespace proto
}  // namespace protosym

#endif  // __PROTOSYM_PROTO_EXTENSION_SCOPE_H__
