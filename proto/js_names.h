#ifndef __PROTOSYM_PROTO_JS_NAMES_H__
#define __PROTOSYM_PROTO_JS_NAMES_H__

#include <string>
#include <string_view>

#include "google/protobuf/descriptor.h"

// Names of proto-backed symbols in the namespaced-object runtime, where every generated type lives
// in a tree of namespace objects rooted at `proto`. For example the message `Inner` nested in
// `Outer` in package `foo.bar` is `proto.foo.bar.Outer.Inner`.

namespace protosym {
namespace proto {

// The root of all generated namespaces.
inline std::string_view constexpr kJsRootNamespace = "proto";

// Returns the namespace of the given file, i.e. `proto.<package>`, or just `proto` if the file has
// no package.
std::string GetJsPackage(google::protobuf::FileDescriptor const& file);

// Returns the fully qualified name of a message in the namespaced-object runtime. The name includes
// the containing types but the proto package only appears once, as part of the file namespace.
//
// REQUIRES: the full name of the message must start with the package of its file. Violations are
// fatal.
std::string CalculateQualifiedJsName(google::protobuf::Descriptor const& descriptor);

// Same as above, for enums.
std::string CalculateQualifiedJsName(google::protobuf::EnumDescriptor const& descriptor);

inline std::string CalculateJsEnumName(google::protobuf::EnumDescriptor const& descriptor) {
  return CalculateQualifiedJsName(descriptor);
}

// Returns the accessor name of a field (regular or extension): the field name in `lowerCamel`
// case, with a `List` suffix for repeated fields.
std::string ComputeJsFieldName(google::protobuf::FieldDescriptor const& field);

// Returns the symbol that must be required in order to use the given extension: the outermost
// message enclosing the extension declaration, or the extension itself for top-level extensions.
//
// REQUIRES: `field.is_extension()`.
std::string GetJsExtensionImport(google::protobuf::FieldDescriptor const& field);

// Returns the name of the given extension as passed to `getExtension()`. Unlike
// `GetJsExtensionImport` this is qualified by the immediate scope of the extension.
//
// REQUIRES: `field.is_extension()`.
std::string GetJsExtensionName(google::protobuf::FieldDescriptor const& field);

namespace internal {

// Strips the proto package from the fully qualified name of a type, returning the rest including
// the leading dot. Returns `full_name` unchanged if `package` is empty.
//
// REQUIRES: `full_name` must start with `package` followed by a dot. Violations are fatal.
std::string_view StripProtoPackage(std::string_view package, std::string_view full_name);

}  // namespace internal

}  // namespace proto
}  // namespace protosym

#endif  // __PROTOSYM_PROTO_JS_NAMES_H__
