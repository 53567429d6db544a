#ifndef __PROTOSYM_PROTO_JAVA_NAMES_H__
#define __PROTOSYM_PROTO_JAVA_NAMES_H__

#include <string>

#include "google/protobuf/descriptor.h"

// Names of proto-backed symbols in the class-based runtime, where every proto file maps to a Java
// package and (unless `java_multiple_files` is set) to an outer holder class wrapping all the
// generated types of the file.

namespace protosym {
namespace proto {

// Returns the Java package of the file: the `java_package` option if set, otherwise the proto
// package.
std::string GetJavaPackage(google::protobuf::FileDescriptor const& file);

// Returns the simple name of the outer holder class of the file: the `java_outer_classname` option
// if set, otherwise derived from the file base name in `UpperCamel` case (e.g. `foo/bar_baz.proto`
// becomes `BarBaz`). A derived name that clashes with any type declared in the file gets an
// `OuterClass` suffix.
std::string GetJavaOuterClassname(google::protobuf::FileDescriptor const& file);

// Returns the fully qualified Java name of a message, including the outer holder class when
// `java_multiple_files` is not set. Nested classes are separated by dots.
std::string GetJavaQualifiedName(google::protobuf::Descriptor const& descriptor);

// Same as above, for enums.
std::string GetJavaQualifiedName(google::protobuf::EnumDescriptor const& descriptor);

// Returns the Java name of a field or extension in `lowerCamel` case (`UpperCamel` if
// `capitalize_first` is true). Group fields are named after their group type. Names clashing with
// generated members (`class`, `cached_size`, `serialized_size`) get a trailing underscore, e.g.
// `class_`.
std::string GetJavaFieldName(google::protobuf::FieldDescriptor const& field,
                             bool capitalize_first = false);

}  // namespace proto
}  // namespace protosym

#endif  // __PROTOSYM_PROTO_JAVA_NAMES_H__
