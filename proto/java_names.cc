#include "proto/java_names.h"

#include <string>
#include <string_view>

#include "absl/container/flat_hash_set.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/strip.h"
#include "google/protobuf/descriptor.h"
#include "google/protobuf/descriptor.pb.h"
#include "proto/case_format.h"
#include "proto/js_names.h"

namespace protosym {
namespace proto {

namespace {

using ::google::protobuf::Descriptor;
using ::google::protobuf::EnumDescriptor;
using ::google::protobuf::FieldDescriptor;
using ::google::protobuf::FileDescriptor;

// Field names clashing with members of the generated message base class or of `java.lang.Object`.
// The generated members get a trailing underscore.
auto const* const kForbiddenFieldNames = new absl::flat_hash_set<std::string_view>{
    "cached_size",
    "serialized_size",
    "class",
};

std::string_view StripProtoExtension(std::string_view const file_name) {
  std::string_view result = file_name;
  if (absl::ConsumeSuffix(&result, ".protodevel")) {
    return result;
  }
  absl::ConsumeSuffix(&result, ".proto");
  return result;
}

std::string_view GetBaseName(std::string_view const file_name) {
  auto const last_slash = file_name.find_last_of('/');
  if (last_slash == std::string_view::npos) {
    return file_name;
  } else {
    return file_name.substr(last_slash + 1);
  }
}

bool MessageHasConflictingClassName(Descriptor const& message, std::string_view const class_name) {
  if (message.name() == class_name) {
    return true;
  }
  for (int i = 0; i < message.nested_type_count(); ++i) {
    if (MessageHasConflictingClassName(*message.nested_type(i), class_name)) {
      return true;
    }
  }
  for (int i = 0; i < message.enum_type_count(); ++i) {
    if (message.enum_type(i)->name() == class_name) {
      return true;
    }
  }
  return false;
}

bool HasConflictingClassName(FileDescriptor const& file, std::string_view const class_name) {
  for (int i = 0; i < file.enum_type_count(); ++i) {
    if (file.enum_type(i)->name() == class_name) {
      return true;
    }
  }
  for (int i = 0; i < file.service_count(); ++i) {
    if (file.service(i)->name() == class_name) {
      return true;
    }
  }
  for (int i = 0; i < file.message_type_count(); ++i) {
    if (MessageHasConflictingClassName(*file.message_type(i), class_name)) {
      return true;
    }
  }
  return false;
}

// `name_without_package` is the dotted name of the type relative to the proto package, including
// its containing types.
std::string MakeJavaClassName(FileDescriptor const& file,
                              std::string_view const name_without_package) {
  std::string result = GetJavaPackage(file);
  if (!result.empty()) {
    result += '.';
  }
  if (!file.options().java_multiple_files()) {
    absl::StrAppend(&result, GetJavaOuterClassname(file), ".");
  }
  absl::StrAppend(&result, name_without_package);
  return result;
}

std::string_view GetNameWithoutPackage(FileDescriptor const& file,
                                       std::string_view const full_name) {
  std::string_view name = internal::StripProtoPackage(file.package(), full_name);
  absl::ConsumePrefix(&name, ".");
  return name;
}

}  // namespace

std::string GetJavaPackage(FileDescriptor const& file) {
  if (file.options().has_java_package()) {
    return file.options().java_package();
  } else {
    return file.package();
  }
}

std::string GetJavaOuterClassname(FileDescriptor const& file) {
  if (file.options().has_java_outer_classname()) {
    return file.options().java_outer_classname();
  }
  std::string class_name =
      UnderscoresToCamelCase(StripProtoExtension(GetBaseName(file.name())), true);
  if (HasConflictingClassName(file, class_name)) {
    class_name += "OuterClass";
  }
  return class_name;
}

std::string GetJavaQualifiedName(Descriptor const& descriptor) {
  FileDescriptor const& file = *descriptor.file();
  return MakeJavaClassName(file, GetNameWithoutPackage(file, descriptor.full_name()));
}

std::string GetJavaQualifiedName(EnumDescriptor const& descriptor) {
  FileDescriptor const& file = *descriptor.file();
  return MakeJavaClassName(file, GetNameWithoutPackage(file, descriptor.full_name()));
}

std::string GetJavaFieldName(FieldDescriptor const& field, bool const capitalize_first) {
  // Groups are named after their type because the field name is just the lowercased type name.
  std::string_view const name = field.type() == FieldDescriptor::TYPE_GROUP
                                    ? std::string_view(field.message_type()->name())
                                    : std::string_view(field.name());
  std::string result = UnderscoresToCamelCase(name, capitalize_first);
  if (kForbiddenFieldNames->contains(name)) {
    result += '_';
  }
  return result;
}

}  // namespace proto
}  // namespace protosym
