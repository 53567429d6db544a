#include "proto/js_names.h"

#include <string>
#include <string_view>

#include "absl/log/check.h"
#include "absl/strings/match.h"
#include "absl/strings/str_cat.h"
#include "google/protobuf/descriptor.h"
#include "proto/case_format.h"
#include "proto/extension_scope.h"

namespace protosym {
namespace proto {

namespace {

using ::google::protobuf::Descriptor;
using ::google::protobuf::EnumDescriptor;
using ::google::protobuf::FieldDescriptor;
using ::google::protobuf::FileDescriptor;

std::string MakeSemiQualifiedName(FileDescriptor const& file, std::string_view const full_name) {
  std::string_view const package = file.package();
  std::string_view const name = internal::StripProtoPackage(package, full_name);
  if (package.empty()) {
    return absl::StrCat(GetJsPackage(file), ".", name);
  } else {
    return absl::StrCat(GetJsPackage(file), name);
  }
}

std::string MakeTopLevelExtensionName(FieldDescriptor const& field) {
  return absl::StrCat(GetJsPackage(*field.file()), ".", ComputeJsFieldName(field));
}

}  // namespace

namespace internal {

std::string_view StripProtoPackage(std::string_view const package,
                                   std::string_view const full_name) {
  if (package.empty()) {
    return full_name;
  }
  CHECK(absl::StartsWith(full_name, package) && full_name.size() > package.size() &&
        full_name[package.size()] == '.')
      << "Expected \"" << full_name << "\" to start with \"" << package << "\"";
  return full_name.substr(package.size());
}

}  // namespace internal

std::string GetJsPackage(FileDescriptor const& file) {
  if (file.package().empty()) {
    return std::string(kJsRootNamespace);
  } else {
    return absl::StrCat(kJsRootNamespace, ".", file.package());
  }
}

std::string CalculateQualifiedJsName(Descriptor const& descriptor) {
  return MakeSemiQualifiedName(*descriptor.file(), descriptor.full_name());
}

std::string CalculateQualifiedJsName(EnumDescriptor const& descriptor) {
  return MakeSemiQualifiedName(*descriptor.file(), descriptor.full_name());
}

std::string ComputeJsFieldName(FieldDescriptor const& field) {
  std::string name = LowerUnderscoreToLowerCamel(field.name());
  if (field.is_repeated()) {
    name += "List";
  }
  return name;
}

std::string GetJsExtensionImport(FieldDescriptor const& field) {
  CHECK(field.is_extension()) << field.full_name() << " is not an extension";
  Descriptor const* const scope = field.extension_scope();
  if (scope != nullptr) {
    return CalculateQualifiedJsName(GetOutermostContainingType(*scope));
  } else {
    return MakeTopLevelExtensionName(field);
  }
}

std::string GetJsExtensionName(FieldDescriptor const& field) {
  CHECK(field.is_extension()) << field.full_name() << " is not an extension";
  Descriptor const* const scope = field.extension_scope();
  if (scope != nullptr) {
    return absl::StrCat(CalculateQualifiedJsName(*scope), ".", ComputeJsFieldName(field));
  } else {
    return MakeTopLevelExtensionName(field);
  }
}

}  // namespace proto
}  // namespace protosym
