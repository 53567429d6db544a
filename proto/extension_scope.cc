#include "proto/extension_scope.h"

#include <string>
#include <string_view>

#include "absl/container/flat_hash_map.h"
#include "absl/log/check.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "google/protobuf/descriptor.h"
#include "proto/java_names.h"
#include "proto/js_names.h"

namespace protosym {
namespace proto {

namespace {

using ::google::protobuf::Descriptor;
using ::google::protobuf::FieldDescriptor;

// Describes how a runtime references extensions. The two runtimes root scoped extensions at
// different messages, so each one selects its own holder scope.
struct ExtensionConvention {
  std::string_view name;
  Descriptor const& (*select_holder_scope)(Descriptor const& extension_scope);
  std::string (*make_scoped_path)(Descriptor const& holder_scope, FieldDescriptor const& field);
  std::string (*make_top_level_path)(FieldDescriptor const& field);
};

Descriptor const& SelectImmediateScope(Descriptor const& extension_scope) {
  return extension_scope;
}

std::string MakeClassBasedScopedPath(Descriptor const& holder_scope, FieldDescriptor const& field) {
  return absl::StrCat(GetJavaQualifiedName(holder_scope), ".", GetJavaFieldName(field),
                      ".getDescriptor()");
}

std::string MakeClassBasedTopLevelPath(FieldDescriptor const& field) {
  auto const& file = *field.file();
  std::string holder_class = GetJavaPackage(file);
  if (!holder_class.empty()) {
    holder_class += '.';
  }
  absl::StrAppend(&holder_class, GetJavaOuterClassname(file));
  return absl::StrCat(holder_class, ".", GetJavaFieldName(field), ".getDescriptor()");
}

std::string MakeNamespacedObjectScopedPath(Descriptor const& holder_scope,
                                           FieldDescriptor const& field) {
  return absl::StrCat(CalculateQualifiedJsName(holder_scope), ".", ComputeJsFieldName(field));
}

std::string MakeNamespacedObjectTopLevelPath(FieldDescriptor const& field) {
  return absl::StrCat(GetJsPackage(*field.file()), ".", ComputeJsFieldName(field));
}

auto const* const kExtensionConventions =
    new absl::flat_hash_map<TargetRuntime, ExtensionConvention>{
        {TargetRuntime::kClassBased,
         {
             .name = "class",
             .select_holder_scope = &SelectImmediateScope,
             .make_scoped_path = &MakeClassBasedScopedPath,
             .make_top_level_path = &MakeClassBasedTopLevelPath,
         }},
        {TargetRuntime::kNamespacedObject,
         {
             .name = "namespaced",
             .select_holder_scope = &GetOutermostContainingType,
             .make_scoped_path = &MakeNamespacedObjectScopedPath,
             .make_top_level_path = &MakeNamespacedObjectTopLevelPath,
         }},
    };

ExtensionConvention const& GetConvention(TargetRuntime const runtime) {
  auto const it = kExtensionConventions->find(runtime);
  CHECK(it != kExtensionConventions->end())
      << "unknown target runtime " << static_cast<int>(runtime);
  return it->second;
}

}  // namespace

std::string_view TargetRuntimeName(TargetRuntime const runtime) {
  return GetConvention(runtime).name;
}

absl::StatusOr<TargetRuntime> ParseTargetRuntime(std::string_view const name) {
  for (auto const& [runtime, convention] : *kExtensionConventions) {
    if (convention.name == name) {
      return runtime;
    }
  }
  return absl::InvalidArgumentError(
      absl::StrCat("invalid target runtime \"", name, "\", expected \"class\" or \"namespaced\""));
}

Descriptor const& GetOutermostContainingType(Descriptor const& descriptor) {
  Descriptor const* scope = &descriptor;
  while (scope->containing_type() != nullptr) {
    scope = scope->containing_type();
  }
  return *scope;
}

Descriptor const* GetExtensionHolderScope(FieldDescriptor const& field,
                                          TargetRuntime const runtime) {
  CHECK(field.is_extension()) << field.full_name() << " is not an extension";
  Descriptor const* const scope = field.extension_scope();
  if (scope == nullptr) {
    return nullptr;
  }
  return &(GetConvention(runtime).select_holder_scope(*scope));
}

std::string GetExtensionAccessPath(FieldDescriptor const& field, TargetRuntime const runtime) {
  auto const& convention = GetConvention(runtime);
  Descriptor const* const holder_scope = GetExtensionHolderScope(field, runtime);
  if (holder_scope != nullptr) {
    return convention.make_scoped_path(*holder_scope, field);
  } else {
    return convention.make_top_level_path(field);
  }
}

}  // namespace proto
}  // namespace protosym
