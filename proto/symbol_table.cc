#include "proto/symbol_table.h"

#include <string>
#include <utility>

#include "absl/log/log.h"
#include "absl/status/statusor.h"
#include "absl/types/span.h"
#include "common/utilities.h"
#include "google/protobuf/descriptor.h"
#include "google/protobuf/descriptor.pb.h"
#include "proto/descriptor_loader.h"
#include "proto/extension_scope.h"
#include "proto/field_semantics.h"
#include "proto/java_names.h"
#include "proto/js_names.h"
#include "proto/sanitized_content.h"
#include "proto/symbols.pb.h"

namespace protosym {
namespace proto {

namespace {

using ::google::protobuf::Descriptor;
using ::google::protobuf::EnumDescriptor;
using ::google::protobuf::FieldDescriptor;
using ::google::protobuf::FieldOptions;
using ::google::protobuf::FileDescriptor;

Syntax GetSyntax(FileDescriptor const& file) {
  switch (file.syntax()) {
    case FileDescriptor::SYNTAX_PROTO2:
      return SYNTAX_PROTO2;
    case FileDescriptor::SYNTAX_PROTO3:
      return SYNTAX_PROTO3;
    default:
      return SYNTAX_UNSPECIFIED;
  }
}

class SymbolTableBuilder {
 public:
  explicit SymbolTableBuilder(FileDescriptor const& file, SymbolTableOptions const& options)
      : file_(file), options_(options) {}

  FileSymbols Build() &&;

 private:
  SymbolTableBuilder(SymbolTableBuilder const&) = delete;
  SymbolTableBuilder& operator=(SymbolTableBuilder const&) = delete;

  void AddEnum(EnumDescriptor const& descriptor);
  void AddMessage(Descriptor const& descriptor);
  void AddExtensions(Descriptor const& descriptor);

  static void FillFieldSymbol(FieldDescriptor const& field, FieldSymbol* symbol);

  void AddExtension(FieldDescriptor const& field);

  FileDescriptor const& file_;
  SymbolTableOptions const& options_;
  FileSymbols symbols_;
};

FileSymbols SymbolTableBuilder::Build() && {
  symbols_.set_name(file_.name());
  symbols_.set_package(file_.package());
  symbols_.set_syntax(GetSyntax(file_));
  symbols_.set_js_namespace(GetJsPackage(file_));
  symbols_.set_java_package(GetJavaPackage(file_));
  symbols_.set_java_outer_classname(GetJavaOuterClassname(file_));
  for (int i = 0; i < file_.enum_type_count(); ++i) {
    AddEnum(*file_.enum_type(i));
  }
  for (int i = 0; i < file_.message_type_count(); ++i) {
    AddMessage(*file_.message_type(i));
  }
  for (int i = 0; i < file_.extension_count(); ++i) {
    AddExtension(*file_.extension(i));
  }
  for (int i = 0; i < file_.message_type_count(); ++i) {
    AddExtensions(*file_.message_type(i));
  }
  return std::move(symbols_);
}

void SymbolTableBuilder::AddEnum(EnumDescriptor const& descriptor) {
  auto* const symbol = symbols_.add_types();
  symbol->set_full_name(descriptor.full_name());
  symbol->set_kind(TypeSymbol::KIND_ENUM);
  symbol->set_js_name(CalculateJsEnumName(descriptor));
  symbol->set_java_name(GetJavaQualifiedName(descriptor));
}

void SymbolTableBuilder::AddMessage(Descriptor const& descriptor) {
  // Map entries are synthesized by the compiler and never referenced by name.
  if (descriptor.options().map_entry()) {
    return;
  }
  auto* const symbol = symbols_.add_types();
  symbol->set_full_name(descriptor.full_name());
  symbol->set_kind(TypeSymbol::KIND_MESSAGE);
  symbol->set_js_name(CalculateQualifiedJsName(descriptor));
  symbol->set_java_name(GetJavaQualifiedName(descriptor));
  for (int i = 0; i < descriptor.field_count(); ++i) {
    FillFieldSymbol(*descriptor.field(i), symbols_.add_fields());
  }
  for (int i = 0; i < descriptor.enum_type_count(); ++i) {
    AddEnum(*descriptor.enum_type(i));
  }
  for (int i = 0; i < descriptor.nested_type_count(); ++i) {
    AddMessage(*descriptor.nested_type(i));
  }
}

void SymbolTableBuilder::AddExtensions(Descriptor const& descriptor) {
  for (int i = 0; i < descriptor.extension_count(); ++i) {
    AddExtension(*descriptor.extension(i));
  }
  for (int i = 0; i < descriptor.nested_type_count(); ++i) {
    AddExtensions(*descriptor.nested_type(i));
  }
}

void SymbolTableBuilder::FillFieldSymbol(FieldDescriptor const& field, FieldSymbol* const symbol) {
  symbol->set_full_name(field.full_name());
  symbol->set_js_accessor_name(ComputeJsFieldName(field));
  symbol->set_java_field_name(GetJavaFieldName(field));
  symbol->set_is_unsigned(IsUnsigned(field));
  symbol->set_has_js_type(HasJsType(field));
  auto const maybe_js_type = GetJsType(field);
  if (maybe_js_type.has_value()) {
    symbol->set_js_type(FieldOptions::JSType_Name(maybe_js_type.value()));
  }
  symbol->set_check_presence(ShouldCheckFieldPresenceToEmulateJspbNullability(field));
  auto const maybe_kind = GetSanitizedContentKind(field);
  if (maybe_kind.has_value()) {
    symbol->set_sanitized_content_kind(std::string(SanitizedContentKindName(maybe_kind.value())));
  }
}

void SymbolTableBuilder::AddExtension(FieldDescriptor const& field) {
  auto* const symbol = symbols_.add_extensions();
  FillFieldSymbol(field, symbol->mutable_field());
  symbol->set_extendee(field.containing_type()->full_name());
  if (field.extension_scope() != nullptr) {
    symbol->set_scope(field.extension_scope()->full_name());
  }
  symbol->set_js_import(GetJsExtensionImport(field));
  symbol->set_js_extension_name(GetJsExtensionName(field));
  auto& access_paths = *symbol->mutable_access_paths();
  for (auto const runtime : options_.runtimes) {
    access_paths[std::string(TargetRuntimeName(runtime))] = GetExtensionAccessPath(field, runtime);
  }
}

}  // namespace

FileSymbols BuildFileSymbols(FileDescriptor const& file, SymbolTableOptions const& options) {
  VLOG(1) << "resolving symbols of " << file.name();
  return SymbolTableBuilder(file, options).Build();
}

absl::StatusOr<SymbolReport> BuildSymbolReport(DescriptorLoader const& loader,
                                               absl::Span<std::string const> const file_names,
                                               SymbolTableOptions const& options) {
  SymbolReport report;
  if (file_names.empty()) {
    for (auto const* const file : loader.files()) {
      *report.add_files() = BuildFileSymbols(*file, options);
    }
  } else {
    for (auto const& file_name : file_names) {
      DEFINE_CONST_OR_RETURN(file, loader.FindFile(file_name));
      *report.add_files() = BuildFileSymbols(*file, options);
    }
  }
  return std::move(report);
}

}  // namespace proto
}  // namespace protosym
