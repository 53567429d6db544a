#include "proto/field_semantics.h"

#include <optional>

#include "google/protobuf/descriptor.h"
#include "google/protobuf/descriptor.pb.h"

namespace protosym {
namespace proto {

namespace {

using ::google::protobuf::FieldDescriptor;
using ::google::protobuf::FieldOptions;
using ::google::protobuf::FileDescriptor;

bool IsJsTypeable(FieldDescriptor const& field) {
  switch (field.type()) {
    case FieldDescriptor::TYPE_INT64:
    case FieldDescriptor::TYPE_SFIXED64:
    case FieldDescriptor::TYPE_UINT64:
    case FieldDescriptor::TYPE_FIXED64:
    case FieldDescriptor::TYPE_SINT64:
      return true;
    default:
      return false;
  }
}

}  // namespace

bool IsUnsigned(FieldDescriptor const& field) {
  switch (field.type()) {
    case FieldDescriptor::TYPE_FIXED32:
    case FieldDescriptor::TYPE_FIXED64:
    case FieldDescriptor::TYPE_UINT32:
    case FieldDescriptor::TYPE_UINT64:
      return true;
    default:
      return false;
  }
}

bool HasJsType(FieldDescriptor const& field) {
  return IsJsTypeable(field) && field.options().has_jstype();
}

std::optional<FieldOptions::JSType> GetJsType(FieldDescriptor const& field) {
  if (HasJsType(field)) {
    return field.options().jstype();
  } else {
    return std::nullopt;
  }
}

bool ShouldCheckFieldPresenceToEmulateJspbNullability(FieldDescriptor const& field) {
  if (field.has_default_value() || field.is_repeated()) {
    return false;
  }
  if (field.file()->syntax() == FileDescriptor::SYNTAX_PROTO3) {
    return field.cpp_type() == FieldDescriptor::CPPTYPE_MESSAGE;
  }
  return true;
}

}  // namespace proto
}  // namespace protosym
