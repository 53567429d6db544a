#ifndef __PROTOSYM_PROTO_FIELD_SEMANTICS_H__
#define __PROTOSYM_PROTO_FIELD_SEMANTICS_H__

#include <optional>

#include "google/protobuf/descriptor.h"
#include "google/protobuf/descriptor.pb.h"

namespace protosym {
namespace proto {

// Indicates whether the field holds an unsigned integer, i.e. it's one of `fixed32`, `fixed64`,
// `uint32`, and `uint64`.
bool IsUnsigned(google::protobuf::FieldDescriptor const& field);

// Indicates whether the field has a `jstype` annotation. Only 64-bit integer fields are eligible,
// the annotation is ignored on all other fields. The value of the annotation is not validated.
bool HasJsType(google::protobuf::FieldDescriptor const& field);

// Returns the value of the `jstype` annotation of the field, or an empty optional if `HasJsType`
// is false.
std::optional<google::protobuf::FieldOptions::JSType> GetJsType(
    google::protobuf::FieldDescriptor const& field);

// The namespaced-object runtime doesn't distinguish between unset fields and fields set to their
// default values, so rendering code checks for presence explicitly wherever the schema keeps track
// of it. This function indicates whether the field requires such check:
//
//   * fields with an explicit default value and repeated fields never do;
//   * in proto3 files only message fields do, as they're the only ones with presence;
//   * in proto2 files all other fields do.
//
bool ShouldCheckFieldPresenceToEmulateJspbNullability(
    google::protobuf::FieldDescriptor const& field);

}  // namespace proto
}  // namespace protosym

#endif  // __PROTOSYM_PROTO_FIELD_SEMANTICS_H__
