#ifndef __PROTOSYM_PROTO_SANITIZED_CONTENT_H__
#define __PROTOSYM_PROTO_SANITIZED_CONTENT_H__

#include <optional>
#include <string_view>

#include "google/protobuf/descriptor.h"

namespace protosym {
namespace proto {

// Kinds of pre-sanitized content that safe-types protos can carry. Fields holding such protos are
// rendered as trusted content of the corresponding kind rather than as plain messages.
enum class SanitizedContentKind {
  kHtml,
  kJs,
  kCss,
  kUri,
  kTrustedResourceUri,
};

std::string_view SanitizedContentKindName(SanitizedContentKind kind);

// Returns the kind of sanitized content held by the field, or an empty optional if the field is not
// a safe-types proto message (e.g. `webutil.html.types.SafeHtmlProto`).
std::optional<SanitizedContentKind> GetSanitizedContentKind(
    google::protobuf::FieldDescriptor const& field);

inline bool IsSanitizedContentField(google::protobuf::FieldDescriptor const& field) {
  return GetSanitizedContentKind(field).has_value();
}

}  // namespace proto
}  // namespace protosym

#endif  // __PROTOSYM_PROTO_SANITIZED_CONTENT_H__
