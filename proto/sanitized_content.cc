#include "proto/sanitized_content.h"

#include <optional>
#include <string_view>

#include "absl/container/flat_hash_map.h"
#include "google/protobuf/descriptor.h"

namespace protosym {
namespace proto {

namespace {

using ::google::protobuf::FieldDescriptor;

auto const* const kSafeProtoTypes = new absl::flat_hash_map<std::string_view, SanitizedContentKind>{
    {"webutil.html.types.SafeHtmlProto", SanitizedContentKind::kHtml},
    {"webutil.html.types.SafeScriptProto", SanitizedContentKind::kJs},
    {"webutil.html.types.SafeStyleProto", SanitizedContentKind::kCss},
    {"webutil.html.types.SafeStyleSheetProto", SanitizedContentKind::kCss},
    {"webutil.html.types.SafeUrlProto", SanitizedContentKind::kUri},
    {"webutil.html.types.TrustedResourceUrlProto", SanitizedContentKind::kTrustedResourceUri},
};

}  // namespace

std::string_view SanitizedContentKindName(SanitizedContentKind const kind) {
  switch (kind) {
    case SanitizedContentKind::kHtml:
      return "html";
    case SanitizedContentKind::kJs:
      return "js";
    case SanitizedContentKind::kCss:
      return "css";
    case SanitizedContentKind::kUri:
      return "uri";
    case SanitizedContentKind::kTrustedResourceUri:
      return "trusted_resource_uri";
  }
  return "unknown";
}

std::optional<SanitizedContentKind> GetSanitizedContentKind(FieldDescriptor const& field) {
  if (field.type() != FieldDescriptor::TYPE_MESSAGE) {
    return std::nullopt;
  }
  auto const it = kSafeProtoTypes->find(field.message_type()->full_name());
  if (it != kSafeProtoTypes->end()) {
    return it->second;
  } else {
    return std::nullopt;
  }
}

}  // namespace proto
}  // namespace protosym
