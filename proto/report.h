#ifndef __PROTOSYM_PROTO_REPORT_H__
#define __PROTOSYM_PROTO_REPORT_H__

#include <string>
#include <string_view>

#include "absl/status/statusor.h"
#include "proto/symbols.pb.h"

namespace protosym {
namespace proto {

enum class OutputFormat {
  // Indented human-readable listing.
  kListing,

  // Protobuf text format of the `SymbolReport` message.
  kTextProto,

  // Serialized `SymbolReport` message.
  kBinary,
};

// Parses "listing", "textproto", or "binary".
absl::StatusOr<OutputFormat> ParseOutputFormat(std::string_view name);

absl::StatusOr<std::string> RenderReport(SymbolReport const& report, OutputFormat format);

}  // namespace proto
}  // namespace protosym

#endif  // __PROTOSYM_PROTO_REPORT_H__
