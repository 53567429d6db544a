#ifndef __PROTOSYM_PROTO_SYMBOL_TABLE_H__
#define __PROTOSYM_PROTO_SYMBOL_TABLE_H__

#include <string>
#include <vector>

#include "absl/status/statusor.h"
#include "absl/types/span.h"
#include "google/protobuf/descriptor.h"
#include "proto/descriptor_loader.h"
#include "proto/extension_scope.h"
#include "proto/symbols.pb.h"

namespace protosym {
namespace proto {

struct SymbolTableOptions {
  // The runtimes to compute extension access paths for.
  std::vector<TargetRuntime> runtimes{TargetRuntime::kClassBased, TargetRuntime::kNamespacedObject};
};

// Resolves the names and flags of all the types, fields, and extensions declared in `file`.
// Types are listed depth-first in declaration order, fields in the order of their types, and
// extensions in the order of their scopes (top-level extensions first).
FileSymbols BuildFileSymbols(google::protobuf::FileDescriptor const& file,
                             SymbolTableOptions const& options);

// Builds the symbols of the named files, or of all files of the loader if `file_names` is empty.
// Fails with `NotFound` if any of the names doesn't refer to a file of the loader.
absl::StatusOr<SymbolReport> BuildSymbolReport(DescriptorLoader const& loader,
                                               absl::Span<std::string const> file_names,
                                               SymbolTableOptions const& options);

}  // namespace proto
}  // namespace protosym

#endif  // __PROTOSYM_PROTO_SYMBOL_TABLE_H__
