#ifndef __PROTOSYM_PROTO_DESCRIPTOR_LOADER_H__
#define __PROTOSYM_PROTO_DESCRIPTOR_LOADER_H__

#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "absl/status/statusor.h"
#include "absl/types/span.h"
#include "google/protobuf/descriptor.h"
#include "google/protobuf/descriptor.pb.h"

namespace protosym {
namespace proto {

// Builds the read-only schema graph consumed by the name resolvers out of a `FileDescriptorSet`,
// e.g. one written by `protoc --descriptor_set_out --include_imports`.
//
// The loader owns the descriptor pool, so all descriptors returned by `files` and `FindFile` remain
// valid for as long as the loader itself is alive. Moving the loader doesn't invalidate them.
class DescriptorLoader {
 public:
  // Builds all the files of the set in the order they appear. Each file must come after its
  // dependencies, which is the order `protoc --include_imports` uses. Repeated identical files are
  // listed only once in `files`.
  static absl::StatusOr<DescriptorLoader> Create(
      google::protobuf::FileDescriptorSet const& file_descriptor_set);

  // Parses a serialized `FileDescriptorSet` and builds it.
  static absl::StatusOr<DescriptorLoader> Parse(std::string_view serialized);

  // Reads serialized `FileDescriptorSet`s from the files at `paths` and builds them all in the same
  // pool. Files appearing in more than one set (typically shared imports) must be identical and
  // are built only once.
  static absl::StatusOr<DescriptorLoader> ReadFiles(absl::Span<std::string const> paths);

  ~DescriptorLoader() = default;

  DescriptorLoader(DescriptorLoader&&) noexcept = default;
  DescriptorLoader& operator=(DescriptorLoader&&) noexcept = default;

  google::protobuf::DescriptorPool const& pool() const { return *pool_; }

  absl::Span<google::protobuf::FileDescriptor const* const> files() const { return files_; }

  absl::StatusOr<google::protobuf::FileDescriptor const*> FindFile(std::string_view name) const;

 private:
  explicit DescriptorLoader(std::unique_ptr<google::protobuf::DescriptorPool> pool,
                            std::vector<google::protobuf::FileDescriptor const*> files)
      : pool_(std::move(pool)), files_(std::move(files)) {}

  DescriptorLoader(DescriptorLoader const&) = delete;
  DescriptorLoader& operator=(DescriptorLoader const&) = delete;

  std::unique_ptr<google::protobuf::DescriptorPool> pool_;
  std::vector<google::protobuf::FileDescriptor const*> files_;
};

}  // namespace proto
}  // namespace protosym

#endif  // __PROTOSYM_PROTO_DESCRIPTOR_LOADER_H__
