#include "proto/descriptor_loader.h"

#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "absl/container/flat_hash_set.h"
#include "absl/log/log.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/types/span.h"
#include "common/file.h"
#include "common/utilities.h"
#include "google/protobuf/descriptor.h"
#include "google/protobuf/descriptor.pb.h"

namespace protosym {
namespace proto {

namespace {

using ::google::protobuf::DescriptorPool;
using ::google::protobuf::FileDescriptor;
using ::google::protobuf::FileDescriptorProto;
using ::google::protobuf::FileDescriptorSet;
using ::google::protobuf::Message;
using ::protosym::common::File;

// Keeps the first error reported by the pool while building a file. The pool usually reports a
// cascade of errors, the first one is the most meaningful.
class FirstErrorCollector final : public DescriptorPool::ErrorCollector {
 public:
  explicit FirstErrorCollector() = default;
  ~FirstErrorCollector() override = default;

  void AddError(std::string const& filename, std::string const& element_name,
                Message const* const descriptor, ErrorLocation const location,
                std::string const& message) override {
    if (!has_error_) {
      has_error_ = true;
      if (element_name.empty()) {
        message_ = message;
      } else {
        message_ = absl::StrCat(element_name, ": ", message);
      }
    }
  }

  absl::Status ToStatus(std::string_view const file_name) const {
    if (has_error_) {
      return absl::InvalidArgumentError(
          absl::StrCat("cannot build \"", file_name, "\": ", message_));
    } else {
      return absl::InvalidArgumentError(absl::StrCat("cannot build \"", file_name, "\""));
    }
  }

 private:
  FirstErrorCollector(FirstErrorCollector const&) = delete;
  FirstErrorCollector& operator=(FirstErrorCollector const&) = delete;

  bool has_error_ = false;
  std::string message_;
};

}  // namespace

absl::StatusOr<DescriptorLoader> DescriptorLoader::Create(
    FileDescriptorSet const& file_descriptor_set) {
  auto pool = std::make_unique<DescriptorPool>();
  std::vector<FileDescriptor const*> files;
  files.reserve(file_descriptor_set.file_size());
  absl::flat_hash_set<FileDescriptor const*> built;
  for (FileDescriptorProto const& file_proto : file_descriptor_set.file()) {
    VLOG(1) << "building " << file_proto.name();
    FirstErrorCollector error_collector;
    FileDescriptor const* const file =
        pool->BuildFileCollectingErrors(file_proto, &error_collector);
    if (file == nullptr) {
      return error_collector.ToStatus(file_proto.name());
    }
    // The pool returns the existing file when asked to build an identical one.
    if (built.emplace(file).second) {
      files.emplace_back(file);
    }
  }
  return DescriptorLoader(std::move(pool), std::move(files));
}

absl::StatusOr<DescriptorLoader> DescriptorLoader::Parse(std::string_view const serialized) {
  FileDescriptorSet file_descriptor_set;
  if (!file_descriptor_set.ParseFromArray(serialized.data(),
                                          static_cast<int>(serialized.size()))) {
    return absl::InvalidArgumentError("malformed FileDescriptorSet");
  }
  return Create(file_descriptor_set);
}

absl::StatusOr<DescriptorLoader> DescriptorLoader::ReadFiles(
    absl::Span<std::string const> const paths) {
  FileDescriptorSet file_descriptor_set;
  for (auto const& path : paths) {
    DEFINE_CONST_OR_RETURN(file, File::Open(path));
    DEFINE_CONST_OR_RETURN(content, file.Read());
    FileDescriptorSet partial_set;
    if (!partial_set.ParseFromString(content)) {
      return absl::InvalidArgumentError(absl::StrCat("malformed FileDescriptorSet in ", path));
    }
    file_descriptor_set.MergeFrom(partial_set);
  }
  return Create(file_descriptor_set);
}

absl::StatusOr<FileDescriptor const*> DescriptorLoader::FindFile(
    std::string_view const name) const {
  FileDescriptor const* const file = pool_->FindFileByName(std::string(name));
  if (file == nullptr) {
    return absl::NotFoundError(absl::StrCat("proto file \"", name, "\" not found"));
  }
  return file;
}

}  // namespace proto
}  // namespace protosym
