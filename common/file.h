#ifndef __PROTOSYM_COMMON_FILE_H__
#define __PROTOSYM_COMMON_FILE_H__

#include <cstdio>
#include <string>
#include <string_view>

#include "absl/status/status.h"
#include "absl/status/statusor.h"

namespace protosym {
namespace common {

// Reads `fp` until EOF.
absl::StatusOr<std::string> ReadFile(FILE* fp);

// Writes all of `content` to `fp`.
absl::Status WriteFile(FILE* fp, std::string_view content);

// Owns a `FILE*` and closes it on destruction. Close errors are only logged by the destructor, use
// `Close()` to get them.
class File {
 public:
  // Opens an existing file for reading.
  static absl::StatusOr<File> Open(std::string const& path);

  // Creates or truncates a file for writing.
  static absl::StatusOr<File> Create(std::string const& path);

  ~File() { MaybeClose(); }

  File(File const&) = delete;
  File& operator=(File const&) = delete;

  File(File&& other) noexcept : fp_(other.fp_) { other.fp_ = nullptr; }

  File& operator=(File&& other) noexcept {
    MaybeClose();
    fp_ = other.fp_;
    other.fp_ = nullptr;
    return *this;
  }

  bool is_open() const { return fp_ != nullptr; }

  absl::StatusOr<std::string> Read() const { return ReadFile(fp_); }
  absl::Status Write(std::string_view const content) { return WriteFile(fp_, content); }

  // Flushes and closes the file. The object is empty afterwards, even on error.
  absl::Status Close();

 private:
  static absl::StatusOr<File> OpenInternal(std::string const& path, char const* mode);

  explicit File(FILE* const fp) : fp_(fp) {}

  void MaybeClose();

  FILE* fp_;
};

}  // namespace common
}  // namespace protosym

#endif  // __PROTOSYM_COMMON_FILE_H__
