#include "common/file.h"

#include <cerrno>
#include <cstdio>
#include <string>
#include <string_view>
#include <utility>

#include "absl/log/log.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"

namespace protosym {
namespace common {

absl::StatusOr<std::string> ReadFile(FILE* const fp) {
  std::string content;
  char buffer[4096];
  while (size_t const bytes_read = ::fread(buffer, 1, sizeof(buffer), fp)) {
    content.append(buffer, bytes_read);
  }
  if (::ferror(fp) != 0) {
    return absl::ErrnoToStatus(errno, "fread");
  }
  return std::move(content);
}

absl::Status WriteFile(FILE* const fp, std::string_view const content) {
  if (::fwrite(content.data(), 1, content.size(), fp) != content.size()) {
    return absl::ErrnoToStatus(errno, "fwrite");
  }
  return absl::OkStatus();
}

absl::StatusOr<File> File::Open(std::string const& path) { return OpenInternal(path, "rb"); }

absl::StatusOr<File> File::Create(std::string const& path) { return OpenInternal(path, "wb"); }

absl::Status File::Close() {
  FILE* const fp = fp_;
  fp_ = nullptr;
  if (fp != nullptr && ::fclose(fp) < 0) {
    return absl::ErrnoToStatus(errno, "fclose");
  }
  return absl::OkStatus();
}

absl::StatusOr<File> File::OpenInternal(std::string const& path, char const* const mode) {
  FILE* const fp = ::fopen(path.c_str(), mode);
  if (fp != nullptr) {
    return File(fp);
  } else {
    return absl::ErrnoToStatus(errno, absl::StrCat("fopen(\"", path, "\")"));
  }
}

void File::MaybeClose() {
  if (fp_ != nullptr) {
    LOG_IF(ERROR, ::fclose(fp_) < 0) << absl::ErrnoToStatus(errno, "fclose");
    fp_ = nullptr;
  }
}

}  // namespace common
}  // namespace protosym
