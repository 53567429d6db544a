#include <cstdio>
#include <string>
#include <string_view>
#include <vector>

#include "absl/flags/flag.h"
#include "absl/flags/parse.h"
#include "absl/log/initialize.h"
#include "absl/log/log.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_join.h"
#include "common/file.h"
#include "common/utilities.h"
#include "proto/descriptor_loader.h"
#include "proto/extension_scope.h"
#include "proto/report.h"
#include "proto/symbol_table.h"

ABSL_FLAG(std::vector<std::string>, descriptor_sets, {},
          "One or more comma-separated file paths containing serialized FileDescriptorSet "
          "protobufs, e.g. as written by `protoc --descriptor_set_out --include_imports`.");

ABSL_FLAG(std::vector<std::string>, files, {},
          "Comma-separated names of the proto files to report, e.g. `foo/bar.proto`. Defaults to "
          "all the files of the descriptor sets.");

ABSL_FLAG(std::vector<std::string>, runtimes, std::vector<std::string>({"class", "namespaced"}),
          "Comma-separated target runtimes to compute extension access paths for. Valid values "
          "are `class` and `namespaced`.");

ABSL_FLAG(std::string, output_format, "listing",
          "Output format: `listing`, `textproto`, or `binary`.");

ABSL_FLAG(std::string, output, "",
          "Path of the output file. Defaults to the standard output if unspecified.");

namespace {

using ::protosym::common::File;
using ::protosym::common::WriteFile;
using ::protosym::proto::BuildSymbolReport;
using ::protosym::proto::DescriptorLoader;
using ::protosym::proto::ParseOutputFormat;
using ::protosym::proto::ParseTargetRuntime;
using ::protosym::proto::RenderReport;
using ::protosym::proto::SymbolTableOptions;

absl::StatusOr<SymbolTableOptions> GetSymbolTableOptions() {
  SymbolTableOptions options;
  options.runtimes.clear();
  for (auto const& name : absl::GetFlag(FLAGS_runtimes)) {
    DEFINE_CONST_OR_RETURN(runtime, ParseTargetRuntime(name));
    options.runtimes.emplace_back(runtime);
  }
  return options;
}

absl::Status WriteOutput(std::string_view const content) {
  auto const& path = absl::GetFlag(FLAGS_output);
  if (path.empty()) {
    return WriteFile(stdout, content);
  }
  LOG(INFO) << "writing " << path;
  DEFINE_VAR_OR_RETURN(file, File::Create(path));
  RETURN_IF_ERROR(file.Write(content));
  return file.Close();
}

absl::Status Run() {
  auto const& descriptor_sets = absl::GetFlag(FLAGS_descriptor_sets);
  if (descriptor_sets.empty()) {
    return absl::InvalidArgumentError("--descriptor_sets is required");
  }
  DEFINE_CONST_OR_RETURN(format, ParseOutputFormat(absl::GetFlag(FLAGS_output_format)));
  DEFINE_CONST_OR_RETURN(options, GetSymbolTableOptions());
  LOG(INFO) << "reading " << absl::StrJoin(descriptor_sets, ", ");
  DEFINE_CONST_OR_RETURN(loader, DescriptorLoader::ReadFiles(descriptor_sets));
  DEFINE_CONST_OR_RETURN(report, BuildSymbolReport(loader, absl::GetFlag(FLAGS_files), options));
  DEFINE_CONST_OR_RETURN(output, RenderReport(report, format));
  RETURN_IF_ERROR(WriteOutput(output));
  LOG(INFO) << "done";
  return absl::OkStatus();
}

}  // namespace

int main(int const argc, char* argv[]) {
  absl::InitializeLog();
  absl::ParseCommandLine(argc, argv);
  auto const status = Run();
  if (!status.ok()) {
    std::string const message{status.message()};
    ::fprintf(stderr, "Error: %s\n", message.c_str());  // NOLINT
    return 1;
  }
  return 0;
}
