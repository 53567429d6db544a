#include "proto/report.h"

#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "absl/container/btree_map.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "google/protobuf/text_format.h"
#include "proto/symbols.pb.h"

namespace protosym {
namespace proto {

namespace {

// Accumulates lines of text with a variable indentation level.
class ListingWriter {
 public:
  class IndentedScope final {
   public:
    explicit IndentedScope(ListingWriter* const parent) : parent_(parent) {
      ++parent_->indentation_level_;
    }

    ~IndentedScope() { --parent_->indentation_level_; }

   private:
    IndentedScope(IndentedScope const&) = delete;
    IndentedScope& operator=(IndentedScope const&) = delete;
    IndentedScope(IndentedScope&&) = delete;
    IndentedScope& operator=(IndentedScope&&) = delete;

    ListingWriter* const parent_;
  };

  explicit ListingWriter() = default;

  template <typename... Args>
  void AppendLine(Args&&... args) {
    content_.append(indentation_level_ * kIndentWidth, ' ');
    absl::StrAppend(&content_, std::forward<Args>(args)..., "\n");
  }

  // Appends a "key: value" line, or nothing if `value` is empty.
  void AppendProperty(std::string_view const key, std::string_view const value) {
    if (!value.empty()) {
      AppendLine(key, ": ", value);
    }
  }

  std::string Finish() && { return std::move(content_); }

 private:
  static size_t constexpr kIndentWidth = 2;

  ListingWriter(ListingWriter const&) = delete;
  ListingWriter& operator=(ListingWriter const&) = delete;

  size_t indentation_level_ = 0;
  std::string content_;
};

std::string_view GetSyntaxName(Syntax const syntax) {
  switch (syntax) {
    case SYNTAX_PROTO2:
      return "proto2";
    case SYNTAX_PROTO3:
      return "proto3";
    default:
      return "unspecified";
  }
}

std::string_view GetKindName(TypeSymbol::Kind const kind) {
  switch (kind) {
    case TypeSymbol::KIND_MESSAGE:
      return "message";
    case TypeSymbol::KIND_ENUM:
      return "enum";
    default:
      return "type";
  }
}

void WriteFieldProperties(ListingWriter* const writer, FieldSymbol const& field) {
  writer->AppendProperty("js accessor", field.js_accessor_name());
  writer->AppendProperty("java name", field.java_field_name());
  std::vector<std::string> flags;
  if (field.is_unsigned()) {
    flags.emplace_back("unsigned");
  }
  if (field.has_js_type()) {
    flags.emplace_back(absl::StrCat("jstype=", field.js_type()));
  }
  if (field.check_presence()) {
    flags.emplace_back("check_presence");
  }
  if (!field.sanitized_content_kind().empty()) {
    flags.emplace_back(absl::StrCat("sanitized=", field.sanitized_content_kind()));
  }
  writer->AppendProperty("flags", absl::StrJoin(flags, ", "));
}

void WriteExtension(ListingWriter* const writer, ExtensionSymbol const& extension) {
  writer->AppendLine("extension ", extension.field().full_name(), " extends ",
                     extension.extendee());
  ListingWriter::IndentedScope is{writer};
  writer->AppendProperty("scope", extension.scope());
  WriteFieldProperties(writer, extension.field());
  writer->AppendProperty("js import", extension.js_import());
  writer->AppendProperty("js extension name", extension.js_extension_name());
  absl::btree_map<std::string, std::string> access_paths;
  for (auto const& entry : extension.access_paths()) {
    access_paths.emplace(entry.first, entry.second);
  }
  for (auto const& [runtime, path] : access_paths) {
    writer->AppendLine("access path [", runtime, "]: ", path);
  }
}

void WriteFile(ListingWriter* const writer, FileSymbols const& file) {
  writer->AppendLine("file ", file.name());
  ListingWriter::IndentedScope is{writer};
  writer->AppendProperty("package", file.package());
  writer->AppendProperty("syntax", GetSyntaxName(file.syntax()));
  writer->AppendProperty("js namespace", file.js_namespace());
  writer->AppendProperty("java package", file.java_package());
  writer->AppendProperty("java outer class", file.java_outer_classname());
  for (auto const& type : file.types()) {
    writer->AppendLine(GetKindName(type.kind()), " ", type.full_name());
    ListingWriter::IndentedScope is2{writer};
    writer->AppendProperty("js", type.js_name());
    writer->AppendProperty("java", type.java_name());
  }
  for (auto const& field : file.fields()) {
    writer->AppendLine("field ", field.full_name());
    ListingWriter::IndentedScope is2{writer};
    WriteFieldProperties(writer, field);
  }
  for (auto const& extension : file.extensions()) {
    WriteExtension(writer, extension);
  }
}

std::string RenderListing(SymbolReport const& report) {
  ListingWriter writer;
  for (auto const& file : report.files()) {
    WriteFile(&writer, file);
  }
  return std::move(writer).Finish();
}

}  // namespace

absl::StatusOr<OutputFormat> ParseOutputFormat(std::string_view const name) {
  if (name == "listing") {
    return OutputFormat::kListing;
  } else if (name == "textproto") {
    return OutputFormat::kTextProto;
  } else if (name == "binary") {
    return OutputFormat::kBinary;
  } else {
    return absl::InvalidArgumentError(
        absl::StrCat("invalid output format \"", name,
                     "\", expected \"listing\", \"textproto\", or \"binary\""));
  }
}

absl::StatusOr<std::string> RenderReport(SymbolReport const& report, OutputFormat const format) {
  std::string output;
  switch (format) {
    case OutputFormat::kListing:
      return RenderListing(report);
    case OutputFormat::kTextProto:
      if (!google::protobuf::TextFormat::PrintToString(report, &output)) {
        return absl::InternalError("cannot print the symbol report in text format");
      }
      return std::move(output);
    case OutputFormat::kBinary:
      if (!report.SerializeToString(&output)) {
        return absl::InternalError("cannot serialize the symbol report");
      }
      return std::move(output);
  }
  return absl::InvalidArgumentError("invalid output format");
}

}  // namespace proto
}  // namespace protosym
