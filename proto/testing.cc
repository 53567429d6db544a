#include "proto/testing.h"

#include <string>
#include <string_view>
#include <utility>

#include "absl/log/check.h"
#include "common/testing.h"
#include "google/protobuf/descriptor.h"
#include "google/protobuf/descriptor.pb.h"
#include "proto/descriptor_loader.h"

namespace protosym {
namespace proto {
namespace testing {

using ::google::protobuf::Descriptor;
using ::google::protobuf::EnumDescriptor;
using ::google::protobuf::FieldDescriptor;
using ::google::protobuf::FileDescriptorSet;

std::string_view const kTestSchemas = R"pb(
  file {
    name: "foo/bar/nested.proto"
    package: "foo.bar"
    options { java_package: "com.example.foobar" }
    message_type {
      name: "Outer"
      field { name: "user_id" number: 1 label: LABEL_OPTIONAL type: TYPE_INT32 }
      field { name: "tags" number: 2 label: LABEL_REPEATED type: TYPE_STRING }
      field {
        name: "inner"
        number: 3
        label: LABEL_OPTIONAL
        type: TYPE_MESSAGE
        type_name: ".foo.bar.Outer.Inner"
      }
      field {
        name: "big_id"
        number: 4
        label: LABEL_OPTIONAL
        type: TYPE_INT64
        options { jstype: JS_STRING }
      }
      field {
        name: "count"
        number: 5
        label: LABEL_OPTIONAL
        type: TYPE_UINT32
        default_value: "7"
      }
      field {
        name: "color"
        number: 6
        label: LABEL_OPTIONAL
        type: TYPE_ENUM
        type_name: ".foo.bar.Outer.Color"
      }
      field {
        name: "small_id"
        number: 7
        label: LABEL_OPTIONAL
        type: TYPE_INT32
        options { jstype: JS_NORMAL }
      }
      field { name: "id_hash" number: 8 label: LABEL_REQUIRED type: TYPE_FIXED64 }
      field {
        name: "inner_list"
        number: 9
        label: LABEL_REPEATED
        type: TYPE_MESSAGE
        type_name: ".foo.bar.Outer.Inner"
      }
      nested_type {
        name: "Inner"
        nested_type {
          name: "Innermost"
          extension {
            name: "deep_flag"
            number: 102
            label: LABEL_OPTIONAL
            type: TYPE_BOOL
            extendee: ".foo.bar.Outer"
          }
        }
        extension {
          name: "inner_ids"
          number: 101
          label: LABEL_REPEATED
          type: TYPE_INT32
          extendee: ".foo.bar.Outer"
        }
      }
      enum_type {
        name: "Color"
        value { name: "COLOR_RED" number: 0 }
        value { name: "COLOR_GREEN" number: 1 }
      }
      extension_range { start: 100 end: 201 }
      extension {
        name: "outer_note"
        number: 100
        label: LABEL_OPTIONAL
        type: TYPE_STRING
        extendee: ".foo.bar.Outer"
      }
    }
    extension {
      name: "top_note"
      number: 150
      label: LABEL_OPTIONAL
      type: TYPE_STRING
      extendee: ".foo.bar.Outer"
    }
  }
  file {
    name: "color.proto"
    syntax: "proto3"
    enum_type { name: "Color" value { name: "COLOR_UNSPECIFIED" number: 0 } }
    message_type {
      name: "Palette"
      field { name: "primary" number: 1 label: LABEL_OPTIONAL type: TYPE_ENUM type_name: ".Color" }
      field { name: "shade_values" number: 2 label: LABEL_REPEATED type: TYPE_FIXED32 }
      field {
        name: "parent"
        number: 3
        label: LABEL_OPTIONAL
        type: TYPE_MESSAGE
        type_name: ".Palette"
      }
      field {
        name: "weight"
        number: 4
        label: LABEL_OPTIONAL
        type: TYPE_UINT64
        options { jstype: JS_STRING }
      }
      field { name: "label" number: 5 label: LABEL_OPTIONAL type: TYPE_STRING }
    }
  }
  file {
    name: "lorem/ipsum.proto"
    package: "lorem.ipsum"
    options { java_multiple_files: true java_outer_classname: "IpsumProtos" }
    message_type {
      name: "Dolor"
      nested_type { name: "Sit" }
      extension_range { start: 10 end: 21 }
    }
    extension {
      name: "amet"
      number: 10
      label: LABEL_OPTIONAL
      type: TYPE_INT32
      extendee: ".lorem.ipsum.Dolor"
    }
  }
  file {
    name: "webutil/html/types/html.proto"
    package: "webutil.html.types"
    message_type {
      name: "SafeHtmlProto"
      field {
        name: "private_do_not_access_or_else_safe_html_wrapped_value"
        number: 1
        label: LABEL_OPTIONAL
        type: TYPE_STRING
      }
    }
    message_type {
      name: "SafeUrlProto"
      field {
        name: "private_do_not_access_or_else_safe_url_wrapped_value"
        number: 1
        label: LABEL_OPTIONAL
        type: TYPE_STRING
      }
    }
    message_type {
      name: "TrustedResourceUrlProto"
      field {
        name: "private_do_not_access_or_else_trusted_resource_url_wrapped_value"
        number: 1
        label: LABEL_OPTIONAL
        type: TYPE_STRING
      }
    }
  }
  file {
    name: "page.proto"
    package: "page"
    dependency: "webutil/html/types/html.proto"
    message_type {
      name: "Page"
      field {
        name: "body"
        number: 1
        label: LABEL_OPTIONAL
        type: TYPE_MESSAGE
        type_name: ".webutil.html.types.SafeHtmlProto"
      }
      field {
        name: "link"
        number: 2
        label: LABEL_OPTIONAL
        type: TYPE_MESSAGE
        type_name: ".webutil.html.types.SafeUrlProto"
      }
      field {
        name: "script_src"
        number: 3
        label: LABEL_OPTIONAL
        type: TYPE_MESSAGE
        type_name: ".webutil.html.types.TrustedResourceUrlProto"
      }
      field { name: "title" number: 4 label: LABEL_OPTIONAL type: TYPE_STRING }
    }
  }
  file {
    name: "memo.proto"
    message_type {
      name: "Memo"
      field { name: "text" number: 1 label: LABEL_OPTIONAL type: TYPE_STRING }
      nested_type {
        name: "Detail"
        extension {
          name: "detail_note"
          number: 101
          label: LABEL_OPTIONAL
          type: TYPE_STRING
          extendee: ".Memo"
        }
      }
      extension_range { start: 100 end: 201 }
      extension {
        name: "memo_note"
        number: 100
        label: LABEL_OPTIONAL
        type: TYPE_STRING
        extendee: ".Memo"
      }
    }
    extension {
      name: "note"
      number: 150
      label: LABEL_OPTIONAL
      type: TYPE_STRING
      extendee: ".Memo"
    }
  }
)pb";

DescriptorLoader LoadSchemasOrDie(std::string_view const file_descriptor_set) {
  auto status_or_loader = DescriptorLoader::Create(
      ::testing::ParseTextProtoOrDie<FileDescriptorSet>(file_descriptor_set));
  CHECK_OK(status_or_loader.status());
  return std::move(status_or_loader).value();
}

DescriptorLoader LoadTestSchemasOrDie() { return LoadSchemasOrDie(kTestSchemas); }

Descriptor const& FindMessageOrDie(DescriptorLoader const& loader,
                                   std::string_view const full_name) {
  auto const* const descriptor = loader.pool().FindMessageTypeByName(std::string(full_name));
  CHECK(descriptor != nullptr) << "message " << full_name << " not found";
  return *descriptor;
}

EnumDescriptor const& FindEnumOrDie(DescriptorLoader const& loader,
                                    std::string_view const full_name) {
  auto const* const descriptor = loader.pool().FindEnumTypeByName(std::string(full_name));
  CHECK(descriptor != nullptr) << "enum " << full_name << " not found";
  return *descriptor;
}

FieldDescriptor const& FindFieldOrDie(DescriptorLoader const& loader,
                                      std::string_view const full_name) {
  auto const* const descriptor = loader.pool().FindFieldByName(std::string(full_name));
  CHECK(descriptor != nullptr) << "field " << full_name << " not found";
  return *descriptor;
}

FieldDescriptor const& FindExtensionOrDie(DescriptorLoader const& loader,
                                          std::string_view const full_name) {
  auto const* const descriptor = loader.pool().FindExtensionByName(std::string(full_name));
  CHECK(descriptor != nullptr) << "extension " << full_name << " not found";
  return *descriptor;
}

}  // namespace testing
}  // namespace proto
}  // namespace protosym
