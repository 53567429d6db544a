#include "proto/descriptor_loader.h"

#include <cstdio>
#include <string>
#include <string_view>
#include <vector>

#include "absl/status/status.h"
#include "absl/strings/str_cat.h"
#include "common/testing.h"
#include "gmock/gmock.h"
#include "google/protobuf/descriptor.h"
#include "google/protobuf/descriptor.pb.h"
#include "gtest/gtest.h"
#include "proto/testing.h"

namespace {

using ::absl_testing::StatusIs;
using ::google::protobuf::FileDescriptor;
using ::google::protobuf::FileDescriptorSet;
using ::protosym::proto::DescriptorLoader;
using ::protosym::proto::testing::kTestSchemas;
using ::testing::ElementsAre;
using ::testing::HasSubstr;
using ::testing::IsEmpty;
using ::testing::ParseTextProtoOrDie;
using ::testing::Pointee;
using ::testing::Property;
using ::testing::SizeIs;

auto FileNamed(std::string_view const name) {
  return Pointee(Property(&FileDescriptor::name, name));
}

void WriteFileOrDie(std::string const& path, std::string_view const content) {
  FILE* const fp = ::fopen(path.c_str(), "wb");
  ASSERT_NE(fp, nullptr) << path;
  EXPECT_EQ(::fwrite(content.data(), 1, content.size(), fp), content.size());
  ASSERT_EQ(::fclose(fp), 0);
}

TEST(DescriptorLoaderTest, EmptySet) {
  auto const status_or_loader = DescriptorLoader::Create(FileDescriptorSet());
  ASSERT_OK(status_or_loader);
  EXPECT_THAT(status_or_loader->files(), IsEmpty());
}

TEST(DescriptorLoaderTest, Create) {
  auto const status_or_loader =
      DescriptorLoader::Create(ParseTextProtoOrDie<FileDescriptorSet>(kTestSchemas));
  ASSERT_OK(status_or_loader);
  EXPECT_THAT(status_or_loader->files(),
              ElementsAre(FileNamed("foo/bar/nested.proto"), FileNamed("color.proto"),
                          FileNamed("lorem/ipsum.proto"),
                          FileNamed("webutil/html/types/html.proto"), FileNamed("page.proto"),
                          FileNamed("memo.proto")));
  EXPECT_NE(status_or_loader->pool().FindMessageTypeByName("foo.bar.Outer.Inner.Innermost"),
            nullptr);
}

TEST(DescriptorLoaderTest, MissingDependency) {
  auto const file_set = ParseTextProtoOrDie<FileDescriptorSet>(R"pb(
    file {
      name: "lorem.proto"
      package: "lorem"
      dependency: "ipsum.proto"
      message_type {
        name: "Lorem"
        field {
          name: "ipsum"
          number: 1
          label: LABEL_OPTIONAL
          type: TYPE_MESSAGE
          type_name: ".ipsum.Ipsum"
        }
      }
    }
  )pb");
  auto const status_or_loader = DescriptorLoader::Create(file_set);
  EXPECT_THAT(status_or_loader, StatusIs(absl::StatusCode::kInvalidArgument,
                                         HasSubstr("cannot build \"lorem.proto\"")));
}

TEST(DescriptorLoaderTest, DependenciesOutOfOrder) {
  auto const file_set = ParseTextProtoOrDie<FileDescriptorSet>(R"pb(
    file { name: "lorem.proto" package: "lorem" dependency: "ipsum.proto" }
    file { name: "ipsum.proto" package: "ipsum" }
  )pb");
  auto const status_or_loader = DescriptorLoader::Create(file_set);
  EXPECT_THAT(status_or_loader, StatusIs(absl::StatusCode::kInvalidArgument));
}

TEST(DescriptorLoaderTest, InvalidSchema) {
  auto const file_set = ParseTextProtoOrDie<FileDescriptorSet>(R"pb(
    file {
      name: "lorem.proto"
      package: "lorem"
      message_type {
        name: "Lorem"
        field { name: "ipsum" number: 1 label: LABEL_OPTIONAL type: TYPE_INT32 }
        field { name: "dolor" number: 1 label: LABEL_OPTIONAL type: TYPE_INT32 }
      }
    }
  )pb");
  auto const status_or_loader = DescriptorLoader::Create(file_set);
  EXPECT_THAT(status_or_loader,
              StatusIs(absl::StatusCode::kInvalidArgument, HasSubstr("lorem.Lorem.dolor")));
}

TEST(DescriptorLoaderTest, IdenticalDuplicates) {
  auto const file_set = ParseTextProtoOrDie<FileDescriptorSet>(R"pb(
    file { name: "lorem.proto" package: "lorem" }
    file { name: "ipsum.proto" package: "ipsum" dependency: "lorem.proto" }
    file { name: "lorem.proto" package: "lorem" }
  )pb");
  auto const status_or_loader = DescriptorLoader::Create(file_set);
  ASSERT_OK(status_or_loader);
  EXPECT_THAT(status_or_loader->files(),
              ElementsAre(FileNamed("lorem.proto"), FileNamed("ipsum.proto")));
}

TEST(DescriptorLoaderTest, ConflictingDuplicates) {
  auto const file_set = ParseTextProtoOrDie<FileDescriptorSet>(R"pb(
    file { name: "lorem.proto" package: "lorem" }
    file { name: "lorem.proto" package: "ipsum" }
  )pb");
  auto const status_or_loader = DescriptorLoader::Create(file_set);
  EXPECT_THAT(status_or_loader, StatusIs(absl::StatusCode::kInvalidArgument));
}

TEST(DescriptorLoaderTest, Parse) {
  std::string serialized;
  ASSERT_TRUE(ParseTextProtoOrDie<FileDescriptorSet>(kTestSchemas).SerializeToString(&serialized));
  auto const status_or_loader = DescriptorLoader::Parse(serialized);
  ASSERT_OK(status_or_loader);
  EXPECT_THAT(status_or_loader->files(), SizeIs(6));
}

TEST(DescriptorLoaderTest, ParseMalformed) {
  EXPECT_THAT(DescriptorLoader::Parse("\xFF\xFF\xFF"),
              StatusIs(absl::StatusCode::kInvalidArgument, "malformed FileDescriptorSet"));
}

TEST(DescriptorLoaderTest, FindFile) {
  auto const loader = ::protosym::proto::testing::LoadTestSchemasOrDie();
  auto const status_or_file = loader.FindFile("lorem/ipsum.proto");
  ASSERT_OK(status_or_file);
  EXPECT_EQ(status_or_file.value()->package(), "lorem.ipsum");
}

TEST(DescriptorLoaderTest, FileNotFound) {
  auto const loader = ::protosym::proto::testing::LoadTestSchemasOrDie();
  EXPECT_THAT(loader.FindFile("dolor.proto"),
              StatusIs(absl::StatusCode::kNotFound, "proto file \"dolor.proto\" not found"));
}

TEST(DescriptorLoaderTest, ReadFiles) {
  std::string const path1 = absl::StrCat(::testing::TempDir(), "/read_files_1.pb");
  std::string const path2 = absl::StrCat(::testing::TempDir(), "/read_files_2.pb");
  std::string serialized1;
  ASSERT_TRUE(ParseTextProtoOrDie<FileDescriptorSet>(R"pb(
                file { name: "lorem.proto" package: "lorem" }
              )pb")
                  .SerializeToString(&serialized1));
  std::string serialized2;
  ASSERT_TRUE(ParseTextProtoOrDie<FileDescriptorSet>(R"pb(
                file { name: "lorem.proto" package: "lorem" }
                file { name: "ipsum.proto" package: "ipsum" dependency: "lorem.proto" }
              )pb")
                  .SerializeToString(&serialized2));
  WriteFileOrDie(path1, serialized1);
  WriteFileOrDie(path2, serialized2);
  auto const status_or_loader = DescriptorLoader::ReadFiles(std::vector<std::string>{path1, path2});
  ASSERT_OK(status_or_loader);
  EXPECT_THAT(status_or_loader->files(),
              ElementsAre(FileNamed("lorem.proto"), FileNamed("ipsum.proto")));
}

TEST(DescriptorLoaderTest, ReadMissingFile) {
  std::string const path = absl::StrCat(::testing::TempDir(), "/does_not_exist.pb");
  EXPECT_THAT(DescriptorLoader::ReadFiles(std::vector<std::string>{path}),
              StatusIs(absl::StatusCode::kNotFound));
}

TEST(DescriptorLoaderTest, ReadMalformedFile) {
  std::string const path = absl::StrCat(::testing::TempDir(), "/malformed.pb");
  WriteFileOrDie(path, "\xFF\xFF\xFF");
  EXPECT_THAT(DescriptorLoader::ReadFiles(std::vector<std::string>{path}),
              StatusIs(absl::StatusCode::kInvalidArgument, HasSubstr("malformed")));
}

}  // namespace
