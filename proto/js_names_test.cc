#include "proto/js_names.h"

#include "absl/strings/match.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "proto/descriptor_loader.h"
#include "proto/testing.h"

namespace {

using ::protosym::proto::CalculateJsEnumName;
using ::protosym::proto::CalculateQualifiedJsName;
using ::protosym::proto::ComputeJsFieldName;
using ::protosym::proto::DescriptorLoader;
using ::protosym::proto::GetJsExtensionImport;
using ::protosym::proto::GetJsExtensionName;
using ::protosym::proto::GetJsPackage;
using ::protosym::proto::internal::StripProtoPackage;
using ::protosym::proto::testing::FindEnumOrDie;
using ::protosym::proto::testing::FindExtensionOrDie;
using ::protosym::proto::testing::FindFieldOrDie;
using ::protosym::proto::testing::FindMessageOrDie;
using ::protosym::proto::testing::LoadTestSchemasOrDie;
using ::testing::StartsWith;

class JsNamesTest : public ::testing::Test {
 protected:
  DescriptorLoader const loader_ = LoadTestSchemasOrDie();
};

TEST_F(JsNamesTest, Package) {
  EXPECT_EQ(GetJsPackage(*FindMessageOrDie(loader_, "foo.bar.Outer").file()), "proto.foo.bar");
  EXPECT_EQ(GetJsPackage(*FindMessageOrDie(loader_, "Palette").file()), "proto");
}

TEST_F(JsNamesTest, TopLevelMessage) {
  EXPECT_EQ(CalculateQualifiedJsName(FindMessageOrDie(loader_, "foo.bar.Outer")),
            "proto.foo.bar.Outer");
  EXPECT_EQ(CalculateQualifiedJsName(FindMessageOrDie(loader_, "lorem.ipsum.Dolor")),
            "proto.lorem.ipsum.Dolor");
}

TEST_F(JsNamesTest, NestedMessages) {
  EXPECT_EQ(CalculateQualifiedJsName(FindMessageOrDie(loader_, "foo.bar.Outer.Inner")),
            "proto.foo.bar.Outer.Inner");
  EXPECT_EQ(CalculateQualifiedJsName(FindMessageOrDie(loader_, "foo.bar.Outer.Inner.Innermost")),
            "proto.foo.bar.Outer.Inner.Innermost");
}

TEST_F(JsNamesTest, EmptyPackage) {
  EXPECT_EQ(CalculateQualifiedJsName(FindMessageOrDie(loader_, "Palette")), "proto.Palette");
  EXPECT_EQ(CalculateQualifiedJsName(FindEnumOrDie(loader_, "Color")), "proto.Color");
}

TEST_F(JsNamesTest, Enums) {
  EXPECT_EQ(CalculateQualifiedJsName(FindEnumOrDie(loader_, "foo.bar.Outer.Color")),
            "proto.foo.bar.Outer.Color");
  EXPECT_EQ(CalculateJsEnumName(FindEnumOrDie(loader_, "foo.bar.Outer.Color")),
            "proto.foo.bar.Outer.Color");
  EXPECT_EQ(CalculateJsEnumName(FindEnumOrDie(loader_, "Color")), "proto.Color");
}

TEST_F(JsNamesTest, NamesStartWithFileNamespace) {
  for (auto const* const file : loader_.files()) {
    auto const js_package = GetJsPackage(*file);
    for (int i = 0; i < file->message_type_count(); ++i) {
      auto const& descriptor = *file->message_type(i);
      EXPECT_THAT(CalculateQualifiedJsName(descriptor), StartsWith(js_package + "."));
      for (int j = 0; j < descriptor.nested_type_count(); ++j) {
        EXPECT_THAT(CalculateQualifiedJsName(*descriptor.nested_type(j)),
                    StartsWith(js_package + "."));
      }
    }
  }
}

TEST_F(JsNamesTest, PackageAppearsOnce) {
  auto const name = CalculateQualifiedJsName(FindMessageOrDie(loader_, "foo.bar.Outer.Inner"));
  EXPECT_FALSE(absl::StrContains(name, "foo.bar.foo.bar"));
  EXPECT_EQ(name.find("foo.bar"), name.rfind("foo.bar"));
}

TEST_F(JsNamesTest, FieldNames) {
  EXPECT_EQ(ComputeJsFieldName(FindFieldOrDie(loader_, "foo.bar.Outer.user_id")), "userId");
  EXPECT_EQ(ComputeJsFieldName(FindFieldOrDie(loader_, "foo.bar.Outer.big_id")), "bigId");
  EXPECT_EQ(ComputeJsFieldName(FindFieldOrDie(loader_, "Palette.primary")), "primary");
}

TEST_F(JsNamesTest, RepeatedFieldNames) {
  EXPECT_EQ(ComputeJsFieldName(FindFieldOrDie(loader_, "foo.bar.Outer.tags")), "tagsList");
  EXPECT_EQ(ComputeJsFieldName(FindFieldOrDie(loader_, "foo.bar.Outer.inner_list")),
            "innerListList");
  EXPECT_EQ(ComputeJsFieldName(FindFieldOrDie(loader_, "Palette.shade_values")),
            "shadeValuesList");
}

TEST_F(JsNamesTest, ExtensionFieldNames) {
  EXPECT_EQ(ComputeJsFieldName(FindExtensionOrDie(loader_, "foo.bar.top_note")), "topNote");
  EXPECT_EQ(ComputeJsFieldName(FindExtensionOrDie(loader_, "foo.bar.Outer.Inner.inner_ids")),
            "innerIdsList");
}

TEST_F(JsNamesTest, TopLevelExtension) {
  auto const& extension = FindExtensionOrDie(loader_, "foo.bar.top_note");
  EXPECT_EQ(GetJsExtensionImport(extension), "proto.foo.bar.topNote");
  EXPECT_EQ(GetJsExtensionName(extension), "proto.foo.bar.topNote");
}

TEST_F(JsNamesTest, TopLevelExtensionInMultipleFiles) {
  auto const& extension = FindExtensionOrDie(loader_, "lorem.ipsum.amet");
  EXPECT_EQ(GetJsExtensionImport(extension), "proto.lorem.ipsum.amet");
  EXPECT_EQ(GetJsExtensionName(extension), "proto.lorem.ipsum.amet");
}

TEST_F(JsNamesTest, ExtensionInTopLevelMessage) {
  auto const& extension = FindExtensionOrDie(loader_, "foo.bar.Outer.outer_note");
  EXPECT_EQ(GetJsExtensionImport(extension), "proto.foo.bar.Outer");
  EXPECT_EQ(GetJsExtensionName(extension), "proto.foo.bar.Outer.outerNote");
}

TEST_F(JsNamesTest, ExtensionInNestedMessage) {
  auto const& extension = FindExtensionOrDie(loader_, "foo.bar.Outer.Inner.inner_ids");
  EXPECT_EQ(GetJsExtensionImport(extension), "proto.foo.bar.Outer");
  EXPECT_EQ(GetJsExtensionName(extension), "proto.foo.bar.Outer.Inner.innerIdsList");
}

TEST_F(JsNamesTest, ExtensionInDeeplyNestedMessage) {
  auto const& extension = FindExtensionOrDie(loader_, "foo.bar.Outer.Inner.Innermost.deep_flag");
  EXPECT_EQ(GetJsExtensionImport(extension), "proto.foo.bar.Outer");
  EXPECT_EQ(GetJsExtensionName(extension), "proto.foo.bar.Outer.Inner.Innermost.deepFlag");
}

TEST_F(JsNamesTest, TopLevelExtensionWithoutPackage) {
  auto const& extension = FindExtensionOrDie(loader_, "note");
  EXPECT_EQ(GetJsExtensionImport(extension), "proto.note");
  EXPECT_EQ(GetJsExtensionName(extension), "proto.note");
}

TEST_F(JsNamesTest, ExtensionsWithoutPackage) {
  auto const& memo_note = FindExtensionOrDie(loader_, "Memo.memo_note");
  EXPECT_EQ(GetJsExtensionImport(memo_note), "proto.Memo");
  EXPECT_EQ(GetJsExtensionName(memo_note), "proto.Memo.memoNote");
  auto const& detail_note = FindExtensionOrDie(loader_, "Memo.Detail.detail_note");
  EXPECT_EQ(GetJsExtensionImport(detail_note), "proto.Memo");
  EXPECT_EQ(GetJsExtensionName(detail_note), "proto.Memo.Detail.detailNote");
}

TEST_F(JsNamesTest, ExtensionNameOfRegularField) {
  EXPECT_DEATH(GetJsExtensionName(FindFieldOrDie(loader_, "foo.bar.Outer.user_id")),
               "not an extension");
}

TEST(StripProtoPackageTest, EmptyPackage) {
  EXPECT_EQ(StripProtoPackage("", "Color"), "Color");
  EXPECT_EQ(StripProtoPackage("", "Outer.Inner"), "Outer.Inner");
}

TEST(StripProtoPackageTest, Strip) {
  EXPECT_EQ(StripProtoPackage("foo.bar", "foo.bar.Outer"), ".Outer");
  EXPECT_EQ(StripProtoPackage("foo.bar", "foo.bar.Outer.Inner"), ".Outer.Inner");
  EXPECT_EQ(StripProtoPackage("foo", "foo.foo"), ".foo");
}

TEST(StripProtoPackageTest, WrongPackage) {
  EXPECT_DEATH(StripProtoPackage("foo.bar", "baz.Qux"),
               "Expected \"baz.Qux\" to start with \"foo.bar\"");
}

TEST(StripProtoPackageTest, PackageIsOnlyTextualPrefix) {
  EXPECT_DEATH(StripProtoPackage("foo", "foobar.X"), "Expected \"foobar.X\" to start with \"foo\"");
}

TEST(StripProtoPackageTest, NameEqualsPackage) {
  EXPECT_DEATH(StripProtoPackage("foo.bar", "foo.bar"), "to start with");
}

}  // namespace
