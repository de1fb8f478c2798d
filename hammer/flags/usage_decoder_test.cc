#include "hammer/flags/usage_decoder.h"

#include <cstdint>
#include <iomanip>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace hammer {
std::ostream& operator<<(std::ostream& os, const FieldUsage& field) {
  os << "FieldUsage{.canonical=" << std::quoted(field.canonical);
  if (field.alias) os << ", .alias='" << *field.alias << "'";
  return os << ", .optional=" << std::boolalpha << field.optional << "}";
}

namespace {
using ::testing::ElementsAre;
using ::testing::IsEmpty;
using ::testing::StrEq;

TEST(RenderUsageTest, MandatoryFirstAndIndentedForAliases) {
  const std::vector<FieldUsage> fields = {
      {.canonical = "--color", .optional = true},
      {.canonical = "--line-count"},
      {.canonical = "--verbose", .alias = 'v', .optional = true},
  };
  EXPECT_THAT(RenderUsage(fields, false), StrEq("    --line-count\n"
                                                "    [--color]\n"
                                                "-v, [--verbose]\n"));
}

TEST(RenderUsageTest, NoAliases) {
  const std::vector<FieldUsage> fields = {
      {.canonical = "--color", .optional = true},
      {.canonical = "--line-count"},
      {.canonical = "--verbose", .optional = true},
  };
  EXPECT_THAT(RenderUsage(fields, false), StrEq("--line-count\n[--color]\n[--verbose]\n"));
  EXPECT_THAT(RenderUsage(fields, true), StrEq("    --line-count\n    [--color]\n    [--verbose]\n"));
}

TEST(RenderUsageTest, StableWithinGroups) {
  const std::vector<FieldUsage> fields = {
      {.canonical = "--b", .optional = true},
      {.canonical = "--d"},
      {.canonical = "--a", .optional = true},
      {.canonical = "--c", .alias = 'c'},
  };
  EXPECT_THAT(RenderUsage(fields, false), StrEq("    --d\n"
                                                "-c, --c\n"
                                                "    [--b]\n"
                                                "    [--a]\n"));
  EXPECT_THAT(RenderUsage({}, true), IsEmpty());
}

TEST(UsageDecoderTest, CollectsDescriptorsWithoutTokens) {
  UsageDecoder decoder(FlagConfiguration().Short("line_count", 'n'));
  std::string  text;
  std::int64_t count = 0;
  bool         flag  = true;
  char         sep   = 0;
  ASSERT_TRUE(decoder.ReadStruct("Options", 4, [&](Decoder& d) {
    return d.ReadStructField("line_count", 0, [&](Decoder& f) { return f.ReadInt(count); }) &&
           d.ReadStructField("verbose", 1, [&](Decoder& f) { return f.ReadBool(flag); }) &&
           d.ReadStructField("sep", 2, [&](Decoder& f) { return f.ReadChar(sep); }) &&
           d.ReadStructField("name", 3, [&](Decoder& f) {
             return f.ReadOption([&](Decoder& o, bool present) { return present && o.ReadString(text); });
           });
  }));
  EXPECT_FALSE(flag);
  EXPECT_THAT(decoder.fields(), ElementsAre(FieldUsage{.canonical = "--line-count", .alias = 'n'},
                                            FieldUsage{.canonical = "--verbose", .optional = true},
                                            FieldUsage{.canonical = "--sep"},
                                            FieldUsage{.canonical = "--name", .optional = true}));
}

TEST(UsageDecoderTest, RestFieldHasNoDescriptor) {
  UsageDecoder decoder(FlagConfiguration().RestField("files"));
  std::size_t  elements = 1;
  ASSERT_TRUE(decoder.ReadStructField("files", 0, [&](Decoder& d) {
    return d.ReadSeq([&](Decoder&, std::size_t len) {
      elements = len;
      return true;
    });
  }));
  EXPECT_EQ(elements, 0u);
  EXPECT_THAT(decoder.fields(), IsEmpty());
}

TEST(UsageDecoderTest, NonRestSequenceIsUnsupported) {
  UsageDecoder decoder(FlagConfiguration().RestField("files"));
  EXPECT_FALSE(decoder.ReadStructField("rest", 0, [](Decoder& d) {
    return d.ReadSeq([](Decoder&, std::size_t) { return true; });
  }));
  EXPECT_EQ(decoder.error(), (DecodeError{.kind    = DecodeError::Kind::kUnsupportedShape,
                                          .message = "--rest is a sequence but only the rest field `files` can be one"}));
}

}  // namespace
}  // namespace hammer
