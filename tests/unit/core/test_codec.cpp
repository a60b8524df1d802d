#include <gtest/gtest.h>

#include "hlid/core/codec.hpp"
#include "test_helpers.hpp"

using namespace hlid::core;
using namespace hlid::test;
using hlid::ErrorCode;

namespace {

Fields referenceFields() {
  Fields fields;
  fields.timestamp = hlid::util::Time::toTicks(utcTime(2024, 11, 5, 11, 8, 52, 5200));
  fields.user_data = 0xff;
  fields.nonce = {0x8f, 0xa6, 0x46, 0xf0, 0x9a, 0x7e};
  return fields;
}

}  // namespace

class CodecTest : public ::testing::Test {};

TEST_F(CodecTest, PackWritesCalendarDigitsAsNibbles) {
  auto bytes = Codec::pack(referenceFields());
  ASSERT_OK(bytes);

  Bytes expected = {0x20, 0x24, 0x11, 0x05, 0x11, 0x08, 0x52, 0x52, 0x00,
                    0xff, 0x8f, 0xa6, 0x46, 0xf0, 0x9a, 0x7e};
  EXPECT_EQ(*bytes, expected);
}

TEST_F(CodecTest, TextAndHexForms) {
  auto bytes = Codec::pack(referenceFields());
  ASSERT_OK(bytes);

  EXPECT_EQ(Codec::toText(*bytes), "20241105-1108-5252-00ff-8fa646f09a7e");
  EXPECT_EQ(Codec::toHex(*bytes), "202411051108525200ff8fa646f09a7e");
  EXPECT_EQ(Codec::toText(*bytes).size(), kTextLength);
  EXPECT_EQ(Codec::toHex(*bytes).size(), kHexLength);
}

TEST_F(CodecTest, SignedPrefixCoversTimestampAndUserData) {
  auto bytes = Codec::pack(referenceFields());
  ASSERT_OK(bytes);

  EXPECT_EQ(Codec::signedPrefix(*bytes), "20241105-1108-5252-00ff");
}

TEST_F(CodecTest, UnpackRecoversFields) {
  auto fields = referenceFields();
  auto bytes = Codec::pack(fields);
  ASSERT_OK(bytes);

  auto unpacked = Codec::unpack(*bytes);
  ASSERT_OK(unpacked);
  EXPECT_EQ(unpacked->timestamp, fields.timestamp);
  EXPECT_EQ(unpacked->user_data, 0xff);
  EXPECT_EQ(unpacked->nonce, fields.nonce);
}

TEST_F(CodecTest, PackRejectsTimestampsOutsideRange) {
  Fields before_epoch;
  before_epoch.timestamp = hlid::util::Time::minTime() - hlid::util::Ticks{1};
  EXPECT_ERROR(Codec::pack(before_epoch), ErrorCode::kOutOfRange);

  Fields after_max;
  after_max.timestamp = hlid::util::Time::maxTime() + hlid::util::Ticks{1};
  EXPECT_ERROR(Codec::pack(after_max), ErrorCode::kOutOfRange);

  Fields at_max;
  at_max.timestamp = hlid::util::Time::maxTime();
  auto bytes = Codec::pack(at_max);
  ASSERT_OK(bytes);
  EXPECT_EQ(Codec::toText(*bytes), "99991231-2359-5999-9900-000000000000");
}

TEST_F(CodecTest, EpochPacksToAllZeroTime) {
  Fields epoch;
  epoch.timestamp = hlid::util::Time::minTime();
  auto bytes = Codec::pack(epoch);
  ASSERT_OK(bytes);
  EXPECT_EQ(Codec::toText(*bytes), "19700101-0000-0000-0000-000000000000");
}

TEST_F(CodecTest, UnpackRejectsNonDecimalDigits) {
  auto bytes = Codec::pack(referenceFields());
  ASSERT_OK(bytes);

  Bytes corrupted = *bytes;
  corrupted[2] = 0x1a;  // month "1a"
  auto result = Codec::unpack(corrupted);
  EXPECT_ERROR(result, ErrorCode::kFormatError);
  if (!result.has_value()) {
    EXPECT_NE(result.error().message().find("HLID invalid value"), std::string::npos);
  }
}

TEST_F(CodecTest, UnpackRejectsImpossibleCalendar) {
  auto bytes = Codec::pack(referenceFields());
  ASSERT_OK(bytes);

  Bytes feb30 = *bytes;
  feb30[2] = 0x02;
  feb30[3] = 0x30;
  EXPECT_ERROR(Codec::unpack(feb30), ErrorCode::kFormatError);

  Bytes hour24 = *bytes;
  hour24[4] = 0x24;
  EXPECT_ERROR(Codec::unpack(hour24), ErrorCode::kFormatError);

  Bytes year1969 = *bytes;
  year1969[0] = 0x19;
  year1969[1] = 0x69;
  EXPECT_ERROR(Codec::unpack(year1969), ErrorCode::kFormatError);
}

TEST_F(CodecTest, DecodeAcceptsDashedAndBareHexInEitherCase) {
  auto dashed = Codec::decode("20241105-1108-5252-00ff-8fa646f09a7e");
  auto bare = Codec::decode("202411051108525200ff8fa646f09a7e");
  auto upper = Codec::decode("20241105-1108-5252-00FF-8FA646F09A7E");

  ASSERT_OK(dashed);
  ASSERT_OK(bare);
  ASSERT_OK(upper);
  EXPECT_EQ(*dashed, *bare);
  EXPECT_EQ(*dashed, *upper);
}

TEST_F(CodecTest, DecodeRejectsMalformedInput) {
  EXPECT_ERROR(Codec::decode(""), ErrorCode::kFormatError);
  EXPECT_ERROR(Codec::decode("20241105"), ErrorCode::kFormatError);
  // Dashes in the wrong places
  EXPECT_ERROR(Codec::decode("2024110-51108-5252-00ff-8fa646f09a7e"), ErrorCode::kFormatError);
  // Non-hex character in the nonce
  EXPECT_ERROR(Codec::decode("20241105-1108-5252-00ff-8fa646f09a7g"), ErrorCode::kFormatError);
  // A random UUID is hex but not a valid calendar
  EXPECT_ERROR(Codec::decode("f47ac10b-58cc-4372-a567-0e02b2c3d479"), ErrorCode::kFormatError);
  // One character too many
  EXPECT_ERROR(Codec::decode("20241105-1108-5252-00ff-8fa646f09a7e0"), ErrorCode::kFormatError);
}

TEST_F(CodecTest, ParseUserData) {
  auto zero = Codec::parseUserData("00");
  ASSERT_OK(zero);
  EXPECT_EQ(*zero, 0x00);

  auto max = Codec::parseUserData("ff");
  ASSERT_OK(max);
  EXPECT_EQ(*max, 0xff);

  auto mixed = Codec::parseUserData("a7");
  ASSERT_OK(mixed);
  EXPECT_EQ(*mixed, 0xa7);
}

TEST_F(CodecTest, ParseUserDataErrors) {
  auto empty = Codec::parseUserData("");
  EXPECT_ERROR(empty, ErrorCode::kInvalidArgument);
  if (!empty.has_value()) {
    EXPECT_NE(empty.error().message().find("cannot be empty"), std::string::npos);
  }

  for (std::string_view bad_length : {"a", "abc"}) {
    auto result = Codec::parseUserData(bad_length);
    EXPECT_ERROR(result, ErrorCode::kInvalidArgument);
    if (!result.has_value()) {
      EXPECT_NE(result.error().message().find("exactly 2 characters"), std::string::npos);
    }
  }

  auto not_hex = Codec::parseUserData("xx");
  EXPECT_ERROR(not_hex, ErrorCode::kInvalidArgument);
  if (!not_hex.has_value()) {
    EXPECT_NE(not_hex.error().message().find("only hex characters"), std::string::npos);
  }

  EXPECT_ERROR(Codec::parseUserData("AA"), ErrorCode::kInvalidArgument);
  EXPECT_ERROR(Codec::parseUserData("aF"), ErrorCode::kInvalidArgument);
}

TEST_F(CodecTest, ParseUserDataChecksCaseBeforeHex) {
  // Uppercase non-hex letters report the case problem first
  for (std::string_view upper : {"ZZ", "AA", "Gx"}) {
    auto result = Codec::parseUserData(upper);
    EXPECT_ERROR(result, ErrorCode::kInvalidArgument);
    if (!result.has_value()) {
      EXPECT_NE(result.error().message().find("must be lowercase"), std::string::npos) << upper;
    }
  }
}

TEST_F(CodecTest, TimestampOfMatchesUnpack) {
  for (std::string_view text : {"19700101-0000-0000-0000-000000000000",
                                "20240229-1234-5678-99aa-1234567890ab",
                                "99991231-2359-5999-99ff-ffffffffffff"}) {
    auto bytes = Codec::decode(text);
    ASSERT_OK(bytes);
    auto fields = Codec::unpack(*bytes);
    ASSERT_OK(fields);
    EXPECT_EQ(Codec::timestampOf(*bytes), fields->timestamp) << text;
  }
}

TEST_F(CodecTest, FormatUserData) {
  EXPECT_EQ(Codec::formatUserData(0x00), "00");
  EXPECT_EQ(Codec::formatUserData(0x0a), "0a");
  EXPECT_EQ(Codec::formatUserData(0xff), "ff");
}
