#include "hlid/core/codec.hpp"

#include <algorithm>
#include <chrono>

namespace hlid::core {

namespace {

constexpr char kHexDigits[] = "0123456789abcdef";
constexpr std::array<std::size_t, 4> kDashPositions = {8, 13, 18, 23};

// Decode a hex character, either case
int decodeHexChar(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

std::uint8_t nibble(const Bytes& bytes, std::size_t index) {
  std::uint8_t byte = bytes[index / 2];
  return (index % 2 == 0) ? static_cast<std::uint8_t>(byte >> 4) : static_cast<std::uint8_t>(byte & 0x0f);
}

unsigned readDecimal(const Bytes& bytes, std::size_t first, std::size_t count) {
  unsigned value = 0;
  for (std::size_t i = first; i < first + count; ++i) {
    value = value * 10 + nibble(bytes, i);
  }
  return value;
}

void writeDecimal(std::array<std::uint8_t, kTimestampDigits>& digits, std::size_t first,
                  std::size_t count, unsigned value) {
  for (std::size_t i = first + count; i > first; --i) {
    digits[i - 1] = static_cast<std::uint8_t>(value % 10);
    value /= 10;
  }
}

}  // namespace

Result<Bytes> Codec::pack(const Fields& fields) {
  if (!util::Time::inRange(fields.timestamp)) {
    return makeErrorResult<Bytes>(ErrorCode::kOutOfRange,
                                  "Timestamp outside 1970-01-01T00:00:00Z..9999-12-31T23:59:59.9999Z");
  }

  auto dt = util::Time::toDateTime(fields.timestamp);

  std::array<std::uint8_t, kTimestampDigits> digits{};
  writeDecimal(digits, 0, 4, static_cast<unsigned>(dt.year));
  writeDecimal(digits, 4, 2, dt.month);
  writeDecimal(digits, 6, 2, dt.day);
  writeDecimal(digits, 8, 2, dt.hour);
  writeDecimal(digits, 10, 2, dt.minute);
  writeDecimal(digits, 12, 2, dt.second);
  writeDecimal(digits, 14, 4, dt.tick);

  Bytes bytes{};
  for (std::size_t i = 0; i < kTimestampDigits / 2; ++i) {
    bytes[i] = static_cast<std::uint8_t>((digits[2 * i] << 4) | digits[2 * i + 1]);
  }
  bytes[kUserDataOffset] = fields.user_data;
  std::copy(fields.nonce.begin(), fields.nonce.end(), bytes.begin() + kNonceOffset);

  return bytes;
}

Result<Fields> Codec::unpack(const Bytes& bytes) {
  for (std::size_t i = 0; i < kTimestampDigits; ++i) {
    if (nibble(bytes, i) > 9) {
      return makeErrorResult<Fields>(ErrorCode::kFormatError,
                                     "HLID invalid value: non-decimal timestamp digit at position " +
                                         std::to_string(i));
    }
  }

  util::DateTime dt;
  dt.year = static_cast<int>(readDecimal(bytes, 0, 4));
  dt.month = readDecimal(bytes, 4, 2);
  dt.day = readDecimal(bytes, 6, 2);
  dt.hour = readDecimal(bytes, 8, 2);
  dt.minute = readDecimal(bytes, 10, 2);
  dt.second = readDecimal(bytes, 12, 2);
  dt.tick = readDecimal(bytes, 14, 4);

  auto timestamp = util::Time::fromDateTime(dt);
  if (!timestamp.has_value()) {
    return makeErrorResult<Fields>(ErrorCode::kFormatError,
                                   "HLID invalid value: " + timestamp.error().message());
  }

  Fields fields;
  fields.timestamp = *timestamp;
  fields.user_data = bytes[kUserDataOffset];
  std::copy_n(bytes.begin() + kNonceOffset, kNonceLength, fields.nonce.begin());
  return fields;
}

util::TickTime Codec::timestampOf(const Bytes& bytes) {
  std::chrono::year_month_day ymd{std::chrono::year{static_cast<int>(readDecimal(bytes, 0, 4))},
                                  std::chrono::month{readDecimal(bytes, 4, 2)},
                                  std::chrono::day{readDecimal(bytes, 6, 2)}};
  return util::TickTime{std::chrono::sys_days{ymd}} + std::chrono::hours{readDecimal(bytes, 8, 2)} +
         std::chrono::minutes{readDecimal(bytes, 10, 2)} +
         std::chrono::seconds{readDecimal(bytes, 12, 2)} + util::Ticks{readDecimal(bytes, 14, 4)};
}

std::string Codec::toHex(const Bytes& bytes) {
  std::string hex;
  hex.reserve(kHexLength);
  for (auto byte : bytes) {
    hex += kHexDigits[byte >> 4];
    hex += kHexDigits[byte & 0x0f];
  }
  return hex;
}

std::string Codec::toText(const Bytes& bytes) {
  std::string text = toHex(bytes);
  for (auto position : kDashPositions) {
    text.insert(position, 1, '-');
  }
  return text;
}

Result<Bytes> Codec::decode(std::string_view text) {
  std::string hex;
  hex.reserve(kHexLength);

  if (text.size() == kTextLength) {
    for (std::size_t i = 0; i < text.size(); ++i) {
      bool dash_expected = std::find(kDashPositions.begin(), kDashPositions.end(), i) != kDashPositions.end();
      if (dash_expected != (text[i] == '-')) {
        return makeErrorResult<Bytes>(ErrorCode::kFormatError,
                                      "HLID invalid value: misplaced dash at position " + std::to_string(i));
      }
      if (!dash_expected) {
        hex += text[i];
      }
    }
  } else if (text.size() == kHexLength) {
    hex.assign(text);
  } else {
    return makeErrorResult<Bytes>(ErrorCode::kFormatError,
                                  "HLID invalid value: expected " + std::to_string(kTextLength) +
                                      " or " + std::to_string(kHexLength) + " characters, got " +
                                      std::to_string(text.size()));
  }

  Bytes bytes{};
  for (std::size_t i = 0; i < kHexLength; ++i) {
    int value = decodeHexChar(hex[i]);
    if (value < 0) {
      return makeErrorResult<Bytes>(ErrorCode::kFormatError,
                                    "HLID invalid value: non-hex character at position " + std::to_string(i));
    }
    if (i % 2 == 0) {
      bytes[i / 2] = static_cast<std::uint8_t>(value << 4);
    } else {
      bytes[i / 2] |= static_cast<std::uint8_t>(value);
    }
  }

  auto fields = unpack(bytes);
  if (!fields.has_value()) {
    return std::unexpected(fields.error());
  }

  return bytes;
}

std::string Codec::signedPrefix(const Bytes& bytes) {
  return toText(bytes).substr(0, kSignedPrefixLength);
}

Result<std::uint8_t> Codec::parseUserData(std::string_view user_data) {
  if (user_data.empty()) {
    return makeErrorResult<std::uint8_t>(ErrorCode::kInvalidArgument, "HLID user-data cannot be empty.");
  }
  if (user_data.size() != 2) {
    return makeErrorResult<std::uint8_t>(ErrorCode::kInvalidArgument,
                                         "HLID user-data must be exactly 2 characters, got " +
                                             std::to_string(user_data.size()) + ".");
  }

  if (std::any_of(user_data.begin(), user_data.end(), [](char c) { return c >= 'A' && c <= 'Z'; })) {
    return makeErrorResult<std::uint8_t>(ErrorCode::kInvalidArgument,
                                         "HLID user-data must be lowercase, got '" +
                                             std::string(user_data) + "'.");
  }
  int high = decodeHexChar(user_data[0]);
  int low = decodeHexChar(user_data[1]);
  if (high < 0 || low < 0) {
    return makeErrorResult<std::uint8_t>(ErrorCode::kInvalidArgument,
                                         "HLID user-data must contain only hex characters, got '" +
                                             std::string(user_data) + "'.");
  }

  return static_cast<std::uint8_t>((high << 4) | low);
}

std::string Codec::formatUserData(std::uint8_t user_data) {
  return {kHexDigits[user_data >> 4], kHexDigits[user_data & 0x0f]};
}

}  // namespace hlid::core
