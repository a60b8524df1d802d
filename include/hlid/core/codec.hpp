#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include "hlid/common.hpp"
#include "hlid/util/time.hpp"

namespace hlid::core {

// Layout of an identifier:
//
//   20241105-1108-5252-00ff-8fa646f09a7e
//   ^        ^    ^ ^  ^ ^  ^
//   |        |    | |  | |  `- 12 hex: nonce or truncated HMAC (bytes 10-15)
//   |        |    | |  | `- 2 hex: user-data byte (byte 9)
//   |        |    | `--+- 4 digits: ticks of 10^-4 s (0000-9999)
//   |        |    `- 2 digits: seconds
//   |        `- 4 digits: hours and minutes
//   `- 8 digits: year, month and day
//
// The 18 leading decimal digits are stored as packed BCD in bytes 0-8, so
// byte order, text order and chronological order all agree.
inline constexpr std::size_t kBinaryLength = 16;
inline constexpr std::size_t kHexLength = kBinaryLength * 2;
inline constexpr std::size_t kTextLength = kHexLength + 4;
inline constexpr std::size_t kTimestampDigits = 18;
inline constexpr std::size_t kUserDataOffset = 9;
inline constexpr std::size_t kNonceOffset = 10;
inline constexpr std::size_t kNonceLength = 6;
inline constexpr std::size_t kSignedPrefixLength = 23;  // "YYYYMMDD-HHmm-SSss-ssdd"

using Bytes = std::array<std::uint8_t, kBinaryLength>;
using Nonce = std::array<std::uint8_t, kNonceLength>;

// Decoded fields of an identifier
struct Fields {
  util::TickTime timestamp;
  std::uint8_t user_data = 0;
  Nonce nonce{};
};

// Conversions between the binary value, the bare hex form and the dashed text form
class Codec {
 public:
  // Pack fields into the binary layout; fails if the timestamp is out of range
  static Result<Bytes> pack(const Fields& fields);

  // Unpack and validate the calendar digits of a binary value
  static Result<Fields> unpack(const Bytes& bytes);

  // Timestamp of a value that already passed unpack(); reads the digits without re-validating
  static util::TickTime timestampOf(const Bytes& bytes);

  // 32 lowercase hex characters
  static std::string toHex(const Bytes& bytes);

  // Canonical 8-4-4-4-12 dashed form
  static std::string toText(const Bytes& bytes);

  // Accept the dashed form or bare hex, any case; reject anything else
  static Result<Bytes> decode(std::string_view text);

  // Message authenticated in keyed mode: the dashed timestamp and user-data prefix
  static std::string signedPrefix(const Bytes& bytes);

  // Parse a user-data byte given as exactly two lowercase hex characters
  static Result<std::uint8_t> parseUserData(std::string_view user_data);

  // Render a user-data byte as two lowercase hex characters
  static std::string formatUserData(std::uint8_t user_data);

 private:
  Codec() = default;
};

}  // namespace hlid::core
