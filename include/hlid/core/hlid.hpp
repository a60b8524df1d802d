#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

#include "hlid/common.hpp"
#include "hlid/core/codec.hpp"
#include "hlid/util/time.hpp"

namespace hlid::core {

// Options shared by every way of minting an identifier
struct GenerateOptions {
  std::uint8_t user_data = 0;
  // Keyed mode when set: nonce = first 6 bytes of HMAC-SHA256(secret, prefix)
  std::optional<std::string_view> secret;
};

// HLID (Human Lexicographically sortable IDentifier)
// UUID-shaped, UTC calendar digits first, sortable by time
class Hlid {
 public:
  // Create new HLID with current timestamp and a random or keyed nonce
  static Result<Hlid> generate(const GenerateOptions& options = {});

  // Create HLID with specific timestamp (floored to 10^-4 s)
  static Result<Hlid> generate(std::chrono::system_clock::time_point timestamp,
                               const GenerateOptions& options = {});

  // Create HLID at a tick time; covers the full range up to year 9999
  static Result<Hlid> generate(util::TickTime timestamp, const GenerateOptions& options = {});

  // Parse HLID from dashed or bare hex string
  static Result<Hlid> fromString(std::string_view str);

  // Parse HLID and authenticate its nonce against a secret
  static Result<Hlid> fromString(std::string_view str, std::string_view secret);

  // Wrap raw bytes after validating the calendar digits
  static Result<Hlid> fromBytes(const Bytes& bytes);

  // Canonical dashed representation
  std::string toString() const;

  // Representation without dashes
  std::string hex() const;

  const Bytes& bytes() const noexcept { return bytes_; }

  // Timestamp at tick resolution
  util::TickTime timestamp() const;

  // UTC calendar fields
  util::DateTime datetime() const;

  // Seconds since the epoch
  double time() const;

  // Seconds elapsed since the timestamp, measured on every call
  double age() const;

  // User-data byte as two lowercase hex characters
  std::string userData() const;
  std::uint8_t userDataByte() const noexcept { return bytes_[kUserDataOffset]; }

  Nonce nonce() const noexcept;

  // True if generated or parsed with a secret that verified
  bool isSigned() const noexcept { return signed_; }

  // Comparison operators
  bool operator==(const Hlid& other) const noexcept;
  bool operator!=(const Hlid& other) const noexcept;
  bool operator<(const Hlid& other) const noexcept;
  bool operator<=(const Hlid& other) const noexcept;
  bool operator>(const Hlid& other) const noexcept;
  bool operator>=(const Hlid& other) const noexcept;

  // Hash support for containers
  struct Hash {
    std::size_t operator()(const Hlid& id) const noexcept;
  };

 private:
  friend class Generator;

  Hlid(const Bytes& bytes, bool is_signed) : bytes_(bytes), signed_(is_signed) {}

  Bytes bytes_{};
  bool signed_ = false;
};

std::ostream& operator<<(std::ostream& os, const Hlid& id);

}  // namespace hlid::core

// Hash specialization for std::unordered_map
namespace std {
template <>
struct hash<hlid::core::Hlid> : hlid::core::Hlid::Hash {};
}  // namespace std
