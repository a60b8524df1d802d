#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>

#include "hlid/common.hpp"

namespace hlid::crypto {

/**
 * @brief HMAC-SHA256 backed by libsodium
 */
class Hmac {
public:
  static constexpr std::size_t kDigestSize = 32;
  using Digest = std::array<std::uint8_t, kDigestSize>;

  /**
   * @brief Compute HMAC-SHA256 over a message
   * @param key Key material of any length (hashed first if longer than the block size)
   * @param message Message to authenticate
   * @return 32-byte tag, or kCryptoError if libsodium could not be initialized
   */
  static Result<Digest> sha256(std::span<const std::uint8_t> key,
                               std::span<const std::uint8_t> message);

  /**
   * @brief Convenience overload for text keys and messages, hashed as raw bytes
   */
  static Result<Digest> sha256(std::string_view key, std::string_view message);

  /**
   * @brief Compare two buffers in time independent of their contents
   * @return true if the buffers have equal length and contents
   */
  static bool constantTimeEqual(std::span<const std::uint8_t> a,
                                std::span<const std::uint8_t> b) noexcept;

private:
  Hmac() = default;
};

/**
 * @brief Initialize libsodium once per process; safe to call from any thread
 */
Result<void> ensureSodiumInit();

} // namespace hlid::crypto
