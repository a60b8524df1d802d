#pragma once

#include <cstddef>
#include <string>
#include <string_view>

#include "hlid/common.hpp"

namespace hlid::util {

/**
 * @brief Utilities for secure handling of HMAC secrets
 */
class Security {
public:
  // Minimum key material for keyed identifiers: 128 bits
  static constexpr std::size_t kMinSecretBytes = 16;

  /**
   * @brief Mask sensitive strings for logging/debug output
   * @param sensitive The sensitive string to mask
   * @param reveal_chars Number of characters to reveal at start/end (default: 2)
   * @return Masked string showing only first/last few characters
   */
  static std::string maskSensitive(std::string_view sensitive, size_t reveal_chars = 2);

  /**
   * @brief Check that a secret carries at least kMinSecretBytes of key material
   * @return kWeakSecret error if the secret is too short
   */
  static Result<void> checkSecretStrength(std::string_view secret);

  /**
   * @brief Securely zero out memory containing sensitive data
   * @param data Pointer to sensitive data
   * @param size Size of data in bytes
   */
  static void secureZero(void* data, size_t size);

  /**
   * @brief Clear sensitive string contents securely
   * @param sensitive String containing sensitive data
   */
  static void clearSensitiveString(std::string& sensitive);

private:
  Security() = default;
};

/**
 * @brief RAII wrapper for secrets that auto-clears on destruction
 */
class SensitiveString {
public:
  SensitiveString() = default;
  explicit SensitiveString(std::string value);
  SensitiveString(const SensitiveString&) = delete;
  SensitiveString& operator=(const SensitiveString&) = delete;
  SensitiveString(SensitiveString&& other) noexcept;
  SensitiveString& operator=(SensitiveString&& other) noexcept;
  ~SensitiveString();

  const std::string& value() const { return value_; }
  std::string_view view() const { return value_; }
  std::string masked() const { return Security::maskSensitive(value_); }
  bool empty() const { return value_.empty(); }
  size_t size() const { return value_.size(); }

  void clear();

private:
  std::string value_;
};

} // namespace hlid::util
