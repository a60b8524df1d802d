#pragma once

#include <cstdint>
#include <span>

#include "hlid/common.hpp"

namespace hlid::crypto {

// Cryptographically secure random bytes from libsodium's system source
class Random {
 public:
  // Fill the buffer; fails only if libsodium cannot be initialized
  static Result<void> fill(std::span<std::uint8_t> buffer);

 private:
  Random() = default;
};

}  // namespace hlid::crypto
