#include "hlid/crypto/random.hpp"

#include <sodium.h>

#include "hlid/crypto/hmac.hpp"

namespace hlid::crypto {

Result<void> Random::fill(std::span<std::uint8_t> buffer) {
  auto init = ensureSodiumInit();
  if (!init.has_value()) {
    return init;
  }

  if (!buffer.empty()) {
    randombytes_buf(buffer.data(), buffer.size());
  }
  return {};
}

}  // namespace hlid::crypto
