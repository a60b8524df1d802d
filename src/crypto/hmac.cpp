#include "hlid/crypto/hmac.hpp"

#include <sodium.h>
#include <spdlog/spdlog.h>

namespace hlid::crypto {

Result<void> ensureSodiumInit() {
  // sodium_init() returns 0 on first success, 1 if already initialized
  if (sodium_init() < 0) {
    spdlog::error("libsodium initialization failed");
    return makeErrorResult<void>(ErrorCode::kCryptoError, "Failed to initialize libsodium");
  }
  return {};
}

Result<Hmac::Digest> Hmac::sha256(std::span<const std::uint8_t> key,
                                  std::span<const std::uint8_t> message) {
  auto init = ensureSodiumInit();
  if (!init.has_value()) {
    return std::unexpected(init.error());
  }

  crypto_auth_hmacsha256_state state;
  Digest digest{};

  if (crypto_auth_hmacsha256_init(&state, key.data(), key.size()) != 0 ||
      crypto_auth_hmacsha256_update(&state, message.data(), message.size()) != 0 ||
      crypto_auth_hmacsha256_final(&state, digest.data()) != 0) {
    sodium_memzero(&state, sizeof(state));
    return makeErrorResult<Digest>(ErrorCode::kCryptoError, "HMAC-SHA256 computation failed");
  }

  sodium_memzero(&state, sizeof(state));
  return digest;
}

Result<Hmac::Digest> Hmac::sha256(std::string_view key, std::string_view message) {
  return sha256(
      std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t*>(key.data()), key.size()),
      std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t*>(message.data()),
                                    message.size()));
}

bool Hmac::constantTimeEqual(std::span<const std::uint8_t> a,
                             std::span<const std::uint8_t> b) noexcept {
  // Lengths are public; only the contents must not leak through timing
  if (a.size() != b.size()) {
    return false;
  }
  if (a.empty()) {
    return true;
  }
  return sodium_memcmp(a.data(), b.data(), a.size()) == 0;
}

} // namespace hlid::crypto
