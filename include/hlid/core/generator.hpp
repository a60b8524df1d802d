#pragma once

#include <chrono>
#include <memory>
#include <string_view>

#include "hlid/common.hpp"
#include "hlid/core/codec.hpp"
#include "hlid/core/hlid.hpp"
#include "hlid/util/time.hpp"

namespace hlid::core {

// Abstract nonce source so tests can substitute deterministic bytes
class NonceSource {
 public:
  virtual ~NonceSource() = default;

  // Produce the 6 nonce bytes for one unkeyed identifier
  virtual Result<Nonce> next() = 0;

 protected:
  NonceSource() = default;
  NonceSource(const NonceSource&) = default;
  NonceSource& operator=(const NonceSource&) = default;
};

// Production source: libsodium randombytes_buf
class RandomNonceSource final : public NonceSource {
 public:
  Result<Nonce> next() override;
};

// Mints identifiers in random or keyed mode and verifies keyed ones.
// Stateless apart from the nonce source; safe to share across threads
// when the source is.
class Generator {
 public:
  Generator();
  explicit Generator(std::shared_ptr<NonceSource> nonce_source);

  // Current wall-clock time
  Result<Hlid> generate(const GenerateOptions& options = {}) const;

  // Supplied wall-clock time, floored to tick resolution. system_clock counts
  // nanoseconds on common platforms and cannot reach past 2262; use the
  // TickTime overload for later dates.
  Result<Hlid> generate(std::chrono::system_clock::time_point timestamp,
                        const GenerateOptions& options = {}) const;

  // Supplied tick count
  Result<Hlid> generate(util::TickTime timestamp, const GenerateOptions& options = {}) const;

  // Re-derive the keyed nonce and compare in constant time.
  // Success is an empty result; a mismatch is kHmacMismatch, never a false value.
  static Result<void> verify(const Hlid& id, std::string_view secret);

  // First 6 bytes of HMAC-SHA256(secret, Codec::signedPrefix(bytes))
  static Result<Nonce> deriveNonce(const Bytes& bytes, std::string_view secret);

 private:
  std::shared_ptr<NonceSource> nonce_source_;
};

}  // namespace hlid::core
