#include "hlid/core/generator.hpp"

#include <algorithm>

#include <spdlog/spdlog.h>

#include "hlid/crypto/hmac.hpp"
#include "hlid/crypto/random.hpp"
#include "hlid/util/security.hpp"

namespace hlid::core {

Result<Nonce> RandomNonceSource::next() {
  Nonce nonce{};
  auto filled = crypto::Random::fill(nonce);
  if (!filled.has_value()) {
    return std::unexpected(filled.error());
  }
  return nonce;
}

Generator::Generator() : nonce_source_(std::make_shared<RandomNonceSource>()) {}

Generator::Generator(std::shared_ptr<NonceSource> nonce_source)
    : nonce_source_(std::move(nonce_source)) {
  if (!nonce_source_) {
    nonce_source_ = std::make_shared<RandomNonceSource>();
  }
}

Result<Hlid> Generator::generate(const GenerateOptions& options) const {
  return generate(util::Time::now(), options);
}

Result<Hlid> Generator::generate(std::chrono::system_clock::time_point timestamp,
                                 const GenerateOptions& options) const {
  return generate(util::Time::toTicks(timestamp), options);
}

Result<Hlid> Generator::generate(util::TickTime timestamp, const GenerateOptions& options) const {
  // Reject weak secrets before touching the clock digits or the hash
  if (options.secret) {
    auto strength = util::Security::checkSecretStrength(*options.secret);
    if (!strength.has_value()) {
      return std::unexpected(strength.error());
    }
  }

  Fields fields;
  fields.timestamp = timestamp;
  fields.user_data = options.user_data;

  auto bytes = Codec::pack(fields);
  if (!bytes.has_value()) {
    return std::unexpected(bytes.error());
  }

  Result<Nonce> nonce = options.secret ? deriveNonce(*bytes, *options.secret) : nonce_source_->next();
  if (!nonce.has_value()) {
    return std::unexpected(nonce.error());
  }
  std::copy(nonce->begin(), nonce->end(), bytes->begin() + kNonceOffset);

  Hlid id(*bytes, options.secret.has_value());
  spdlog::trace("Generated {} HLID {}", id.isSigned() ? "keyed" : "random", id.toString());
  return id;
}

Result<void> Generator::verify(const Hlid& id, std::string_view secret) {
  auto strength = util::Security::checkSecretStrength(secret);
  if (!strength.has_value()) {
    return strength;
  }

  auto expected = deriveNonce(id.bytes(), secret);
  if (!expected.has_value()) {
    return std::unexpected(expected.error());
  }

  auto actual = id.nonce();
  if (!crypto::Hmac::constantTimeEqual(*expected, actual)) {
    spdlog::debug("HMAC check failed for {} with secret {}", id.toString(),
                  util::Security::maskSensitive(secret));
    return makeErrorResult<void>(ErrorCode::kHmacMismatch, "HLID fails HMAC check.");
  }

  return {};
}

Result<Nonce> Generator::deriveNonce(const Bytes& bytes, std::string_view secret) {
  auto digest = crypto::Hmac::sha256(secret, Codec::signedPrefix(bytes));
  if (!digest.has_value()) {
    return std::unexpected(digest.error());
  }

  Nonce nonce{};
  std::copy_n(digest->begin(), kNonceLength, nonce.begin());
  util::Security::secureZero(digest->data(), digest->size());
  return nonce;
}

}  // namespace hlid::core
