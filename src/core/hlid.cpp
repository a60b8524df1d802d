#include "hlid/core/hlid.hpp"

#include <algorithm>
#include <functional>

#include "hlid/core/generator.hpp"

namespace hlid::core {

Result<Hlid> Hlid::generate(const GenerateOptions& options) {
  return Generator().generate(options);
}

Result<Hlid> Hlid::generate(std::chrono::system_clock::time_point timestamp,
                            const GenerateOptions& options) {
  return Generator().generate(timestamp, options);
}

Result<Hlid> Hlid::generate(util::TickTime timestamp, const GenerateOptions& options) {
  return Generator().generate(timestamp, options);
}

Result<Hlid> Hlid::fromString(std::string_view str) {
  auto bytes = Codec::decode(str);
  if (!bytes.has_value()) {
    return std::unexpected(bytes.error());
  }
  return Hlid(*bytes, false);
}

Result<Hlid> Hlid::fromString(std::string_view str, std::string_view secret) {
  auto id = fromString(str);
  if (!id.has_value()) {
    return id;
  }

  auto verified = Generator::verify(*id, secret);
  if (!verified.has_value()) {
    return std::unexpected(verified.error());
  }

  return Hlid(id->bytes_, true);
}

Result<Hlid> Hlid::fromBytes(const Bytes& bytes) {
  auto fields = Codec::unpack(bytes);
  if (!fields.has_value()) {
    return std::unexpected(fields.error());
  }
  return Hlid(bytes, false);
}

std::string Hlid::toString() const {
  return Codec::toText(bytes_);
}

std::string Hlid::hex() const {
  return Codec::toHex(bytes_);
}

util::TickTime Hlid::timestamp() const {
  return Codec::timestampOf(bytes_);
}

util::DateTime Hlid::datetime() const {
  return util::Time::toDateTime(timestamp());
}

double Hlid::time() const {
  return util::Time::toSeconds(timestamp());
}

double Hlid::age() const {
  return std::chrono::duration<double>(util::Time::now() - timestamp()).count();
}

std::string Hlid::userData() const {
  return Codec::formatUserData(userDataByte());
}

Nonce Hlid::nonce() const noexcept {
  Nonce nonce{};
  std::copy_n(bytes_.begin() + kNonceOffset, kNonceLength, nonce.begin());
  return nonce;
}

bool Hlid::operator==(const Hlid& other) const noexcept {
  return bytes_ == other.bytes_;
}

bool Hlid::operator!=(const Hlid& other) const noexcept {
  return !(*this == other);
}

bool Hlid::operator<(const Hlid& other) const noexcept {
  return bytes_ < other.bytes_;
}

bool Hlid::operator<=(const Hlid& other) const noexcept {
  return bytes_ <= other.bytes_;
}

bool Hlid::operator>(const Hlid& other) const noexcept {
  return bytes_ > other.bytes_;
}

bool Hlid::operator>=(const Hlid& other) const noexcept {
  return bytes_ >= other.bytes_;
}

std::size_t Hlid::Hash::operator()(const Hlid& id) const noexcept {
  std::string_view raw(reinterpret_cast<const char*>(id.bytes_.data()), id.bytes_.size());
  return std::hash<std::string_view>{}(raw);
}

std::ostream& operator<<(std::ostream& os, const Hlid& id) {
  return os << id.toString();
}

}  // namespace hlid::core
