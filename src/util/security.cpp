#include "hlid/util/security.hpp"

#include <algorithm>

#include <sodium.h>

namespace hlid::util {

std::string Security::maskSensitive(std::string_view sensitive, size_t reveal_chars) {
  if (sensitive.empty()) {
    return "[empty]";
  }

  if (sensitive.length() <= reveal_chars * 4) {
    // Too short to reveal anything safely
    return std::string(std::min(sensitive.length(), size_t(8)), '*');
  }

  std::string masked;
  masked.reserve(reveal_chars * 2 + 12);

  masked.append(sensitive.substr(0, reveal_chars));

  size_t middle_length = sensitive.length() - (reveal_chars * 2);
  masked.append(std::min(middle_length, size_t(12)), '*');

  masked.append(sensitive.substr(sensitive.length() - reveal_chars));

  return masked;
}

Result<void> Security::checkSecretStrength(std::string_view secret) {
  if (secret.size() < kMinSecretBytes) {
    return makeErrorResult<void>(ErrorCode::kWeakSecret,
                                 "HLID secret too short; must be " +
                                     std::to_string(kMinSecretBytes) + " bytes or longer, got " +
                                     std::to_string(secret.size()));
  }
  return {};
}

void Security::secureZero(void* data, size_t size) {
  if (!data || size == 0) {
    return;
  }
  sodium_memzero(data, size);
}

void Security::clearSensitiveString(std::string& sensitive) {
  if (!sensitive.empty()) {
    secureZero(sensitive.data(), sensitive.size());
    sensitive.clear();

    // Force deallocation to ensure memory is not accessible
    sensitive.shrink_to_fit();
  }
}

// SensitiveString implementation

SensitiveString::SensitiveString(std::string value) : value_(std::move(value)) {}

SensitiveString::SensitiveString(SensitiveString&& other) noexcept : value_(std::move(other.value_)) {
  other.clear();
}

SensitiveString& SensitiveString::operator=(SensitiveString&& other) noexcept {
  if (this != &other) {
    clear();
    value_ = std::move(other.value_);
    other.clear();
  }
  return *this;
}

SensitiveString::~SensitiveString() {
  clear();
}

void SensitiveString::clear() {
  Security::clearSensitiveString(value_);
}

} // namespace hlid::util
