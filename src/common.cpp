#include "hlid/common.hpp"

#include <sstream>

#include "hlid/version.hpp"

namespace hlid {

std::string_view errorCodeToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::kSuccess:
      return "Success";
    case ErrorCode::kInvalidArgument:
      return "Invalid argument";
    case ErrorCode::kFormatError:
      return "Format error";
    case ErrorCode::kOutOfRange:
      return "Out of range";
    case ErrorCode::kWeakSecret:
      return "Weak secret";
    case ErrorCode::kHmacMismatch:
      return "HMAC mismatch";
    case ErrorCode::kCryptoError:
      return "Crypto error";
    case ErrorCode::kParseError:
      return "Parse error";
    case ErrorCode::kConfigError:
      return "Configuration error";
    case ErrorCode::kUnknownError:
      return "Unknown error";
  }
  return "Unknown error";
}

std::string Version::toString() const {
  std::ostringstream oss;
  oss << major << "." << minor << "." << patch;
  if (!build.empty()) {
    oss << "+" << build;
  }
  return oss.str();
}

Version getVersion() {
  Version version;
  version.major = build_info::kVersionMajor;
  version.minor = build_info::kVersionMinor;
  version.patch = build_info::kVersionPatch;

  std::string build_type = build_info::kBuildType;
  if (build_type == "Debug") {
    version.build = "debug";
  }
  return version;
}

}  // namespace hlid
