#include "hlid/cli/commands/inspect_command.hpp"

#include <iostream>

#include <nlohmann/json.hpp>

#include "hlid/core/generator.hpp"
#include "hlid/core/hlid.hpp"
#include "hlid/util/time.hpp"

namespace hlid::cli {

InspectCommand::InspectCommand(Application& app) : app_(app) {
}

void InspectCommand::setupCommand(CLI::App* cmd) {
  cmd->add_option("value", value_, "Identifier, dashed or bare hex")->required();
  cmd->add_option("--secret,-s", secret_, "Secret to check the nonce against");
}

Result<int> InspectCommand::execute(const GlobalOptions& options) {
  auto id = core::Hlid::fromString(value_);
  if (!id.has_value()) {
    return std::unexpected(id.error());
  }

  // Unkeyed identifiers are legitimate, so a mismatch is reported rather than failed
  bool is_signed = false;
  auto secret = app_.resolveSecret(secret_);
  if (!secret.empty()) {
    auto verified = core::Generator::verify(*id, secret.view());
    if (verified.has_value()) {
      is_signed = true;
    } else if (verified.error().code() != ErrorCode::kHmacMismatch) {
      return std::unexpected(verified.error());
    }
  }

  auto timestamp = id->timestamp();
  auto age = std::chrono::duration_cast<std::chrono::nanoseconds>(util::Time::now() - timestamp);

  if (options.json || app_.jsonOutput()) {
    nlohmann::json result;
    result["hlid"] = id->toString();
    result["hex"] = id->hex();
    result["timestamp"] = util::Time::toRfc3339(timestamp);
    result["time"] = id->time();
    result["age"] = id->age();
    result["user_data"] = id->userData();
    result["nonce"] = id->hex().substr(core::kNonceOffset * 2);
    result["signed"] = is_signed;
    std::cout << result.dump(2) << std::endl;
    return 0;
  }

  std::cout << "hlid:      " << id->toString() << "\n";
  std::cout << "hex:       " << id->hex() << "\n";
  std::cout << "timestamp: " << util::Time::toRfc3339(timestamp) << "\n";
  std::cout << "age:       " << util::Time::formatDuration(age) << "\n";
  std::cout << "user_data: " << id->userData() << "\n";
  std::cout << "nonce:     " << id->hex().substr(core::kNonceOffset * 2) << "\n";
  if (!secret.empty()) {
    std::cout << "signed:    " << (is_signed ? "yes" : "no") << "\n";
  }
  std::cout.flush();

  return 0;
}

} // namespace hlid::cli
