#include "hlid/cli/commands/verify_command.hpp"

#include <iostream>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "hlid/core/hlid.hpp"

namespace hlid::cli {

VerifyCommand::VerifyCommand(Application& app) : app_(app) {
}

void VerifyCommand::setupCommand(CLI::App* cmd) {
  cmd->add_option("value", value_, "Identifier, dashed or bare hex")->required();
  cmd->add_option("--secret,-s", secret_, "Secret the identifier was minted with");
}

Result<int> VerifyCommand::execute(const GlobalOptions& options) {
  auto secret = app_.resolveSecret(secret_);
  if (secret.empty()) {
    return std::unexpected(makeError(ErrorCode::kInvalidArgument,
                                     "No secret given; pass --secret or set secret in the config"));
  }

  spdlog::debug("Verifying {} with secret {}", value_, secret.masked());
  auto id = core::Hlid::fromString(value_, secret.view());
  if (!id.has_value()) {
    return std::unexpected(id.error());
  }

  if (options.json || app_.jsonOutput()) {
    nlohmann::json result;
    result["hlid"] = id->toString();
    result["valid"] = true;
    std::cout << result.dump(2) << std::endl;
  } else if (!options.quiet) {
    std::cout << "OK " << id->toString() << std::endl;
  }

  return 0;
}

} // namespace hlid::cli
