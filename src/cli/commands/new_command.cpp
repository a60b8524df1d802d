#include "hlid/cli/commands/new_command.hpp"

#include <iostream>
#include <optional>
#include <vector>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "hlid/core/codec.hpp"
#include "hlid/core/generator.hpp"
#include "hlid/util/time.hpp"

namespace hlid::cli {

NewCommand::NewCommand(Application& app) : app_(app) {
}

void NewCommand::setupCommand(CLI::App* cmd) {
  cmd->add_option("--user-data,-u", user_data_, "User-data byte as two lowercase hex characters");
  cmd->add_option("--secret,-s", secret_, "Secret for keyed identifiers (16 bytes or longer)");
  cmd->add_option("--at", at_, "RFC 3339 timestamp to use instead of the current time");
  cmd->add_option("--count,-n", count_, "Number of identifiers to mint")
      ->check(CLI::Range(1, 10000));
  cmd->add_flag("--hex", hex_, "Print without dashes");
}

Result<int> NewCommand::execute(const GlobalOptions& options) {
  const std::string& user_data_text = user_data_.empty() ? app_.config().user_data : user_data_;
  auto user_data = core::Codec::parseUserData(user_data_text);
  if (!user_data.has_value()) {
    return std::unexpected(user_data.error());
  }

  auto secret = app_.resolveSecret(secret_);
  core::GenerateOptions generate_options;
  generate_options.user_data = *user_data;
  if (!secret.empty()) {
    generate_options.secret = secret.view();
    spdlog::debug("Minting keyed identifiers with secret {}", secret.masked());
  }

  std::optional<util::TickTime> at;
  if (!at_.empty()) {
    auto parsed = util::Time::fromRfc3339(at_);
    if (!parsed.has_value()) {
      return std::unexpected(parsed.error());
    }
    at = *parsed;
  }

  core::Generator generator;
  std::vector<std::string> minted;
  minted.reserve(static_cast<size_t>(count_));

  for (int i = 0; i < count_; ++i) {
    auto id = at ? generator.generate(*at, generate_options)
                 : generator.generate(generate_options);
    if (!id.has_value()) {
      return std::unexpected(id.error());
    }
    minted.push_back(hex_ ? id->hex() : id->toString());
  }

  if (options.json || app_.jsonOutput()) {
    nlohmann::json result;
    result["hlids"] = minted;
    result["user_data"] = core::Codec::formatUserData(*user_data);
    result["signed"] = !secret.empty();
    std::cout << result.dump(2) << std::endl;
  } else {
    for (const auto& value : minted) {
      std::cout << value << "\n";
    }
    std::cout.flush();
  }

  return 0;
}

} // namespace hlid::cli
