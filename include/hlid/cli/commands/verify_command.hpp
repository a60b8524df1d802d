#pragma once

#include <string>

#include <CLI/CLI.hpp>
#include "hlid/cli/application.hpp"

namespace hlid::cli {

/**
 * @brief Check a keyed identifier against a secret
 * Usage: hlid verify <value> [--secret S]
 */
class VerifyCommand : public Command {
public:
  explicit VerifyCommand(Application& app);

  Result<int> execute(const GlobalOptions& options) override;
  std::string name() const override { return "verify"; }
  std::string description() const override {
    return "Verify that an identifier was minted with the given secret\n\n"
           "Exits 0 on a match and 1 otherwise. The secret falls back to the configuration.";
  }

  void setupCommand(CLI::App* cmd) override;

private:
  Application& app_;

  // Command options
  std::string value_;
  std::string secret_;
};

} // namespace hlid::cli
