#pragma once

#include <string>

#include <CLI/CLI.hpp>
#include "hlid/cli/application.hpp"

namespace hlid::cli {

/**
 * @brief Decode an identifier and print its fields
 * Usage: hlid inspect <value> [--secret S]
 */
class InspectCommand : public Command {
public:
  explicit InspectCommand(Application& app);

  Result<int> execute(const GlobalOptions& options) override;
  std::string name() const override { return "inspect"; }
  std::string description() const override {
    return "Decode an identifier and show its timestamp, user data and nonce\n\n"
           "With a secret the nonce is checked and reported as signed or not.";
  }

  void setupCommand(CLI::App* cmd) override;

private:
  Application& app_;

  // Command options
  std::string value_;
  std::string secret_;
};

} // namespace hlid::cli
