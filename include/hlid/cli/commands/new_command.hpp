#pragma once

#include <string>

#include <CLI/CLI.hpp>
#include "hlid/cli/application.hpp"

namespace hlid::cli {

/**
 * @brief Mint one or more identifiers
 * Usage: hlid new [--user-data dd] [--secret S] [--at RFC3339] [-n N] [--hex]
 */
class NewCommand : public Command {
public:
  explicit NewCommand(Application& app);

  Result<int> execute(const GlobalOptions& options) override;
  std::string name() const override { return "new"; }
  std::string description() const override {
    return "Mint new identifiers\n\n"
           "EXAMPLES:\n"
           "  hlid new                                  # Random nonce, current time\n"
           "  hlid new --user-data 0a -n 5              # Five identifiers tagged 0a\n"
           "  hlid new --secret \"$HLID_SECRET\"          # Keyed nonce\n"
           "  hlid new --at 2024-11-05T11:08:52.52Z     # Fixed timestamp";
  }

  void setupCommand(CLI::App* cmd) override;

private:
  Application& app_;

  // Command options
  std::string user_data_;
  std::string secret_;
  std::string at_;
  int count_ = 1;
  bool hex_ = false;
};

} // namespace hlid::cli
