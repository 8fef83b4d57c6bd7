#include <gtest/gtest.h>
#include <popchain/testing/common.hpp>

#include <array>
#include <cstdio>
#include <filesystem>
#include <string>
#include <string_view>
#include <utility>

#include <sys/wait.h>

#ifndef POPCHAIN_CLI_PATH
#define POPCHAIN_CLI_PATH ""
#endif

namespace {

std::string shell_quote(const std::string_view value) {
  auto out = std::string{"'"};
  for (const auto ch : value) {
    if (ch == '\'') {
      out += "'\\''";
    } else {
      out.push_back(ch);
    }
  }
  out.push_back('\'');
  return out;
}

// Exit code of the command, or -1 when it did not exit normally.
std::pair<int, std::string> run_capture(const std::string& command) {
  auto buffer = std::array<char, 256>{};
  auto output = std::string{};
  auto* pipe = popen(command.c_str(), "r");
  if (pipe == nullptr) {
    return {-1, {}};
  }
  while (fgets(buffer.data(), static_cast<int>(buffer.size()), pipe) !=
         nullptr) {
    output += buffer.data();
  }
  auto status = pclose(pipe);
  if (status == -1 || WIFEXITED(status) == 0) {
    return {-1, output};
  }
  return {WEXITSTATUS(status), output};
}

class cli_workspace final {
 public:
  explicit cli_workspace(const std::string_view prefix)
      : root_{popchain::testing::make_db_path(prefix)} {
    std::filesystem::create_directories(root_);
  }

  cli_workspace(const cli_workspace&) = delete;
  cli_workspace& operator=(const cli_workspace&) = delete;

  ~cli_workspace() { popchain::testing::remove_path(root_); }

  std::pair<int, std::string> run(const std::string& cli,
                                  const std::string_view args) const {
    auto command = shell_quote(cli) + " " + std::string{args} + " --db " +
                   shell_quote(root_ + "/db") + " --log-file " +
                   shell_quote(root_ + "/popchain.log") + " 2>/dev/null";
    return run_capture(command);
  }

 private:
  std::string root_;
};

}  // namespace

TEST(cli, transfer_without_sender_is_refused) {
  auto cli = std::string{POPCHAIN_CLI_PATH};
  if (cli.empty() || !std::filesystem::exists(cli)) {
    GTEST_SKIP() << "popchain binary not available: " << cli;
  }
  auto workspace = cli_workspace{"popchain_cli_transfer"};

  auto [exit_code, output] =
      workspace.run(cli, "transfer --account 0x1 --certificate 0x2");
  EXPECT_NE(exit_code, 0) << output;
  EXPECT_EQ(output.find("code:"), std::string::npos) << output;

  auto [info_code, info] = workspace.run(cli, "info");
  ASSERT_EQ(info_code, 0) << info;
  EXPECT_NE(info.find("sequence 0"), std::string::npos) << info;
}

TEST(cli, transfer_with_sender_reaches_the_engine) {
  auto cli = std::string{POPCHAIN_CLI_PATH};
  if (cli.empty() || !std::filesystem::exists(cli)) {
    GTEST_SKIP() << "popchain binary not available: " << cli;
  }
  auto workspace = cli_workspace{"popchain_cli_transfer_sender"};

  auto [exit_code, output] = workspace.run(
      cli, "transfer --sender 0xFEED --account 0x1 --certificate 0x2");
  EXPECT_EQ(exit_code, 2) << output;
  EXPECT_NE(output.find("account_missing"), std::string::npos) << output;
}

TEST(cli, linking_a_wallet_requires_sender) {
  auto cli = std::string{POPCHAIN_CLI_PATH};
  if (cli.empty() || !std::filesystem::exists(cli)) {
    GTEST_SKIP() << "popchain binary not available: " << cli;
  }
  auto workspace = cli_workspace{"popchain_cli_link"};

  auto [refused, refused_output] =
      workspace.run(cli, "upsert-account --account 0x1 --owner 0xABC");
  EXPECT_NE(refused, 0) << refused_output;

  auto [linked, linked_output] = workspace.run(
      cli, "upsert-account --account 0x1 --owner 0xABC --sender 0xABC");
  EXPECT_EQ(linked, 0) << linked_output;

  auto [shown, account] = workspace.run(cli, "account --account 0x1");
  ASSERT_EQ(shown, 0) << account;
  EXPECT_NE(account.find("abc"), std::string::npos) << account;
}
