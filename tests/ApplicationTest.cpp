#include "Application.hpp"
#include "TestTree.hpp"

#include <iostream>
#include <nlohmann/json.hpp>
#include <string>
#include <utility>
#include <vector>

using json = nlohmann::json;

namespace drivesage {
namespace {

class ApplicationTest : public test::TestTree {
protected:
  // Settings file keeping the database inside the scratch directory.
  CliOptions jsonOptions(const std::string &command,
                         std::vector<std::string> arguments) {
    json settings = {{"databasePath", (root / "state" / "history.db").string()}};
    auto configPath = writeFile("state/settings.json", settings.dump());

    CliOptions options;
    options.jsonOutput = true;
    options.configPath = configPath.string();
    options.command = command;
    options.arguments = std::move(arguments);
    return options;
  }

  int runCapturingStdout(const CliOptions &options, std::string &captured) {
    ::testing::internal::CaptureStdout();
    int exitCode = runCommand(options);
    captured = ::testing::internal::GetCapturedStdout();
    return exitCode;
  }
};

TEST_F(ApplicationTest, JsonAnalyzePrintsOnlyTheResponse) {
  writeFile("drive/a/x.txt", 4);
  writeFile("drive/b/x.txt", 4);
  auto *coutBuffer = std::cout.rdbuf();

  std::string captured;
  int exitCode =
      runCapturingStdout(jsonOptions("analyze", {(root / "drive").string()}),
                         captured);

  EXPECT_EQ(exitCode, 0);
  EXPECT_EQ(std::cout.rdbuf(), coutBuffer);
  ASSERT_EQ(captured.find("[Analyzer]"), std::string::npos) << captured;

  json response;
  ASSERT_NO_THROW(response = json::parse(captured)) << captured;
  EXPECT_TRUE(response["success"].get<bool>());
  EXPECT_EQ(response["data"]["metadata"]["fileCount"], 2);
  EXPECT_EQ(response["data"]["duplicates"].size(), 1u);
}

TEST_F(ApplicationTest, JsonFailureIsStillADocument) {
  std::string captured;
  int exitCode = runCapturingStdout(
      jsonOptions("analyze", {(root / "missing").string()}), captured);

  EXPECT_EQ(exitCode, 1);
  json response;
  ASSERT_NO_THROW(response = json::parse(captured)) << captured;
  EXPECT_FALSE(response["success"].get<bool>());
  EXPECT_NE(response["error"].get<std::string>().find("path does not exist"),
            std::string::npos);
}

TEST_F(ApplicationTest, JsonOrganizeDryRunPrintsOnlyTheResult) {
  writeFile("drive/inbox/photo.jpg", 3);
  writeFile("drive/inbox/.DS_Store", 1);

  std::string captured;
  int exitCode = runCapturingStdout(
      jsonOptions("organize", {(root / "drive").string()}), captured);

  EXPECT_EQ(exitCode, 0);
  json response;
  ASSERT_NO_THROW(response = json::parse(captured)) << captured;
  EXPECT_EQ(response["data"]["summary"]["total"], 2);
  EXPECT_EQ(response["data"]["summary"]["failed"], 0);
  EXPECT_TRUE(std::filesystem::exists(root / "drive" / "inbox" / "photo.jpg"));
}

} // namespace
} // namespace drivesage
