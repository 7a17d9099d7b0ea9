#include "OrganizationPlanner.hpp"
#include <gtest/gtest.h>

#include <filesystem>

namespace fs = std::filesystem;

namespace drivesage {
namespace {

FolderProfile makeFolder(const std::string &path,
                         const std::vector<std::string> &names) {
  FolderProfile folder;
  folder.path = path;
  folder.name = fs::path(path).filename().string();
  for (const auto &name : names)
    folder.looseFiles.push_back({name, 1, 0});
  folder.fileCount = static_cast<std::int64_t>(names.size());
  folder.size = folder.fileCount;
  return folder;
}

TEST(OrganizationPlannerTest, MapsExtensionsToFolders) {
  EXPECT_EQ(OrganizationPlanner::destinationFolder("jpg"), "Images");
  EXPECT_EQ(OrganizationPlanner::destinationFolder("JPEG"), "Images");
  EXPECT_EQ(OrganizationPlanner::destinationFolder("gif"), "Images");
  EXPECT_EQ(OrganizationPlanner::destinationFolder("docx"), "Documents");
  EXPECT_EQ(OrganizationPlanner::destinationFolder("txt"), "Documents");
  EXPECT_EQ(OrganizationPlanner::destinationFolder("mov"), "Videos");
  EXPECT_EQ(OrganizationPlanner::destinationFolder("wav"), "Audio");
  EXPECT_FALSE(OrganizationPlanner::destinationFolder("zip").has_value());
  EXPECT_FALSE(OrganizationPlanner::destinationFolder("").has_value());
}

TEST(OrganizationPlannerTest, MovesKnownLooseFilesBesideThemselves) {
  AnalysisReport report;
  report.folders.push_back(makeFolder(
      "/drive/inbox", {"photo.JPG", "clip.mp4", "archive.zip", ".hidden.png",
                       "README", "song.final.mp3"}));

  OrganizationPlanner planner;
  auto operations = planner.plan(report);

  ASSERT_EQ(operations.size(), 3u);
  auto first = std::get<MoveOperation>(operations[0]);
  EXPECT_EQ(fs::path(first.source), fs::path("/drive/inbox/photo.JPG"));
  EXPECT_EQ(fs::path(first.destination),
            fs::path("/drive/inbox/Images/photo.JPG"));
  EXPECT_EQ(fs::path(std::get<MoveOperation>(operations[1]).destination),
            fs::path("/drive/inbox/Videos/clip.mp4"));
  EXPECT_EQ(fs::path(std::get<MoveOperation>(operations[2]).destination),
            fs::path("/drive/inbox/Audio/song.final.mp3"));
}

TEST(OrganizationPlannerTest, DeletesSystemFilesAfterMoves) {
  AnalysisReport report;
  report.folders.push_back(makeFolder("/drive/docs", {"cv.pdf"}));
  FileRecord clutter;
  clutter.name = ".DS_Store";
  clutter.path = "/drive/docs/.DS_Store";
  report.systemFiles.push_back(clutter);

  OrganizationPlanner planner;
  auto operations = planner.plan(report);

  ASSERT_EQ(operations.size(), 2u);
  EXPECT_TRUE(std::holds_alternative<MoveOperation>(operations[0]));
  ASSERT_TRUE(std::holds_alternative<DeleteOperation>(operations[1]));
  EXPECT_EQ(std::get<DeleteOperation>(operations[1]).path,
            "/drive/docs/.DS_Store");
}

TEST(OrganizationPlannerTest, EmptyReportPlansNothing) {
  OrganizationPlanner planner;
  EXPECT_TRUE(planner.plan(AnalysisReport{}).empty());
}

} // namespace
} // namespace drivesage
