#include "FileSystemScanner.hpp"
#include "TestTree.hpp"

#include <algorithm>
#include <chrono>
#include <numeric>

namespace fs = std::filesystem;

namespace drivesage {
namespace {

class FileSystemScannerTest : public test::TestTree {};

TEST_F(FileSystemScannerTest, ListsChildrenInNameOrder) {
  writeFile("c.txt", 1);
  writeFile("a.txt", 1);
  makeDir("b");

  FileSystemScanner scanner(root.string());
  auto children = scanner.listDirectory(root);

  ASSERT_EQ(children.size(), 3u);
  EXPECT_EQ(children[0].filename(), "a.txt");
  EXPECT_EQ(children[1].filename(), "b");
  EXPECT_EQ(children[2].filename(), "c.txt");
}

TEST_F(FileSystemScannerTest, ListingMissingDirectoryThrows) {
  FileSystemScanner scanner(root.string());
  EXPECT_THROW(scanner.listDirectory(root / "missing"), fs::filesystem_error);
}

TEST_F(FileSystemScannerTest, ProfileCoversImmediateChildrenOnly) {
  writeFile("photos/one.jpg", 10);
  writeFile("photos/two.jpg", 32);
  writeFile("photos/2019/deep.jpg", 1000);
  makeDir("photos/2020");

  FileSystemScanner scanner(root.string());
  FolderProfile profile = scanner.profileFolder(root / "photos");

  EXPECT_EQ(profile.name, "photos");
  EXPECT_EQ(profile.path, (root / "photos").string());
  EXPECT_EQ(profile.relativePath, "photos");
  EXPECT_EQ(profile.fileCount, 2);
  EXPECT_EQ(profile.size, 42);
  ASSERT_EQ(profile.looseFiles.size(), 2u);
  EXPECT_EQ(profile.looseFiles[0].name, "one.jpg");
  EXPECT_EQ(profile.looseFiles[1].name, "two.jpg");
  EXPECT_EQ(profile.subfolders, (std::vector<std::string>{"2019", "2020"}));

  auto looseTotal = std::accumulate(
      profile.looseFiles.begin(), profile.looseFiles.end(), std::int64_t{0},
      [](std::int64_t sum, const LooseFile &f) { return sum + f.size; });
  EXPECT_EQ(profile.size, looseTotal);
}

TEST_F(FileSystemScannerTest, ProfileTracksLatestModification) {
  auto older = writeFile("docs/older.txt", 1);
  auto newer = writeFile("docs/newer.txt", 1);
  auto now = fs::file_time_type::clock::now();
  fs::last_write_time(older, now - std::chrono::hours(48));
  fs::last_write_time(newer, now - std::chrono::hours(1));

  FileSystemScanner scanner(root.string());
  FolderProfile profile = scanner.profileFolder(root / "docs");

  ASSERT_TRUE(profile.lastModified.has_value());
  auto newest = std::max(profile.looseFiles[0].modified,
                         profile.looseFiles[1].modified);
  EXPECT_EQ(*profile.lastModified, newest);
  // looseFiles are in name order: newer.txt, older.txt
  EXPECT_GT(profile.looseFiles[0].modified, profile.looseFiles[1].modified);
}

TEST_F(FileSystemScannerTest, EmptyFolderHasNoLastModified) {
  makeDir("empty/sub");

  FileSystemScanner scanner(root.string());
  FolderProfile profile = scanner.profileFolder(root / "empty");

  EXPECT_FALSE(profile.lastModified.has_value());
  EXPECT_EQ(profile.fileCount, 0);
  EXPECT_EQ(profile.size, 0);
  EXPECT_EQ(profile.subfolders, std::vector<std::string>{"sub"});
}

TEST_F(FileSystemScannerTest, ProfileFailsWhenAnyChildCannotBeStated) {
  writeFile("broken/fine.txt", 5);
  fs::create_symlink(root / "nowhere", root / "broken" / "dangling");

  FileSystemScanner scanner(root.string());
  EXPECT_THROW(scanner.profileFolder(root / "broken"), fs::filesystem_error);
}

TEST_F(FileSystemScannerTest, StatEntryThroughFileLink) {
  auto target = writeFile("target.txt", 7);
  fs::create_symlink(target, root / "link.txt");

  FileSystemScanner scanner(root.string());
  EntryStat entry = scanner.statEntry(root / "link.txt");

  EXPECT_EQ(entry.kind, EntryKind::File);
  EXPECT_EQ(entry.size, 7);
  EXPECT_EQ(entry.name, "link.txt");
}

TEST_F(FileSystemScannerTest, LinkedDirectoriesAreOnlyTraversedWhenFollowing) {
  makeDir("real");
  fs::create_directory_symlink(root / "real", root / "alias");

  FileSystemScanner scanner(root.string());
  EntryStat entry = scanner.statEntry(root / "alias");
  EXPECT_EQ(entry.kind, EntryKind::LinkedDirectory);
  EXPECT_FALSE(scanner.isTraversable(entry));

  FileSystemScanner following(root.string(), true);
  EXPECT_TRUE(following.isTraversable(following.statEntry(root / "alias")));
}

TEST_F(FileSystemScannerTest, RelativePathsUseForwardSlashes) {
  FileSystemScanner scanner(root.string());
  EXPECT_EQ(scanner.toRelativePath(root / "a" / "b.txt"), "a/b.txt");
  EXPECT_EQ(scanner.toRelativePath(root), "");
}

} // namespace
} // namespace drivesage
