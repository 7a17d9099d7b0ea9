#include "DatabaseManager.hpp"
#include "OperationExecutor.hpp"
#include "TestTree.hpp"

namespace drivesage {
namespace {

class DatabaseManagerTest : public test::TestTree {
protected:
  std::string dbPath() { return (root / "history.db").string(); }
};

TEST_F(DatabaseManagerTest, RecordsScansNewestFirst) {
  DatabaseManager db(dbPath());
  ASSERT_TRUE(db.open());
  ASSERT_TRUE(db.initializeSchema());

  AnalysisReport first;
  first.drivePath = "/drive/one";
  first.fileCount = 3;
  first.duplicates.resize(2);
  AnalysisReport second;
  second.drivePath = "/drive/two";
  second.errors.push_back({"/drive/two/x", "denied"});

  auto firstId = db.recordScan(first);
  auto secondId = db.recordScan(second);
  ASSERT_TRUE(firstId.has_value());
  ASSERT_TRUE(secondId.has_value());
  EXPECT_LT(*firstId, *secondId);

  auto history = db.getScanHistory();
  ASSERT_TRUE(history.has_value());
  ASSERT_EQ(history->size(), 2u);
  EXPECT_EQ((*history)[0].drivePath, "/drive/two");
  EXPECT_EQ((*history)[0].errorCount, 1);
  EXPECT_EQ((*history)[1].fileCount, 3);
  EXPECT_EQ((*history)[1].duplicateCount, 2);

  auto limited = db.getScanHistory(1);
  ASSERT_TRUE(limited.has_value());
  EXPECT_EQ(limited->size(), 1u);
}

TEST_F(DatabaseManagerTest, RecordsOperationsInExecutionOrder) {
  auto keep = writeFile("work/a.txt", 1);
  auto junk = writeFile("work/.DS_Store", 1);
  auto ghost = root / "work" / "ghost.txt";

  std::vector<Operation> operations = {
      RenameOperation{keep.string(), (root / "work" / "b.txt").string()},
      MoveOperation{ghost.string(), (root / "Archive" / "ghost.txt").string()},
      DeleteOperation{junk.string()}};
  OperationExecutor executor;
  OperationResult result = executor.execute(operations, false);
  ASSERT_EQ(result.summary.failed, 1u);

  {
    DatabaseManager db(dbPath());
    ASSERT_TRUE(db.open());
    ASSERT_TRUE(db.initializeSchema());
    EXPECT_TRUE(db.recordOperations(result, false));
  }

  // A second connection sees the rows
  DatabaseManager db(dbPath());
  ASSERT_TRUE(db.open());
  ASSERT_TRUE(db.initializeSchema());
  auto log = db.getOperationLog();
  ASSERT_TRUE(log.has_value());
  ASSERT_EQ(log->size(), 3u);

  // Newest first, so execution order reversed
  EXPECT_EQ((*log)[2].operation, "rename");
  EXPECT_TRUE((*log)[2].success);
  EXPECT_EQ((*log)[2].destination, (root / "work" / "b.txt").string());

  EXPECT_EQ((*log)[1].operation, "move");
  EXPECT_FALSE((*log)[1].success);
  EXPECT_EQ((*log)[1].source, ghost.string());
  EXPECT_EQ((*log)[1].destination, (root / "Archive" / "ghost.txt").string());
  EXPECT_FALSE((*log)[1].message.empty());

  EXPECT_EQ((*log)[0].operation, "delete");
  EXPECT_TRUE((*log)[0].success);
  EXPECT_TRUE((*log)[0].destination.empty());

  for (const auto &entry : *log)
    EXPECT_FALSE(entry.dryRun);
}

TEST_F(DatabaseManagerTest, RecordsNothingForAnEmptyResult) {
  DatabaseManager db(dbPath());
  ASSERT_TRUE(db.open());
  ASSERT_TRUE(db.initializeSchema());
  EXPECT_TRUE(db.recordOperations(OperationResult{}, true));

  auto log = db.getOperationLog();
  ASSERT_TRUE(log.has_value());
  EXPECT_TRUE(log->empty());
}

} // namespace
} // namespace drivesage
