#include "batch/batch_store.hpp"
#include "utilities/blockio.hpp"
#include "utilities/errors.hpp"
#include "utilities/var_dir.hpp"
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

using namespace merkseal;
namespace fs = std::filesystem;

namespace {

BatchFile makeFile(const std::string &name, const std::string &content) {
  BatchFile f;
  f.name = name;
  for (char c : content)
    f.data.push_back(static_cast<std::byte>(c));
  return f;
}

std::string readText(const fs::path &path) {
  std::ifstream in(path, std::ios::binary);
  return std::string((std::istreambuf_iterator<char>(in)),
                     std::istreambuf_iterator<char>());
}

} // namespace

// Each test gets a fresh store root and its own id sequence.
class BatchStoreTest : public ::testing::Test {
protected:
  void SetUp() override {
    const auto *info = ::testing::UnitTest::GetInstance()->current_test_info();
    root_ = fs::path(getVarDir()) / "store_tests" / info->name();
    fs::remove_all(root_);
  }
  void TearDown() override {
    std::error_code ec;
    fs::remove_all(root_, ec);
  }

  fs::path root_;
  BatchIdAllocator ids_;
};

TEST_F(BatchStoreTest, CreateLoadRecomputeRoundTrip) {
  BatchStore store(root_.string(), HashScheme::Legacy, ids_);
  BatchRecord rec = store.create(
      {makeFile("b.txt", "bravo"), makeFile("a.txt", "alpha")}, "0xRegistry");

  EXPECT_EQ(rec.localBatchId, 1u);
  EXPECT_EQ(rec.fileCount, 2u);
  EXPECT_EQ(rec.suggestedMetaUri, "ipfs://placeholder-1");
  EXPECT_EQ(rec.registryAddress, "0xRegistry");
  EXPECT_FALSE(rec.mantleBatchId.has_value());

  // Leaves are taken in name order regardless of upload order.
  Digest expected =
      MerkleTree::computeRoot({hashData(std::string("alpha")),
                               hashData(std::string("bravo"))});
  EXPECT_EQ(rec.root, digestToHex(expected));

  BatchRecord loaded = store.load(1);
  EXPECT_EQ(loaded.root, rec.root);
  EXPECT_EQ(loaded.fileCount, 2u);
  EXPECT_EQ(store.recomputeRoot(1), expected);

  auto files = store.loadFiles(1);
  ASSERT_EQ(files.size(), 2u);
  EXPECT_EQ(files[0].name, "a.txt");
  EXPECT_EQ(files[1].name, "b.txt");
  EXPECT_TRUE(store.exists(1));
}

TEST_F(BatchStoreTest, RecordLayoutOnDisk) {
  BatchStore store(root_.string(), HashScheme::Legacy, ids_);
  store.create({makeFile("only.bin", "payload")}, "0xabc");

  const fs::path dir = root_ / "1";
  EXPECT_EQ(readText(dir / "only.bin"), "payload");
  EXPECT_FALSE(fs::exists(dir / "metadata.json.tmp"));

  auto j = nlohmann::json::parse(readText(dir / "metadata.json"));
  EXPECT_EQ(j["local_batch_id"], 1);
  EXPECT_EQ(j["root"], digestToHex(hashData(std::string("payload"))));
  EXPECT_EQ(j["file_count"], 1);
  EXPECT_EQ(j["suggested_meta_uri"], "ipfs://placeholder-1");
  EXPECT_EQ(j["registry_address"], "0xabc");
  EXPECT_FALSE(j.contains("mantle_batch_id"));
}

TEST_F(BatchStoreTest, EmptyFileListRejected) {
  BatchStore store(root_.string(), HashScheme::Legacy, ids_);
  EXPECT_THROW(store.create({}, "0x"), EmptyInputError);
  EXPECT_EQ(ids_.peek(), 1u);
}

TEST_F(BatchStoreTest, UnsafeNamesRejected) {
  BatchStore store(root_.string(), HashScheme::Legacy, ids_);
  for (const std::string name :
       {"../escape", "dir/file", "..", ".", "", "metadata.json",
        "back\\slash"}) {
    EXPECT_THROW(store.create(7, {makeFile(name, "x")}, "0x"),
                 std::invalid_argument)
        << name;
  }
  EXPECT_THROW(store.create(7, {makeFile("a", "1"), makeFile("a", "2")}, "0x"),
               std::invalid_argument);
  EXPECT_FALSE(fs::exists(root_ / "7"));
}

TEST_F(BatchStoreTest, ExistingBatchDirectoryIsStorageError) {
  BatchStore store(root_.string(), HashScheme::Legacy, ids_);
  store.create(3, {makeFile("a", "1")}, "0x");
  try {
    store.create(3, {makeFile("b", "2")}, "0x");
    FAIL() << "expected StorageError";
  } catch (const StorageError &e) {
    EXPECT_NE(e.path().find("3"), std::string::npos);
  }
  EXPECT_EQ(store.load(3).fileCount, 1u);
}

TEST_F(BatchStoreTest, MissingBatchIsNotFound) {
  BatchStore store(root_.string(), HashScheme::Legacy, ids_);
  EXPECT_THROW(store.load(42), NotFoundError);
  EXPECT_FALSE(store.exists(42));
}

TEST_F(BatchStoreTest, CorruptRecordsAreReported) {
  BatchStore store(root_.string(), HashScheme::Legacy, ids_);
  store.create(1, {makeFile("a", "1")}, "0x");
  store.create(2, {makeFile("a", "1")}, "0x");
  store.create(3, {makeFile("a", "1")}, "0x");

  std::ofstream(root_ / "1" / "metadata.json", std::ios::trunc) << "{not json";
  std::ofstream(root_ / "2" / "metadata.json", std::ios::trunc)
      << R"({"local_batch_id":2,"root":"zz","file_count":1,)"
      << R"("suggested_meta_uri":"u","registry_address":"r"})";
  std::ofstream(root_ / "3" / "metadata.json", std::ios::trunc)
      << R"({"local_batch_id":3,"file_count":1})";

  EXPECT_THROW(store.load(1), CorruptRecordError);
  EXPECT_THROW(store.load(2), CorruptRecordError);
  EXPECT_THROW(store.load(3), CorruptRecordError);
}

TEST_F(BatchStoreTest, RecordIdMustMatchDirectory) {
  BatchStore store(root_.string(), HashScheme::Legacy, ids_);
  store.create(5, {makeFile("a", "1")}, "0x");
  fs::create_directories(root_ / "6");
  fs::copy_file(root_ / "5" / "metadata.json", root_ / "6" / "metadata.json");
  EXPECT_THROW(store.load(6), CorruptRecordError);
}

TEST_F(BatchStoreTest, RecomputeDetectsTamper) {
  BatchStore store(root_.string(), HashScheme::Legacy, ids_);
  BatchRecord rec =
      store.create({makeFile("a", "hello"), makeFile("b", "world")}, "0x");
  std::ofstream(root_ / "1" / "b", std::ios::binary | std::ios::trunc)
      << "World";
  EXPECT_NE(digestToHex(store.recomputeRoot(1)), rec.root);
}

TEST_F(BatchStoreTest, RecomputeWithoutBlobsIsEmpty) {
  BatchStore store(root_.string(), HashScheme::Legacy, ids_);
  store.create({makeFile("a", "hello")}, "0x");
  fs::remove(root_ / "1" / "a");
  EXPECT_THROW(store.recomputeRoot(1), EmptyInputError);
}

TEST_F(BatchStoreTest, RecordAnchorOnce) {
  BatchStore store(root_.string(), HashScheme::Legacy, ids_);
  store.create({makeFile("a", "hello")}, "0x");

  BatchRecord rec = store.recordAnchor(1, 17);
  ASSERT_TRUE(rec.mantleBatchId.has_value());
  EXPECT_EQ(*rec.mantleBatchId, 17u);
  EXPECT_EQ(*store.load(1).mantleBatchId, 17u);

  EXPECT_NO_THROW(store.recordAnchor(1, 17));
  EXPECT_THROW(store.recordAnchor(1, 18), std::logic_error);
  EXPECT_EQ(*store.load(1).mantleBatchId, 17u);
  EXPECT_THROW(store.recordAnchor(99, 1), NotFoundError);
}

TEST_F(BatchStoreTest, HighestBatchIdScansDirectories) {
  BatchStore store(root_.string(), HashScheme::Legacy, ids_);
  EXPECT_EQ(store.highestBatchId(), 0u);
  store.create(4, {makeFile("a", "1")}, "0x");
  store.create(11, {makeFile("a", "1")}, "0x");
  fs::create_directories(root_ / "not-a-batch");
  EXPECT_EQ(store.highestBatchId(), 11u);

  ids_.advancePast(store.highestBatchId());
  EXPECT_EQ(store.create({makeFile("a", "1")}, "0x").localBatchId, 12u);
}

TEST_F(BatchStoreTest, SchemeChangesStoredRoot) {
  BatchIdAllocator otherIds;
  BatchStore legacy((root_ / "legacy").string(), HashScheme::Legacy, ids_);
  BatchStore hardened((root_ / "hardened").string(),
                      HashScheme::DomainSeparated, otherIds);
  auto files = std::vector<BatchFile>{makeFile("a", "1"), makeFile("b", "2")};
  EXPECT_NE(legacy.create(files, "0x").root, hardened.create(files, "0x").root);
  EXPECT_EQ(digestToHex(hardened.recomputeRoot(1)), hardened.load(1).root);
}

TEST_F(BatchStoreTest, PartialCreateLeavesNoRecord) {
  BatchStore store(root_.string(), HashScheme::Legacy, ids_);
  // Sorts after a.txt, and exceeds NAME_MAX so its blob cannot be written.
  const std::string tooLong(300, 'z');
  EXPECT_THROW(store.create(7, {makeFile("a.txt", "alpha"),
                                makeFile(tooLong, "zulu")},
                            "0xRegistry"),
               StorageError);

  EXPECT_TRUE(fs::exists(root_ / "7" / "a.txt"));
  EXPECT_FALSE(fs::exists(root_ / "7" / BatchStore::METADATA_FILE));
  EXPECT_FALSE(store.exists(7));
  EXPECT_THROW(store.load(7), NotFoundError);
}
