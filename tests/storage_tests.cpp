#include "evichain/errors.hpp"
#include "evichain/evidence_paths.hpp"
#include "evichain/screenshot_capturer.hpp"
#include "evichain/storage.hpp"

#include <algorithm>
#include <cstddef>
#include <filesystem>
#include <gtest/gtest.h>
#include <string>
#include <thread>
#include <vector>

using namespace evichain;
namespace fs = std::filesystem;

namespace {

class FileStorageTest : public ::testing::Test {
protected:
  void SetUp() override {
    root_ = fs::path(getEvidenceRoot()) / "storage" /
            ::testing::UnitTest::GetInstance()->current_test_info()->name();
    fs::remove_all(root_);
  }

  fs::path root_;
};

std::vector<std::string> sorted(std::vector<std::string> v) {
  std::sort(v.begin(), v.end());
  return v;
}

} // namespace

TEST_F(FileStorageTest, WriteThenRead) {
  FileStorage storage(root_.string());
  storage.write("chain-a.json", "{\"a\":1}");
  EXPECT_TRUE(storage.exists("chain-a.json"));
  EXPECT_EQ(storage.read("chain-a.json"), std::optional<std::string>("{\"a\":1}"));
  EXPECT_TRUE(fs::exists(root_ / "chain-a.json"));
}

TEST_F(FileStorageTest, MissingKeyReadsAsNullopt) {
  FileStorage storage(root_.string());
  EXPECT_FALSE(storage.exists("nothing.json"));
  EXPECT_FALSE(storage.read("nothing.json").has_value());
}

TEST_F(FileStorageTest, BinaryContentSurvives) {
  FileStorage storage(root_.string());
  std::string bytes;
  for (int i = 0; i < 256; ++i)
    bytes.push_back(static_cast<char>(i));
  storage.write("screenshots/c1/a.png", bytes);
  EXPECT_EQ(*storage.read("screenshots/c1/a.png"), bytes);
}

TEST_F(FileStorageTest, WriteReplacesAndLeavesNoTemporaries) {
  FileStorage storage(root_.string());
  storage.write("k.json", std::string(4096, 'a'));
  storage.write("k.json", "short");
  EXPECT_EQ(*storage.read("k.json"), "short");

  for (const auto &entry : fs::directory_iterator(root_))
    EXPECT_EQ(entry.path().filename().string().rfind(".tmp-", 0),
              std::string::npos)
        << entry.path();
}

TEST_F(FileStorageTest, CreateNeverReplacesExistingContent) {
  FileStorage storage(root_.string());
  EXPECT_TRUE(storage.create("screenshots/c1/a.png", "first"));
  EXPECT_FALSE(storage.create("screenshots/c1/a.png", "second"));
  EXPECT_EQ(*storage.read("screenshots/c1/a.png"), "first");
  EXPECT_THROW(storage.create("../a.png", "x"), StorageFailure);

  std::vector<std::string> names;
  for (const auto &entry : fs::directory_iterator(root_ / "screenshots" / "c1"))
    names.push_back(entry.path().filename().string());
  EXPECT_EQ(names, std::vector<std::string>{"a.png"});
}

TEST_F(FileStorageTest, ScreenshotDirectoryHoldsOnlyImages) {
  FileStorage storage(root_.string());
  ScreenshotCapturer capturer(storage);
  std::vector<std::string> paths;
  for (int i = 0; i < 5; ++i) {
    std::vector<std::byte> bytes(16, std::byte(i));
    paths.push_back(capturer.finalize("c1", bytes, ImageFormat::Png).path);
  }
  paths.push_back(
      capturer.finalize("c1", std::vector<std::byte>(8), ImageFormat::Jpeg).path);

  std::vector<std::string> names;
  for (const auto &entry : fs::directory_iterator(root_ / "screenshots" / "c1")) {
    const std::string ext = entry.path().extension().string();
    EXPECT_TRUE(ext == ".png" || ext == ".jpeg") << entry.path();
    names.push_back("screenshots/c1/" + entry.path().filename().string());
  }
  EXPECT_EQ(sorted(names), sorted(paths));
}

TEST_F(FileStorageTest, CreatesNestedDirectories) {
  FileStorage storage(root_.string());
  storage.write("exports/chain-a-1.json", "{}");
  EXPECT_TRUE(fs::is_regular_file(root_ / "exports" / "chain-a-1.json"));
}

TEST_F(FileStorageTest, ListReturnsDirectChildren) {
  FileStorage storage(root_.string());
  EXPECT_TRUE(storage.list("").empty());
  EXPECT_TRUE(storage.list("exports").empty());

  storage.write("chain-a.json", "{}");
  storage.write("chain-b.json", "{}");
  storage.write("exports/chain-a-1.json", "{}");

  auto root = sorted(storage.list(""));
  EXPECT_NE(std::find(root.begin(), root.end(), "chain-a.json"), root.end());
  EXPECT_NE(std::find(root.begin(), root.end(), "chain-b.json"), root.end());
  EXPECT_NE(std::find(root.begin(), root.end(), "exports"), root.end());
  auto exports = storage.list("exports");
  EXPECT_NE(std::find(exports.begin(), exports.end(), "chain-a-1.json"),
            exports.end());
  EXPECT_EQ(std::find(root.begin(), root.end(), "chain-a-1.json"), root.end());
}

TEST_F(FileStorageTest, KeysCannotEscapeTheRoot) {
  FileStorage storage(root_.string());
  EXPECT_THROW(storage.write("../outside.json", "x"), StorageFailure);
  EXPECT_THROW(storage.write("a/../../outside.json", "x"), StorageFailure);
  EXPECT_THROW(storage.write("/tmp/abs.json", "x"), StorageFailure);
  EXPECT_THROW(storage.read(""), StorageFailure);
  EXPECT_FALSE(fs::exists(root_.parent_path() / "outside.json"));
}

TEST_F(FileStorageTest, StorageFailureNamesTheKey) {
  FileStorage storage(root_.string());
  try {
    storage.write("../x", "y");
    FAIL() << "expected StorageFailure";
  } catch (const StorageFailure &e) {
    EXPECT_EQ(e.key(), "../x");
    EXPECT_NE(std::string(e.what()).find("../x"), std::string::npos);
  }
}

TEST_F(FileStorageTest, UnwritableRootFails) {
  fs::create_directories(root_);
  // A regular file where a directory is needed.
  {
    FileStorage setup(root_.string());
    setup.write("blocker", "x");
  }
  FileStorage storage((root_ / "blocker").string());
  EXPECT_THROW(storage.write("chain-a.json", "{}"), StorageFailure);
}

TEST_F(FileStorageTest, ConcurrentWritersNeverTearContent) {
  FileStorage storage(root_.string());
  const std::string a(64 * 1024, 'a');
  const std::string b(64 * 1024, 'b');
  std::vector<std::thread> writers;
  for (int t = 0; t < 4; ++t) {
    writers.emplace_back([&, t] {
      for (int i = 0; i < 20; ++i)
        storage.write("shared.json", (t % 2) ? a : b);
    });
  }
  for (int i = 0; i < 50; ++i) {
    auto content = storage.read("shared.json");
    if (content)
      EXPECT_TRUE(*content == a || *content == b);
  }
  for (auto &w : writers)
    w.join();
  auto content = storage.read("shared.json");
  ASSERT_TRUE(content.has_value());
  EXPECT_TRUE(*content == a || *content == b);
}

TEST_F(FileStorageTest, ResolveJoinsRootAndKey) {
  FileStorage storage(root_.string());
  EXPECT_EQ(fs::path(storage.resolve("exports/x.json")),
            root_ / "exports" / "x.json");
  EXPECT_EQ(storage.root(), root_.string());
}

TEST(EvidencePaths, KeysAndIds) {
  EXPECT_EQ(chainKey("run-1"), "chain-run-1.json");
  EXPECT_EQ(exportKey("run-1", "2024-01-01T00-00-00-000Z"),
            "exports/chain-run-1-2024-01-01T00-00-00-000Z.json");
  EXPECT_EQ(screenshotsPrefix("run-1"), "screenshots/run-1");
  EXPECT_EQ(chainIdFromFileName("chain-run-1.json"), "run-1");
  EXPECT_EQ(chainIdFromFileName("chain-.json"), "");
  EXPECT_EQ(chainIdFromFileName("chain-a.json.lock"), "");
  EXPECT_EQ(chainIdFromFileName("exports"), "");
}

TEST(EvidencePaths, ChainIdValidation) {
  EXPECT_TRUE(isValidChainId("run-2024.01_a"));
  EXPECT_TRUE(isValidChainId(std::string(200, 'a')));
  EXPECT_FALSE(isValidChainId(std::string(201, 'a')));
  EXPECT_FALSE(isValidChainId(""));
  EXPECT_FALSE(isValidChainId("."));
  EXPECT_FALSE(isValidChainId(".."));
  EXPECT_FALSE(isValidChainId("a/b"));
  EXPECT_FALSE(isValidChainId("a b"));
}
