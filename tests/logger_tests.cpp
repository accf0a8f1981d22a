#include "evichain/evidence_paths.hpp"
#include "evichain/logger.h"
#include "gtest/gtest.h"

#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <sstream>
#include <string>
#include <vector>

using namespace evichain;
namespace fs = std::filesystem;

namespace {

// Helper function to read file contents
std::string readFileContents(const std::string &path) {
  std::ifstream ifs(path);
  if (!ifs)
    return "";
  return std::string((std::istreambuf_iterator<char>(ifs)),
                     std::istreambuf_iterator<char>());
}

std::vector<std::string> readLines(const std::string &path) {
  std::vector<std::string> lines;
  std::istringstream in(readFileContents(path));
  std::string line;
  while (std::getline(in, line))
    if (!line.empty())
      lines.push_back(line);
  return lines;
}

// Each test logs into its own directory; the shared test log is restored
// afterwards so later tests keep logging to it.
class LoggerTest : public ::testing::Test {
protected:
  void SetUp() override {
    dir_ = fs::path(getEvidenceRoot()) / "logger" /
           ::testing::UnitTest::GetInstance()->current_test_info()->name();
    fs::remove_all(dir_);
    fs::create_directories(dir_);
  }

  void TearDown() override {
    Logger::init((fs::path(getEvidenceRoot()) / "evichain_tests.log").string(),
                 LogLevel::DEBUG);
  }

  std::string logPath(const std::string &name) const {
    return (dir_ / name).string();
  }

  fs::path dir_;
};

} // namespace

TEST_F(LoggerTest, LogLevelFiltering) {
  const std::string file = logPath("level_filter.log");
  ASSERT_NO_THROW(Logger::init(file, LogLevel::INFO));
  Logger &logger = Logger::getInstance();

  logger.log(LogLevel::TRACE, "This is a trace message.");
  logger.log(LogLevel::DEBUG, "This is a debug message.");
  logger.log(LogLevel::INFO, "This is an info message.");
  logger.log(LogLevel::WARN, "This is a warning message.");
  logger.log(LogLevel::ERROR, "This is an error message.");
  logger.log(LogLevel::FATAL, "This is a fatal message.");

  std::string contents = readFileContents(file);
  ASSERT_NE(contents, "");
  EXPECT_EQ(contents.find("trace message"), std::string::npos);
  EXPECT_EQ(contents.find("debug message"), std::string::npos);
  EXPECT_NE(contents.find("This is an info message."), std::string::npos);
  EXPECT_NE(contents.find("This is a warning message."), std::string::npos);
  EXPECT_NE(contents.find("This is an error message."), std::string::npos);
  EXPECT_NE(contents.find("This is a fatal message."), std::string::npos);
  EXPECT_EQ(readLines(file).size(), 4u);
}

TEST_F(LoggerTest, SetLogLevelAppliesImmediately) {
  const std::string file = logPath("set_level.log");
  Logger::init(file, LogLevel::ERROR);
  Logger &logger = Logger::getInstance();
  EXPECT_EQ(logger.logLevel(), LogLevel::ERROR);

  logger.log(LogLevel::INFO, "dropped");
  logger.setLogLevel(LogLevel::TRACE);
  logger.log(LogLevel::TRACE, "kept");

  std::string contents = readFileContents(file);
  EXPECT_EQ(contents.find("dropped"), std::string::npos);
  EXPECT_NE(contents.find("kept"), std::string::npos);
}

TEST_F(LoggerTest, JsonOutputFormat) {
  const std::string file = logPath("json_format.log");
  Logger::init(file, LogLevel::DEBUG);
  const std::string message =
      "Test JSON output with special chars \" \\ / \b \f \n \r \t";
  Logger::getInstance().log(LogLevel::INFO, message);

  auto lines = readLines(file);
  ASSERT_EQ(lines.size(), 1u);
  nlohmann::json entry = nlohmann::json::parse(lines[0]);
  EXPECT_EQ(entry["level"], "INFO");
  EXPECT_EQ(entry["message"], message);
  ASSERT_TRUE(entry["timestamp"].is_string());
  std::string ts = entry["timestamp"];
  EXPECT_EQ(ts.back(), 'Z');
  EXPECT_EQ(ts[10], 'T');
}

TEST_F(LoggerTest, InvalidUtf8DoesNotThrow) {
  const std::string file = logPath("utf8.log");
  Logger::init(file, LogLevel::DEBUG);
  EXPECT_NO_THROW(
      Logger::getInstance().log(LogLevel::WARN, std::string("bad \xff\xfe")));
  auto lines = readLines(file);
  ASSERT_EQ(lines.size(), 1u);
  EXPECT_NO_THROW(nlohmann::json::parse(lines[0]));
}

TEST_F(LoggerTest, LogRotation) {
  const std::string base = logPath("rotation.log");
  const int maxBackupFiles = 2;
  const long long maxFileSize = 1024;

  Logger::init(base, LogLevel::DEBUG, maxFileSize, maxBackupFiles);
  Logger &logger = Logger::getInstance();
  const std::string payload(200, 'x');
  for (int i = 0; i < 40; ++i)
    logger.log(LogLevel::INFO, "entry " + std::to_string(i) + " " + payload);

  EXPECT_TRUE(fs::exists(base));
  EXPECT_TRUE(fs::exists(base + ".1"));
  EXPECT_TRUE(fs::exists(base + ".2"));
  EXPECT_FALSE(fs::exists(base + ".3"));

  // Newest entry is in the active file; rotated files stay near the limit.
  EXPECT_NE(readFileContents(base).find("entry 39 "), std::string::npos);
  EXPECT_EQ(readFileContents(base + ".1").find("entry 39 "), std::string::npos);
  EXPECT_LT(fs::file_size(base + ".1"), static_cast<uintmax_t>(2 * maxFileSize));
}

TEST_F(LoggerTest, RotationWithoutBackupsTruncates) {
  const std::string base = logPath("no_backups.log");
  Logger::init(base, LogLevel::DEBUG, 512, 0);
  for (int i = 0; i < 20; ++i)
    Logger::getInstance().log(LogLevel::INFO, std::string(100, 'y'));
  EXPECT_TRUE(fs::exists(base));
  EXPECT_FALSE(fs::exists(base + ".1"));
  EXPECT_LT(fs::file_size(base), 1024u);
}

TEST_F(LoggerTest, ReinitAppendsToExistingFile) {
  const std::string file = logPath("append.log");
  Logger::init(file, LogLevel::INFO);
  Logger::getInstance().log(LogLevel::INFO, "first");
  Logger::init(file, LogLevel::INFO);
  Logger::getInstance().log(LogLevel::INFO, "second");

  auto lines = readLines(file);
  ASSERT_EQ(lines.size(), 2u);
  EXPECT_NE(lines[0].find("first"), std::string::npos);
  EXPECT_NE(lines[1].find("second"), std::string::npos);
}

TEST_F(LoggerTest, CreatesMissingLogDirectory) {
  const std::string file = logPath("nested/dir/app.log");
  Logger::init(file, LogLevel::INFO);
  Logger::getInstance().log(LogLevel::INFO, "hello");
  EXPECT_NE(readFileContents(file).find("hello"), std::string::npos);
}

TEST(LoggerLevels, LevelNames) {
  EXPECT_EQ(Logger::levelToString(LogLevel::TRACE), "TRACE");
  EXPECT_EQ(Logger::levelToString(LogLevel::DEBUG), "DEBUG");
  EXPECT_EQ(Logger::levelToString(LogLevel::INFO), "INFO");
  EXPECT_EQ(Logger::levelToString(LogLevel::WARN), "WARN");
  EXPECT_EQ(Logger::levelToString(LogLevel::ERROR), "ERROR");
  EXPECT_EQ(Logger::levelToString(LogLevel::FATAL), "FATAL");
}
