#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>

#include "lfs/configloader.hpp"

namespace fs = std::filesystem;

namespace {

// Временный файл, удаляемый в деструкторе
class TempFile {
 public:
  explicit TempFile(const std::string& content) {
    path_ = (fs::temp_directory_path() /
             ("lfs_config_" +
              std::to_string(
                  std::chrono::steady_clock::now().time_since_epoch().count()) +
              ".json"))
                .string();
    std::ofstream(path_) << content;
  }
  ~TempFile() {
    std::error_code ec;
    fs::remove(path_, ec);
  }
  const std::string& path() const { return path_; }

 private:
  std::string path_;
};

}  // namespace

TEST(ConfigLoaderTest, LoadsValidDocument) {
  TempFile file(R"({"lfs": {"concurrenttransfers": 8}})");

  auto config = lfs::ConfigLoader::loadFromFile(file.path());

  EXPECT_EQ(config["lfs"]["concurrenttransfers"].get<int>(), 8);
}

TEST(ConfigLoaderTest, AcceptsComments) {
  TempFile file(R"({
    // включить tus для выгрузки
    "lfs": {"tustransfers": true} /* конец */
  })");

  auto config = lfs::ConfigLoader::loadFromFile(file.path());

  EXPECT_TRUE(config["lfs"]["tustransfers"].get<bool>());
}

TEST(ConfigLoaderTest, MissingFileThrows) {
  try {
    lfs::ConfigLoader::loadFromFile("/nonexistent/lfs-config.json");
    FAIL() << "expected runtime_error";
  } catch (const std::runtime_error& e) {
    EXPECT_NE(std::string(e.what()).find("Failed to open file"),
              std::string::npos);
  }
}

TEST(ConfigLoaderTest, ParseErrorReportsLineAndColumn) {
  try {
    lfs::ConfigLoader::parse("{\n  \"lfs\": {\n    \"x\": ]\n  }\n}", "lfs.json");
    FAIL() << "expected runtime_error";
  } catch (const std::runtime_error& e) {
    std::string message = e.what();
    EXPECT_NE(message.find("JSON parse error in lfs.json"), std::string::npos)
        << message;
    EXPECT_NE(message.find("at line 3, column "), std::string::npos)
        << message;
  }
}

TEST(ConfigLoaderTest, TopLevelMustBeObject) {
  TempFile file("[1, 2]");
  try {
    lfs::ConfigLoader::loadFromFile(file.path());
    FAIL() << "expected runtime_error";
  } catch (const std::runtime_error& e) {
    EXPECT_NE(std::string(e.what()).find("top-level value must be an object"),
              std::string::npos);
  }
}

TEST(ConfigLoaderTest, EmptyContentIsAnError) {
  EXPECT_THROW(lfs::ConfigLoader::parse("", "empty.json"), std::runtime_error);
}
