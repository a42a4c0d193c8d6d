#include <filesystem>
#include <fstream>

#include <nlohmann/json.hpp>

#include <resqx/log.hpp>
#include <resqx/options.hpp>
#include <resqx/package.hpp>

#include <gtest/gtest.h>

namespace fs = std::filesystem;

class OptionsTest : public ::testing::Test {
protected:
  void SetUp() override {
    tempDir_ = fs::temp_directory_path() /
               (std::string("resqx_test_options_") +
                ::testing::UnitTest::GetInstance()->current_test_info()->name());
    fs::create_directories(tempDir_);
  }

  void TearDown() override { fs::remove_all(tempDir_); }

  fs::path createTestFile(const std::string &name, const std::string &content) {
    fs::path filePath = tempDir_ / name;
    std::ofstream file(filePath);
    file.write(content.data(), content.size());
    return filePath;
  }

  fs::path tempDir_;
};

TEST_F(OptionsTest, Defaults) {
  resqx::PackageOptions options;
  EXPECT_EQ(options.defaultCompression, resqx::Compression::Zlib);
  EXPECT_EQ(options.compressionLevel, 6);
  EXPECT_EQ(options.chunkBytes, resqx::MiB);
  EXPECT_EQ(options.cacheLimitBytes, 0);
  EXPECT_EQ(options.streamingThreshold, 64 * resqx::MiB);
  EXPECT_TRUE(options.strictLoad);
}

// Missing keys keep their defaults
TEST_F(OptionsTest, ParsePartialObject) {
  resqx::Error error;
  auto options = resqx::parseOptions(
      nlohmann::json{{"defaultCompression", "none"}, {"chunkBytes", 4096}, {"strictLoad", false}},
      &error);
  ASSERT_TRUE(options.has_value()) << error.describe();

  EXPECT_EQ(options->defaultCompression, resqx::Compression::None);
  EXPECT_EQ(options->chunkBytes, 4096);
  EXPECT_FALSE(options->strictLoad);
  EXPECT_EQ(options->compressionLevel, 6);
}

TEST_F(OptionsTest, RejectsUnknownKey) {
  resqx::Error error;
  EXPECT_FALSE(resqx::parseOptions(nlohmann::json{{"compresion", "zlib"}}, &error).has_value());
  EXPECT_EQ(error.code, resqx::ErrorCode::Validation);
  EXPECT_EQ(error.field, "compresion");

  // Save always validates, and the log level belongs to the application
  EXPECT_FALSE(resqx::parseOptions(nlohmann::json{{"validateOnSave", false}}, &error).has_value());
  EXPECT_EQ(error.field, "validateOnSave");
  EXPECT_FALSE(resqx::parseOptions(nlohmann::json{{"logLevel", "off"}}, &error).has_value());
  EXPECT_EQ(error.field, "logLevel");
}

TEST_F(OptionsTest, RejectsOutOfRangeValues) {
  resqx::Error error;
  EXPECT_FALSE(resqx::parseOptions(nlohmann::json{{"compressionLevel", 12}}, &error).has_value());
  EXPECT_EQ(error.field, "compressionLevel");

  EXPECT_FALSE(resqx::parseOptions(nlohmann::json{{"chunkBytes", 0}}, &error).has_value());
  EXPECT_EQ(error.field, "chunkBytes");

  EXPECT_FALSE(resqx::parseOptions(nlohmann::json{{"chunkBytes", -1}}, &error).has_value());
  EXPECT_FALSE(resqx::parseOptions(nlohmann::json{{"defaultCompression", "lz4"}}, &error).has_value());
  EXPECT_FALSE(resqx::parseOptions(nlohmann::json::array(), &error).has_value());
}

TEST_F(OptionsTest, JsonRoundTrip) {
  resqx::PackageOptions options;
  options.defaultCompression = resqx::Compression::None;
  options.cacheLimitBytes = 8 * resqx::MiB;
  options.streamingThreshold = 4 * resqx::KiB;

  auto parsed = resqx::parseOptions(resqx::toJson(options));
  ASSERT_TRUE(parsed.has_value());
  EXPECT_EQ(parsed->defaultCompression, resqx::Compression::None);
  EXPECT_EQ(parsed->cacheLimitBytes, 8 * resqx::MiB);
  EXPECT_EQ(parsed->streamingThreshold, 4 * resqx::KiB);
}

TEST_F(OptionsTest, LoadFromFile) {
  fs::path path = createTestFile("options.json", R"({"compressionLevel": 9, "cacheLimitBytes": 1024})");

  resqx::Error error;
  auto options = resqx::loadOptions(path, &error);
  ASSERT_TRUE(options.has_value()) << error.describe();
  EXPECT_EQ(options->compressionLevel, 9);
  EXPECT_EQ(options->cacheLimitBytes, 1024);
}

TEST_F(OptionsTest, LoadFromBrokenFile) {
  resqx::Error error;
  EXPECT_FALSE(resqx::loadOptions(tempDir_ / "missing.json", &error).has_value());
  EXPECT_EQ(error.code, resqx::ErrorCode::Io);

  fs::path path = createTestFile("broken.json", "{\"chunkBytes\": ");
  EXPECT_FALSE(resqx::loadOptions(path, &error).has_value());
  EXPECT_EQ(error.code, resqx::ErrorCode::Validation);
}

TEST_F(OptionsTest, LogLevels) {
  EXPECT_TRUE(resqx::isLogLevel("trace"));
  EXPECT_TRUE(resqx::isLogLevel("off"));
  EXPECT_FALSE(resqx::isLogLevel("verbose"));

  EXPECT_TRUE(resqx::setLogLevel("error"));
  EXPECT_EQ(resqx::logger()->level(), spdlog::level::err);
  EXPECT_FALSE(resqx::setLogLevel("verbose"));
  EXPECT_EQ(resqx::logger()->level(), spdlog::level::err);

  // Packages never touch the shared logger
  auto package = resqx::Package::create();
  EXPECT_EQ(resqx::logger()->level(), spdlog::level::err);
  EXPECT_TRUE(resqx::setLogLevel("warn"));
}
