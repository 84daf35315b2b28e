#include "TestHelpers.hpp"

#include "ocrbatch/Logging.hpp"
#include "ocrbatch/PipelineConfig.hpp"

#include <gtest/gtest.h>

#include <cstdint>

using namespace ocrbatch;
using ocrbatch::test::TempDirTest;

TEST(ParseConfig, EmptyObjectKeepsDefaults) {
  ConfigLoadResult result = parseConfig(nlohmann::json::object(), "");
  ASSERT_TRUE(result.success) << result.errorMessage;

  const PipelineConfig &config = result.config;
  EXPECT_EQ("input_data", config.inputDir);
  EXPECT_EQ("output_data", config.output.outputDir);
  EXPECT_EQ("json", config.output.format);
  EXPECT_FALSE(config.output.nameFromRelativePath);
  EXPECT_EQ(300, config.scan.pdfDpi);
  EXPECT_TRUE(config.scan.sortEntries);
  EXPECT_FALSE(config.scan.followSymlinks);
  EXPECT_EQ("rus", config.ocr.language);
  EXPECT_EQ(3, config.ocr.pageSegMode);
  EXPECT_EQ(3, config.ocr.engineMode);
  EXPECT_TRUE(config.ocr.variables.empty());
  EXPECT_FALSE(config.preprocessing.enabled);
  EXPECT_EQ("INFO", config.logging.level);
  EXPECT_TRUE(config.logging.logToConsole);
  EXPECT_TRUE(config.logging.logFile.empty());
}

TEST(ParseConfig, ReadsAllSections) {
  nlohmann::json document = {
      {"input_dir", "/scans"},
      {"output_dir", "/results"},
      {"pdf_dpi", 200},
      {"sort_entries", false},
      {"follow_symlinks", true},
      {"pdf_password", "secret"},
      {"name_from_relative_path", true},
      {"ocr_language", "rus+eng"},
      {"tessdata_dir", "/usr/share/tessdata"},
      {"ocr_psm", 6},
      {"ocr_oem", 1},
      {"tesseract_variables",
       {{"preserve_interword_spaces", "1"}, {"user_defined_dpi", 300}}},
      {"preprocessing",
       {{"enabled", true},
        {"grayscale", false},
        {"deskew", true},
        {"binarization_method", "adaptive"},
        {"adaptive_thresh_block_size", 15},
        {"adaptive_thresh_C", 4.5},
        {"noise_removal", "median_3"}}},
      {"logging",
       {{"level", "DEBUG"}, {"log_file", "logs/run.log"}, {"log_to_console", false}}},
      {"unknown_key", "ignored"}};

  ConfigLoadResult result = parseConfig(document, "/base");
  ASSERT_TRUE(result.success) << result.errorMessage;

  const PipelineConfig &config = result.config;
  EXPECT_EQ("/scans", config.inputDir);
  EXPECT_EQ("/results", config.output.outputDir);
  EXPECT_TRUE(config.output.nameFromRelativePath);
  EXPECT_EQ(200, config.scan.pdfDpi);
  EXPECT_FALSE(config.scan.sortEntries);
  EXPECT_TRUE(config.scan.followSymlinks);
  EXPECT_EQ("secret", config.rasterizer.pdfPassword);
  EXPECT_EQ("rus+eng", config.ocr.language);
  EXPECT_EQ("/usr/share/tessdata", config.ocr.tessDataPath);
  EXPECT_EQ(6, config.ocr.pageSegMode);
  EXPECT_EQ(1, config.ocr.engineMode);
  EXPECT_EQ("1", config.ocr.variables.at("preserve_interword_spaces"));
  EXPECT_EQ("300", config.ocr.variables.at("user_defined_dpi"));

  EXPECT_TRUE(config.preprocessing.enabled);
  EXPECT_FALSE(config.preprocessing.grayscale);
  EXPECT_TRUE(config.preprocessing.deskew);
  EXPECT_EQ("adaptive", config.preprocessing.binarizationMethod);
  EXPECT_EQ(15, config.preprocessing.adaptiveBlockSize);
  EXPECT_DOUBLE_EQ(4.5, config.preprocessing.adaptiveC);
  EXPECT_EQ("median_3", config.preprocessing.noiseRemoval);

  EXPECT_EQ("DEBUG", config.logging.level);
  EXPECT_EQ("logs/run.log", config.logging.logFile);
  EXPECT_FALSE(config.logging.logToConsole);
}

TEST(ParseConfig, ResolvesRelativeDirectoriesAgainstBase) {
  nlohmann::json document = {{"input_dir", "in"},
                             {"output_dir", "./out/../results"}};

  ConfigLoadResult result = parseConfig(document, "/srv/ocr");
  ASSERT_TRUE(result.success);
  EXPECT_EQ("/srv/ocr/in", result.config.inputDir);
  EXPECT_EQ("/srv/ocr/results", result.config.output.outputDir);
}

TEST(ParseConfig, NullOptionalValuesMeanUnset) {
  nlohmann::json document = {
      {"tessdata_dir", nullptr},
      {"preprocessing",
       {{"binarization_method", nullptr}, {"noise_removal", nullptr}}},
      {"logging", {{"log_file", nullptr}}}};

  ConfigLoadResult result = parseConfig(document, "");
  ASSERT_TRUE(result.success) << result.errorMessage;
  EXPECT_TRUE(result.config.ocr.tessDataPath.empty());
  EXPECT_TRUE(result.config.preprocessing.binarizationMethod.empty());
  EXPECT_TRUE(result.config.preprocessing.noiseRemoval.empty());
  EXPECT_TRUE(result.config.logging.logFile.empty());
}

TEST(ParseConfig, WrongTypesAreErrors) {
  EXPECT_FALSE(parseConfig({{"pdf_dpi", "high"}}, "").success);
  EXPECT_FALSE(parseConfig({{"sort_entries", "yes"}}, "").success);
  EXPECT_FALSE(parseConfig({{"tesseract_variables", "psm=6"}}, "").success);
  EXPECT_FALSE(parseConfig(nlohmann::json::array({1, 2}), "").success);
}

TEST(ParseConfig, IntegerKeysRejectFractions) {
  ConfigLoadResult result = parseConfig({{"pdf_dpi", 150.7}}, "");
  EXPECT_FALSE(result.success);
  EXPECT_NE(std::string::npos, result.errorMessage.find("pdf_dpi"));

  EXPECT_FALSE(parseConfig({{"ocr_psm", 3.5}}, "").success);
  EXPECT_FALSE(parseConfig({{"ocr_oem", 1.0}}, "").success);
  EXPECT_FALSE(
      parseConfig({{"preprocessing", {{"adaptive_thresh_block_size", 11.2}}}},
                  "")
          .success);
}

TEST(ParseConfig, IntegerKeysRejectValuesBeyondInt) {
  ConfigLoadResult result =
      parseConfig({{"pdf_dpi", std::int64_t{5000000000}}}, "");
  EXPECT_FALSE(result.success);
  EXPECT_NE(std::string::npos, result.errorMessage.find("out of range"));

  EXPECT_FALSE(
      parseConfig({{"pdf_dpi", std::uint64_t{5000000000}}}, "").success);
  EXPECT_FALSE(
      parseConfig({{"ocr_oem", std::int64_t{-5000000000}}}, "").success);
  EXPECT_FALSE(parseConfig(nlohmann::json::parse(R"({"ocr_psm": 4294967299})"),
                           "")
                   .success);
}

TEST(ParseConfig, IntegerKeysAcceptInRangeValues) {
  ConfigLoadResult result = parseConfig(
      {{"pdf_dpi", 600},
       {"ocr_psm", 6},
       {"ocr_oem", 1},
       {"preprocessing", {{"adaptive_thresh_block_size", 15}}}},
      "");
  ASSERT_TRUE(result.success) << result.errorMessage;
  EXPECT_EQ(600, result.config.scan.pdfDpi);
  EXPECT_EQ(6, result.config.ocr.pageSegMode);
  EXPECT_EQ(1, result.config.ocr.engineMode);
  EXPECT_EQ(15, result.config.preprocessing.adaptiveBlockSize);
}

TEST(ParseConfig, NonPositiveDpiIsError) {
  ConfigLoadResult result = parseConfig({{"pdf_dpi", 0}}, "");
  EXPECT_FALSE(result.success);
  EXPECT_NE(std::string::npos, result.errorMessage.find("pdf_dpi"));

  EXPECT_FALSE(parseConfig({{"pdf_dpi", -300}}, "").success);
}

TEST(ParseConfig, DpiAboveCapIsError) {
  EXPECT_TRUE(parseConfig({{"pdf_dpi", kMaxPdfDpi}}, "").success);

  ConfigLoadResult result = parseConfig({{"pdf_dpi", kMaxPdfDpi + 1}}, "");
  EXPECT_FALSE(result.success);
  EXPECT_NE(std::string::npos, result.errorMessage.find("pdf_dpi"));
}

class LoadConfigTest : public TempDirTest {};

TEST_F(LoadConfigTest, LoadsFileRelativeToItsDirectory) {
  auto file = writeFile("conf/config.json",
                        R"({"input_dir": "scans", "pdf_dpi": 150})");

  ConfigLoadResult result = loadConfig(file.string());
  ASSERT_TRUE(result.success) << result.errorMessage;
  EXPECT_EQ((dir() / "conf" / "scans").lexically_normal().string(),
            result.config.inputDir);
  EXPECT_EQ(150, result.config.scan.pdfDpi);
}

TEST_F(LoadConfigTest, MissingFileIsError) {
  ConfigLoadResult result = loadConfig((dir() / "absent.json").string());
  EXPECT_FALSE(result.success);
  EXPECT_NE(std::string::npos, result.errorMessage.find("not found"));
}

TEST_F(LoadConfigTest, MalformedFileIsError) {
  auto file = writeFile("config.json", "{ \"input_dir\": ");

  ConfigLoadResult result = loadConfig(file.string());
  EXPECT_FALSE(result.success);
  EXPECT_NE(std::string::npos, result.errorMessage.find("parse"));
}

TEST(ParseLogLevel, AcceptsNamesCaseInsensitive) {
  EXPECT_EQ(spdlog::level::debug, parseLogLevel("debug"));
  EXPECT_EQ(spdlog::level::warn, parseLogLevel("WARNING"));
  EXPECT_EQ(spdlog::level::warn, parseLogLevel("warn"));
  EXPECT_EQ(spdlog::level::err, parseLogLevel("Error"));
  EXPECT_EQ(spdlog::level::critical, parseLogLevel("CRITICAL"));
  EXPECT_EQ(spdlog::level::trace, parseLogLevel("trace"));
  EXPECT_EQ(spdlog::level::info, parseLogLevel("INFO"));
  EXPECT_EQ(spdlog::level::info, parseLogLevel("verbose"));
}

TEST(SetupLogging, ReplacesDefaultLogger) {
  LoggingConfig config;
  config.level = "ERROR";
  setupLogging(config);

  ASSERT_NE(nullptr, spdlog::default_logger());
  EXPECT_EQ("ocrbatch", spdlog::default_logger()->name());
  EXPECT_EQ(spdlog::level::err, spdlog::default_logger()->level());

  setupLogging(LoggingConfig());
}

TEST_F(LoadConfigTest, FileLoggingCreatesLogDirectory) {
  LoggingConfig config;
  config.logFile = (dir() / "logs" / "run.log").string();
  config.logToConsole = false;
  setupLogging(config);
  spdlog::warn("written to file");
  spdlog::default_logger()->flush();

  EXPECT_TRUE(std::filesystem::exists(dir() / "logs" / "run.log"));

  // Release the file before the fixture removes the directory
  setupLogging(LoggingConfig());
}
