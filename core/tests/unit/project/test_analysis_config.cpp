// tests/project/test_analysis_config.cpp - flowan.yaml loading and discovery
//
#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>

#include "flowan/project/analysis_config.hpp"

using namespace flowan;
namespace fs = std::filesystem;

namespace
{

class ConfigDirTest : public ::testing::Test
{
protected:
  void SetUp() override
  {
    root_ = fs::temp_directory_path() / "flowan_config_test";
    fs::remove_all(root_);
    fs::create_directories(root_ / "pkg" / "src");
  }

  void TearDown() override { fs::remove_all(root_); }

  void write(const fs::path & path, const std::string & text)
  {
    std::ofstream out(path);
    out << text;
  }

  fs::path root_;
};

}  // namespace

// ============================================================================
// Parsing
// ============================================================================

TEST(AnalysisConfig, EmptyDocumentKeepsDefaults)
{
  const ConfigLoadResult r = load_analysis_config_text("");
  ASSERT_TRUE(r.success) << r.error;

  const FlowOptions defaults;
  EXPECT_EQ(r.config.flow.initialization_promotion, defaults.initialization_promotion);
  EXPECT_EQ(r.config.flow.report_dead_code, defaults.report_dead_code);
  EXPECT_EQ(r.config.output.color, ColorMode::Auto);
  EXPECT_FALSE(r.config.output.dump_flow);
  EXPECT_TRUE(r.config.config_path.empty());
}

TEST(AnalysisConfig, ReadsAllSections)
{
  const ConfigLoadResult r = load_analysis_config_text(R"(
analysis:
  initialization_promotion: false
  assignment_promotion: false
  null_comparison_reachability: false
  report_dead_code: false
  report_unassigned_reads: true
  report_missing_returns: false
output:
  color: never
  dump_flow: true
)");
  ASSERT_TRUE(r.success) << r.error;

  EXPECT_FALSE(r.config.flow.initialization_promotion);
  EXPECT_FALSE(r.config.flow.assignment_promotion);
  EXPECT_FALSE(r.config.flow.null_comparison_reachability);
  EXPECT_FALSE(r.config.flow.report_dead_code);
  EXPECT_TRUE(r.config.flow.report_unassigned_reads);
  EXPECT_FALSE(r.config.flow.report_missing_returns);
  EXPECT_EQ(r.config.output.color, ColorMode::Never);
  EXPECT_TRUE(r.config.output.dump_flow);
}

TEST(AnalysisConfig, UnknownKeysAreIgnored)
{
  const ConfigLoadResult r = load_analysis_config_text(R"(
analysis:
  future_option: 3
extra:
  anything: [1, 2]
)");
  EXPECT_TRUE(r.success) << r.error;
}

TEST(AnalysisConfig, NonBooleanFlagIsRejected)
{
  const ConfigLoadResult r = load_analysis_config_text("analysis:\n  report_dead_code: sometimes\n");
  ASSERT_FALSE(r.success);
  EXPECT_EQ(r.error, "analysis.report_dead_code must be true or false, got 'sometimes'");

  const ConfigLoadResult nested = load_analysis_config_text("output:\n  dump_flow: [true]\n");
  ASSERT_FALSE(nested.success);
  EXPECT_EQ(nested.error, "output.dump_flow must be true or false");
}

TEST(AnalysisConfig, InvalidColorIsRejected)
{
  const ConfigLoadResult r = load_analysis_config_text("output:\n  color: rainbow\n");
  ASSERT_FALSE(r.success);
  EXPECT_EQ(r.error, "invalid output.color (must be 'auto', 'always' or 'never')");
}

TEST(AnalysisConfig, SectionsMustBeMaps)
{
  EXPECT_EQ(load_analysis_config_text("analysis: 3\n").error, "analysis must be a map");
  EXPECT_EQ(load_analysis_config_text("output: [a]\n").error, "output must be a map");
  EXPECT_EQ(load_analysis_config_text("- a\n- b\n").error, "configuration must be a map");
}

TEST(AnalysisConfig, SyntaxErrorIsReported)
{
  const ConfigLoadResult r = load_analysis_config_text("analysis: {report_dead_code: true");
  ASSERT_FALSE(r.success);
  EXPECT_EQ(r.error.rfind("failed to parse YAML: ", 0), 0u);
}

// ============================================================================
// Files
// ============================================================================

TEST_F(ConfigDirTest, LoadsFileAndRecordsPath)
{
  const fs::path file = root_ / "flowan.yaml";
  write(file, "output:\n  color: always\n");

  const ConfigLoadResult r = load_analysis_config(file);
  ASSERT_TRUE(r.success) << r.error;
  EXPECT_EQ(r.config.output.color, ColorMode::Always);
  EXPECT_EQ(r.config.config_path, fs::absolute(file));
}

TEST_F(ConfigDirTest, FileErrorsNameTheFile)
{
  const fs::path file = root_ / "flowan.yaml";
  write(file, "output:\n  color: loud\n");

  const ConfigLoadResult bad = load_analysis_config(file);
  ASSERT_FALSE(bad.success);
  EXPECT_EQ(bad.error.rfind(file.string() + ": ", 0), 0u);

  const ConfigLoadResult missing = load_analysis_config(root_ / "absent.yaml");
  ASSERT_FALSE(missing.success);
  EXPECT_NE(missing.error.find("configuration file not found"), std::string::npos);
}

TEST_F(ConfigDirTest, SearchWalksUpToNearestConfig)
{
  write(root_ / "flowan.yaml", "");
  const fs::path unit = root_ / "pkg" / "src" / "unit.json";
  write(unit, "{}");

  auto found = find_analysis_config(unit);
  ASSERT_TRUE(found.has_value());
  EXPECT_EQ(*found, fs::absolute(root_ / "flowan.yaml"));

  write(root_ / "pkg" / "flowan.yaml", "");
  found = find_analysis_config(root_ / "pkg" / "src");
  ASSERT_TRUE(found.has_value());
  EXPECT_EQ(*found, fs::absolute(root_ / "pkg" / "flowan.yaml"));
}
