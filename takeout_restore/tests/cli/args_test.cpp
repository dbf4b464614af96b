#include "cli/args.hpp"

#include <gtest/gtest.h>

#include <stdexcept>
#include <vector>

namespace takeoutrestore {
namespace {
auto Parse(std::vector<const char*> argv) -> Args {
  argv.insert(argv.begin(), "takeout_restore");
  return Args(static_cast<int>(argv.size()), argv.data());
}
}  // namespace

TEST(ArgsTests, EmptyCommandLineTest) {
  Args args = Parse({});
  EXPECT_FALSE(args.print_help_);
  EXPECT_FALSE(args.config_path_.has_value());
  EXPECT_FALSE(args.input_folder_.has_value());
  EXPECT_FALSE(args.dry_run_.has_value());
}

TEST(ArgsTests, AllOptionsTest) {
  Args args = Parse({"-i", "/takeout/Google Photos", "--config", "restore.json", "-k",
                     "--no-file-dates", "-n", "--no-recursive", "-j", "4", "-l", "debug",
                     "--log-file", "restore.log"});
  EXPECT_EQ(args.input_folder_, "/takeout/Google Photos");
  EXPECT_EQ(args.config_path_, "restore.json");
  EXPECT_EQ(args.delete_json_, false);
  EXPECT_EQ(args.update_file_dates_, false);
  EXPECT_EQ(args.dry_run_, true);
  EXPECT_EQ(args.recursive_, false);
  EXPECT_EQ(args.jobs_, 4u);
  EXPECT_EQ(args.log_level_, DiagnosticLevel::DEBUG);
  EXPECT_EQ(args.log_file_, "restore.log");
}

TEST(ArgsTests, HelpAndVersionTest) {
  EXPECT_TRUE(Parse({"--help"}).print_help_);
  EXPECT_TRUE(Parse({"-h", "--bogus"}).print_help_);
  EXPECT_TRUE(Parse({"--version"}).print_version_);
  EXPECT_NE(Args::HelpText("takeout_restore").find("--dry-run"), std::string::npos);
}

TEST(ArgsTests, BadCommandLinesTest) {
  EXPECT_THROW(Parse({"--bogus"}), std::runtime_error);
  EXPECT_THROW(Parse({"-i"}), std::runtime_error);
  EXPECT_THROW(Parse({"-j", "0"}), std::runtime_error);
  EXPECT_THROW(Parse({"-j", "-2"}), std::runtime_error);
  EXPECT_THROW(Parse({"-j", "four"}), std::runtime_error);
  EXPECT_THROW(Parse({"-j", "4x"}), std::runtime_error);
  EXPECT_THROW(Parse({"--log-level", "chatty"}), std::runtime_error);
}

TEST(ArgsTests, ApplyOverridesOnlyGivenOptionsTest) {
  RestoreConfig config;
  config.input_folder_ = "/from/config";
  config.jobs_         = 8;
  config.delete_json_  = true;

  Parse({"-n", "-j", "2"}).ApplyTo(config);

  EXPECT_EQ(config.input_folder_, "/from/config");
  EXPECT_EQ(config.jobs_, 2u);
  EXPECT_TRUE(config.dry_run_);
  EXPECT_TRUE(config.delete_json_);
  EXPECT_TRUE(config.recursive_);
}
};  // namespace takeoutrestore
