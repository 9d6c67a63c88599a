
#include "argparser.hpp"
#include "config.hpp"
#include "exception.hpp"

#include <gtest/gtest.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

namespace {

std::vector<char*> make_argv(std::vector<std::string>& args) {
  std::vector<char*> argv;
  for (auto& arg : args) {
    argv.push_back(arg.data());
  }
  return argv;
}

}  // namespace

TEST(Config, Parse) {
  treeup::config cfg = treeup::config::parse(R"({
    "Username": "alice",
    "Password": "secret",
    "BaseFolderHash": "base123",
    "FolderKey": "key456"
  })");

  EXPECT_EQ(cfg.username, "alice");
  EXPECT_EQ(cfg.password, "secret");
  EXPECT_EQ(cfg.base_folder_hash, "base123");
  EXPECT_EQ(cfg.folder_key, "key456");
  EXPECT_EQ(cfg.remote_url, treeup::config::default_remote_url);
  EXPECT_EQ(cfg.access, treeup::access_type::link);
  EXPECT_EQ(cfg.timeout, treeup::config::default_timeout);

  treeup::remote_folder base = cfg.base_folder();
  EXPECT_EQ(base.hash, "base123");
  EXPECT_EQ(base.upload_key(), "key456");
  EXPECT_EQ(cfg.credentials().username, "alice");
}

TEST(Config, ParseOptionalKeys) {
  treeup::config cfg = treeup::config::parse(
      R"({"RemoteUrl": "http://localhost:8080", "AccessType": "private", "Timeout": 45, "Username": null})");

  EXPECT_EQ(cfg.remote_url, "http://localhost:8080");
  EXPECT_EQ(cfg.access, treeup::access_type::private_access);
  EXPECT_EQ(cfg.timeout, std::chrono::seconds(45));
  EXPECT_EQ(cfg.options().timeout, std::chrono::seconds(45));
  EXPECT_TRUE(cfg.username.empty());
}

TEST(Config, ParseErrors) {
  EXPECT_THROW(treeup::config::parse("not json"), treeup::configuration_error);
  EXPECT_THROW(treeup::config::parse("[1, 2]"), treeup::configuration_error);
  EXPECT_THROW(treeup::config::parse(R"({"Username": 42})"), treeup::configuration_error);
  EXPECT_THROW(treeup::config::parse(R"({"AccessType": "PUBLIC"})"), treeup::configuration_error);
  EXPECT_THROW(treeup::config::parse(R"({"Timeout": -1})"), treeup::configuration_error);
  EXPECT_THROW(treeup::config::parse(R"({"Timeout": "10"})"), treeup::configuration_error);
}

TEST(Config, ValidateFileUpload) {
  treeup::config cfg;
  try {
    cfg.validate_for_file_upload();
    FAIL() << "expected configuration_error";
  }
  catch (const treeup::configuration_error& e) {
    EXPECT_NE(std::string(e.what()).find("BaseFolderHash"), std::string::npos);
    EXPECT_NE(std::string(e.what()).find("FolderKey"), std::string::npos);
  }

  cfg.base_folder_hash = "base";
  cfg.folder_key = "key";
  EXPECT_NO_THROW(cfg.validate_for_file_upload());
}

TEST(Config, ValidateFolderUpload) {
  treeup::config cfg;
  cfg.base_folder_hash = "base";
  cfg.username = "alice";

  try {
    cfg.validate_for_folder_upload();
    FAIL() << "expected configuration_error";
  }
  catch (const treeup::configuration_error& e) {
    EXPECT_NE(std::string(e.what()).find("Password"), std::string::npos);
    EXPECT_EQ(std::string(e.what()).find("Username"), std::string::npos);
  }

  // Folder uploads do not need the folder key
  cfg.password = "secret";
  EXPECT_NO_THROW(cfg.validate_for_folder_upload());
}

TEST(Config, SaveAndLoad) {
  std::filesystem::path dir = std::filesystem::temp_directory_path() / "treeup_test_config";
  std::filesystem::remove_all(dir);
  std::filesystem::path path = dir / "nested" / "config.json";

  treeup::config cfg;
  cfg.username = "alice";
  cfg.password = "secret";
  cfg.base_folder_hash = "base123";
  cfg.folder_key = "key456";
  cfg.access = treeup::access_type::private_access;
  cfg.save(path);

  auto perms = std::filesystem::status(path).permissions();
  EXPECT_EQ(perms & std::filesystem::perms::group_read, std::filesystem::perms::none);
  EXPECT_EQ(perms & std::filesystem::perms::others_read, std::filesystem::perms::none);

  treeup::config loaded = treeup::config::load(path);
  EXPECT_EQ(loaded.username, "alice");
  EXPECT_EQ(loaded.password, "secret");
  EXPECT_EQ(loaded.base_folder_hash, "base123");
  EXPECT_EQ(loaded.folder_key, "key456");
  EXPECT_EQ(loaded.access, treeup::access_type::private_access);

  std::filesystem::remove_all(dir);
}

TEST(Config, SaveRestrictsExistingFile) {
  std::filesystem::path dir = std::filesystem::temp_directory_path() / "treeup_test_config_existing";
  std::filesystem::remove_all(dir);
  std::filesystem::create_directories(dir);
  std::filesystem::path path = dir / "config.json";

  {
    std::ofstream file(path);
    file << R"({"Username": "old", "Password": "oldsecret"})" << std::endl;
  }
  std::filesystem::permissions(
      path,
      std::filesystem::perms::owner_read | std::filesystem::perms::owner_write | std::filesystem::perms::group_read |
          std::filesystem::perms::others_read,
      std::filesystem::perm_options::replace);

  treeup::config cfg;
  cfg.username = "bob";
  cfg.password = "newsecret";
  cfg.base_folder_hash = "base789";
  cfg.save(path);

  auto perms = std::filesystem::status(path).permissions();
  EXPECT_EQ(perms & std::filesystem::perms::group_all, std::filesystem::perms::none);
  EXPECT_EQ(perms & std::filesystem::perms::others_all, std::filesystem::perms::none);
  EXPECT_NE(perms & std::filesystem::perms::owner_read, std::filesystem::perms::none);

  treeup::config loaded = treeup::config::load(path);
  EXPECT_EQ(loaded.username, "bob");
  EXPECT_EQ(loaded.password, "newsecret");
  EXPECT_EQ(loaded.base_folder_hash, "base789");

  std::filesystem::remove_all(dir);
}

TEST(Config, LoadMissingFile) {
  EXPECT_THROW(treeup::config::load("/nonexistent/treeup/config.json"), treeup::configuration_error);
}

TEST(Config, DumpMasksPassword) {
  treeup::config cfg;
  cfg.password = "secret";
  EXPECT_EQ(cfg.dump(true).find("secret"), std::string::npos);
  EXPECT_NE(cfg.dump(false).find("secret"), std::string::npos);
}

TEST(Argparser, OptionsAndValues) {
  treeup::argparser parser;
  parser.add_option("--remote", "https://default");
  parser.add_option_alias("--remote", "-r");
  parser.add_option("--timeout", "");
  parser.add_bool_option("--json");

  std::vector<std::string> args = {"treeup", "upload", "-r", "http://localhost", "--json", "dir", "--timeout=30"};
  auto argv = make_argv(args);
  parser.parse(static_cast<int>(argv.size()), argv.data());

  EXPECT_EQ(parser.command(), "treeup");
  EXPECT_EQ(parser.size(), 2);
  EXPECT_EQ(parser[0], "upload");
  EXPECT_EQ(parser[1], "dir");
  EXPECT_EQ(parser.get_option("--remote"), "http://localhost");
  EXPECT_TRUE(parser.has_option("--json"));
  EXPECT_EQ(parser.get_option_int("--timeout"), 30);
}

TEST(Argparser, Defaults) {
  treeup::argparser parser;
  parser.add_option("--remote", "https://default");
  parser.add_bool_option("--json");

  std::vector<std::string> args = {"treeup"};
  auto argv = make_argv(args);
  parser.parse(static_cast<int>(argv.size()), argv.data());

  EXPECT_FALSE(parser.has_option("--remote"));
  EXPECT_EQ(parser.get_option("--remote"), "https://default");
  EXPECT_FALSE(parser.has_option("--json"));
}

TEST(Argparser, Errors) {
  treeup::argparser parser;
  parser.add_option("--remote", "");
  parser.add_bool_option("--json");

  std::vector<std::string> unknown = {"treeup", "--bogus"};
  auto argv1 = make_argv(unknown);
  EXPECT_THROW(parser.parse(static_cast<int>(argv1.size()), argv1.data()), std::invalid_argument);

  std::vector<std::string> missing = {"treeup", "--remote"};
  auto argv2 = make_argv(missing);
  EXPECT_THROW(parser.parse(static_cast<int>(argv2.size()), argv2.data()), std::invalid_argument);

  std::vector<std::string> flag_value = {"treeup", "--json=yes"};
  auto argv3 = make_argv(flag_value);
  EXPECT_THROW(parser.parse(static_cast<int>(argv3.size()), argv3.data()), std::invalid_argument);

  EXPECT_THROW(parser.get_option("--bogus"), std::invalid_argument);
  EXPECT_THROW(parser.add_option_alias("--bogus", "-b"), std::invalid_argument);
}

TEST(Argparser, InvalidInteger) {
  treeup::argparser parser;
  parser.add_option("--timeout", "");

  std::vector<std::string> args = {"treeup", "--timeout", "10s"};
  auto argv = make_argv(args);
  parser.parse(static_cast<int>(argv.size()), argv.data());

  EXPECT_THROW(parser.get_option_int("--timeout"), std::invalid_argument);
}

TEST(Argparser, Environment) {
  setenv("TREEUP_TEST_REMOTE_URL", "http://from-env", 1);

  treeup::argparser parser;
  parser.set_env_prefix("TREEUP");
  parser.add_option("--test-remote-url", "");

  std::vector<std::string> args = {"treeup"};
  auto argv = make_argv(args);
  parser.parse(static_cast<int>(argv.size()), argv.data());
  EXPECT_EQ(parser.get_option("--test-remote-url"), "http://from-env");

  // Command line wins over the environment
  std::vector<std::string> override_args = {"treeup", "--test-remote-url", "http://from-cli"};
  auto argv2 = make_argv(override_args);
  parser.parse(static_cast<int>(argv2.size()), argv2.data());
  EXPECT_EQ(parser.get_option("--test-remote-url"), "http://from-cli");

  unsetenv("TREEUP_TEST_REMOTE_URL");
}
