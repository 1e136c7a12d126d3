/***
 * Name: test_denylist_loader
 * Purpose: Validate --deny value splitting, denylist file parsing and the combined load.
 */
#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>
#include <vector>
#include "config/DenylistLoader.h"
#include "purity/Denylist.h"
#include "puretop/exceptions/config_error.h"
#include "puretop/exceptions/file_read_error.h"

using namespace puretop;
using config::DenylistLoader;
using config::DenylistSource;

namespace fs = std::filesystem;

namespace {

std::string writeTemp(const std::string& name, const std::string& text) {
  const auto path = fs::temp_directory_path() / name;
  std::ofstream out(path, std::ios::binary);
  out << text;
  return path.string();
}

} // namespace

TEST(DenylistLoader, SplitNamesTrimsAndSkipsEmpty) {
  const auto names = DenylistLoader::splitNames(" a , b.c,,d ");
  ASSERT_EQ(names.size(), 3u);
  EXPECT_EQ(names[0], "a");
  EXPECT_EQ(names[1], "b.c");
  EXPECT_EQ(names[2], "d");
  EXPECT_TRUE(DenylistLoader::splitNames(" , ").empty());
}

TEST(DenylistLoader, ValidNames) {
  EXPECT_TRUE(DenylistLoader::isValidName("helper"));
  EXPECT_TRUE(DenylistLoader::isValidName("$jq"));
  EXPECT_TRUE(DenylistLoader::isValidName("_x1"));
  EXPECT_TRUE(DenylistLoader::isValidName("tslib_1.__extends"));
  EXPECT_FALSE(DenylistLoader::isValidName(""));
  EXPECT_FALSE(DenylistLoader::isValidName("1abc"));
  EXPECT_FALSE(DenylistLoader::isValidName("a..b"));
  EXPECT_FALSE(DenylistLoader::isValidName(".a"));
  EXPECT_FALSE(DenylistLoader::isValidName("a."));
  EXPECT_FALSE(DenylistLoader::isValidName("a-b"));
  EXPECT_FALSE(DenylistLoader::isValidName("a b"));
}

TEST(DenylistLoader, ParseFileIgnoresCommentsAndBlankLines) {
  const std::string text =
      "# project helpers\n"
      "\n"
      "  makeThing  \n"
      "ns.create # trailing note\n"
      "\t\n";
  const auto names = DenylistLoader::parseFile(text, "deny.txt");
  ASSERT_EQ(names.size(), 2u);
  EXPECT_EQ(names[0], "makeThing");
  EXPECT_EQ(names[1], "ns.create");
}

TEST(DenylistLoader, ParseFileReportsLineOfBadEntry) {
  try {
    (void)DenylistLoader::parseFile("ok\n\nnot valid\n", "deny.txt");
    FAIL() << "expected ConfigError";
  } catch (const exceptions::ConfigError& e) {
    EXPECT_EQ(std::string(e.what()), "deny.txt:3: invalid denylist entry 'not valid'");
  }
}

TEST(DenylistLoader, LoadDefaultsPlusExtraNames) {
  const auto list = DenylistLoader::load(DenylistSource{true, {"makeThing,ns.create", "other"}, {}});
  EXPECT_EQ(list.size(), purity::Denylist::defaults().size() + 3);
  EXPECT_TRUE(list.contains("__extends"));
  EXPECT_TRUE(list.contains("makeThing"));
  EXPECT_TRUE(list.contains("makeThing$2"));
  EXPECT_TRUE(list.contains("ns.create"));
  EXPECT_TRUE(list.contains("other"));
}

TEST(DenylistLoader, LoadWithoutDefaults) {
  const auto list = DenylistLoader::load(DenylistSource{false, {"only"}, {}});
  EXPECT_EQ(list.size(), 1u);
  EXPECT_TRUE(list.contains("only"));
  EXPECT_FALSE(list.contains("__extends"));
  EXPECT_TRUE(DenylistLoader::load(DenylistSource{false, {}, {}}).empty());
}

TEST(DenylistLoader, EmptyDenyValueIsAnError) {
  EXPECT_THROW((void)DenylistLoader::load(DenylistSource{true, {" , "}, {}}), exceptions::ConfigError);
}

TEST(DenylistLoader, InvalidDenyValueIsAnError) {
  try {
    (void)DenylistLoader::load(DenylistSource{true, {"good,bad-name"}, {}});
    FAIL() << "expected ConfigError";
  } catch (const exceptions::ConfigError& e) {
    EXPECT_EQ(std::string(e.what()), "--deny: invalid denylist entry 'bad-name'");
  }
}

TEST(DenylistLoader, LoadReadsDenylistFiles) {
  const auto path = writeTemp("puretop_test_denylist.txt", "# local\nregisterPlugin\r\nlib.init\n");
  const auto list = DenylistLoader::load(DenylistSource{false, {}, {path}});
  std::error_code ec;
  fs::remove(path, ec);
  EXPECT_EQ(list.size(), 2u);
  EXPECT_TRUE(list.contains("registerPlugin"));
  EXPECT_TRUE(list.contains("lib.init"));
}

TEST(DenylistLoader, MissingFileThrowsFileReadError) {
  const auto path = (fs::temp_directory_path() / "puretop_no_such_denylist.txt").string();
  std::error_code ec;
  fs::remove(path, ec);
  EXPECT_THROW((void)DenylistLoader::load(DenylistSource{true, {}, {path}}), exceptions::FileReadError);
}
