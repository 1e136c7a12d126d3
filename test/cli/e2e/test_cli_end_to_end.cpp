/***
 * Name: test_cli_end_to_end
 * Purpose: Exercise CLI/Driver end-to-end: help, output modes, reports, metrics and exit codes.
 */
#include <gtest/gtest.h>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <sys/wait.h>
#include <system_error>

#ifndef PURETOP_BIN
#define PURETOP_BIN "./puretop"
#endif

namespace fs = std::filesystem;

static std::string testing_dir() {
  const auto dir = fs::temp_directory_path() / "puretop_e2e";
  std::error_code ec;
  fs::create_directories(dir, ec);
  return dir.string();
}

static void write_file(const std::string& path, const std::string& s) {
  std::ofstream out(path, std::ios::binary); out << s;
}

static std::string read_all(const std::string& path) {
  std::ifstream in(path, std::ios::binary); std::ostringstream ss; ss << in.rdbuf(); return ss.str();
}

static int run(const std::string& args) {
  const std::string cmd = std::string(PURETOP_BIN) + " " + args;
  const int rc = std::system(cmd.c_str());
  return WIFEXITED(rc) ? WEXITSTATUS(rc) : -1;
}

TEST(CLI_EndToEnd, HelpPrintsUsage) {
  const auto dir = testing_dir();
  ASSERT_EQ(run("--help > " + dir + "/help.txt 2>/dev/null"), 0);
  auto u = read_all(dir + "/help.txt");
  ASSERT_NE(u.find("puretop [options] file"), std::string::npos);
}

TEST(CLI_EndToEnd, AnnotatesToStdout) {
  const auto dir = testing_dir();
  write_file(dir + "/a.js", "const a = foo();\nbar(1);\nfunction f() { return g(); }\n");
  ASSERT_EQ(run(dir + "/a.js > " + dir + "/a.out.js 2>/dev/null"), 0);
  EXPECT_EQ(read_all(dir + "/a.out.js"),
            "const a = /*#__PURE__*/foo();\nbar(1);\nfunction f() { return g(); }\n");
}

TEST(CLI_EndToEnd, WritesOutputFile) {
  const auto dir = testing_dir();
  write_file(dir + "/b.js", "export default new Registry;\n");
  ASSERT_EQ(run("-o " + dir + "/b.out.js " + dir + "/b.js 2>/dev/null"), 0);
  EXPECT_EQ(read_all(dir + "/b.out.js"), "export default /*#__PURE__*/new Registry;\n");
  EXPECT_EQ(read_all(dir + "/b.js"), "export default new Registry;\n");
}

TEST(CLI_EndToEnd, RewritesInPlace) {
  const auto dir = testing_dir();
  write_file(dir + "/c1.js", "x = make();\n");
  write_file(dir + "/c2.js", "y = __extends();\n");
  ASSERT_EQ(run("--in-place " + dir + "/c1.js " + dir + "/c2.js 2>/dev/null"), 0);
  EXPECT_EQ(read_all(dir + "/c1.js"), "x = /*#__PURE__*/make();\n");
  EXPECT_EQ(read_all(dir + "/c2.js"), "y = __extends();\n");
}

TEST(CLI_EndToEnd, InPlaceKeepsPermissions) {
  const auto dir = testing_dir();
  const auto script = dir + "/tool.js";
  write_file(script, "#!/usr/bin/env node\nfoo();\n");
  const auto mode = fs::perms::owner_all | fs::perms::group_read | fs::perms::group_exec |
                    fs::perms::others_read | fs::perms::others_exec;
  fs::permissions(script, mode, fs::perm_options::replace);
  ASSERT_EQ(run("--in-place " + script + " 2>/dev/null"), 0);
  EXPECT_EQ(read_all(script), "#!/usr/bin/env node\n/*#__PURE__*/foo();\n");
  EXPECT_EQ(fs::status(script).permissions() & fs::perms::mask, mode);
}

TEST(CLI_EndToEnd, InPlaceFollowsSymlink) {
  const auto dir = testing_dir();
  const auto real = dir + "/real.js";
  const auto link = dir + "/link.js";
  write_file(real, "boot();\n");
  std::error_code ec;
  fs::remove(link, ec);
  fs::create_symlink(real, link);
  ASSERT_EQ(run("--in-place " + link + " 2>/dev/null"), 0);
  EXPECT_TRUE(fs::is_symlink(fs::symlink_status(link)));
  EXPECT_EQ(read_all(real), "/*#__PURE__*/boot();\n");
}

TEST(CLI_EndToEnd, DenyOptionSuppressesAnnotation) {
  const auto dir = testing_dir();
  write_file(dir + "/d.js", "const p = registerPlugin();\n");
  ASSERT_EQ(run("--deny=registerPlugin " + dir + "/d.js > " + dir + "/d.out.js 2>/dev/null"), 0);
  EXPECT_EQ(read_all(dir + "/d.out.js"), "const p = registerPlugin();\n");
}

TEST(CLI_EndToEnd, ReportListsVerdicts) {
  const auto dir = testing_dir();
  write_file(dir + "/e.js", "foo();\nbar(1);\n");
  ASSERT_EQ(run("--report " + dir + "/e.js > /dev/null 2> " + dir + "/e.report.txt"), 0);
  const auto rep = read_all(dir + "/e.report.txt");
  EXPECT_NE(rep.find("e.js:1:1: Call foo args=0 Eligible Applied"), std::string::npos);
  EXPECT_NE(rep.find("e.js:2:1: Call bar args=1 HasArguments"), std::string::npos);
}

TEST(CLI_EndToEnd, MetricsJson) {
  const auto dir = testing_dir();
  write_file(dir + "/m.js", "const m = new Map();\n");
  ASSERT_EQ(run("--metrics-json --log-path=" + dir + "/logs " + dir + "/m.js > /dev/null 2> " + dir + "/m.json"), 0);
  const auto js = read_all(dir + "/m.json");
  EXPECT_NE(js.find("\"durations_ms\""), std::string::npos);
  EXPECT_NE(js.find("\"parse\""), std::string::npos);
  EXPECT_NE(js.find("\"optimizer\""), std::string::npos);
  EXPECT_NE(js.find("\"pure_effective\""), std::string::npos);
  bool found = false;
  for (const auto& entry : fs::directory_iterator(dir + "/logs")) {
    if (entry.path().filename().string().find("metrics.json") != std::string::npos) { found = true; }
  }
  EXPECT_TRUE(found);
}

TEST(CLI_EndToEnd, ParseErrorExitsOne) {
  const auto dir = testing_dir();
  write_file(dir + "/bad.js", "foo(;\n");
  ASSERT_EQ(run("--color=never " + dir + "/bad.js > /dev/null 2> " + dir + "/bad.err"), 1);
  const auto err = read_all(dir + "/bad.err");
  EXPECT_NE(err.find("bad.js:1:5: error: parse error:"), std::string::npos);
}

TEST(CLI_EndToEnd, MissingInputExitsOne) {
  const auto dir = testing_dir();
  ASSERT_EQ(run("--color=never " + dir + "/does_not_exist.js > /dev/null 2> " + dir + "/missing.err"), 1);
  EXPECT_NE(read_all(dir + "/missing.err").find("failed to open file: "), std::string::npos);
}

TEST(CLI_EndToEnd, DeepNestingExitsOne) {
  const auto dir = testing_dir();
  write_file(dir + "/deep.js", "x = " + std::string(5000, '(') + "1" + std::string(5000, ')') + ";\n");
  ASSERT_EQ(run("--color=never " + dir + "/deep.js > /dev/null 2> " + dir + "/deep.err"), 1);
  EXPECT_NE(read_all(dir + "/deep.err").find("nesting too deep"), std::string::npos);
}

TEST(CLI_EndToEnd, UsageErrorsExitTwo) {
  const auto dir = testing_dir();
  write_file(dir + "/u.js", "foo();\n");
  EXPECT_EQ(run("--bogus " + dir + "/u.js > /dev/null 2>&1"), 2);
  EXPECT_EQ(run("> /dev/null 2>&1"), 2);
  EXPECT_EQ(run("--deny=not-a-name " + dir + "/u.js > /dev/null 2>&1"), 2);
  EXPECT_EQ(run("--deny-file=" + dir + "/missing_list.txt " + dir + "/u.js > /dev/null 2>&1"), 2);
}
