// stdc++
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <initializer_list>
#include <sstream>
#include <string>

// posix
#include <sys/wait.h>

// gtest
#include <gtest/gtest.h>

namespace fs = std::filesystem;

namespace {
struct run_result {
  int status;
  std::string out;
  std::string err;
};

std::string quote(const std::string &arg) {
  std::string quoted = "'";
  for (char c : arg) {
    if (c == '\'')
      quoted += "'\\''";
    else
      quoted += c;
  }
  return quoted + "'";
}

std::string read_all(const fs::path &path) {
  std::ifstream file(path);
  std::ostringstream contents;
  contents << file.rdbuf();
  return contents.str();
}

class CliTest : public testing::Test {
protected:
  fs::path dir;

  void SetUp() override {
    const auto *info = testing::UnitTest::GetInstance()->current_test_info();
    dir = fs::temp_directory_path() /
          (std::string("structoff_") + info->name());
    fs::remove_all(dir);
    fs::create_directories(dir);
  }

  void TearDown() override { fs::remove_all(dir); }

  run_result run(std::initializer_list<std::string> args) const {
    std::string cmd = quote(STRUCTOFF_BINARY);
    for (const auto &arg : args)
      cmd += " " + quote(arg);
    fs::path out = dir / "stdout.txt";
    fs::path err = dir / "stderr.txt";
    cmd += " >" + quote(out.string()) + " 2>" + quote(err.string());
    int status = std::system(cmd.c_str());
    run_result result{-1, read_all(out), read_all(err)};
    if (status != -1 && WIFEXITED(status))
      result.status = WEXITSTATUS(status);
    fs::remove(out);
    fs::remove(err);
    return result;
  }

  fs::path write_config(const std::string &xml) const {
    fs::path path = dir / "structs.xml";
    std::ofstream file(path);
    file << xml;
    return path;
  }
};
} // namespace

TEST_F(CliTest, PrintsJavaClassThroughTypedef) {
  auto result = run({STRUCTOFF_POINT_OBJECT, "Point_t"});
  EXPECT_EQ(result.status, 0);
  EXPECT_EQ(result.out, "final class Point_t {\n"
                        "  public static final int x = 0x0;\n"
                        "  public static final int y = 0x4;\n"
                        "}\n");
  EXPECT_EQ(result.err, "");
}

TEST_F(CliTest, NoDebugInfo) {
  auto result = run({STRUCTOFF_NODEBUG_OBJECT, "Point_t"});
  EXPECT_EQ(result.status, 1);
  EXPECT_EQ(result.out, "");
  EXPECT_EQ(result.err.rfind("structoff: ", 0), 0u) << result.err;
  EXPECT_NE(result.err.find("file does not contain debug information"),
            std::string::npos)
      << result.err;
}

TEST_F(CliTest, StructNotFound) {
  auto result = run({STRUCTOFF_POINT_OBJECT, "Scalar"});
  EXPECT_EQ(result.status, 1);
  EXPECT_EQ(result.out, "");
  EXPECT_EQ(result.err.rfind("structoff: ", 0), 0u) << result.err;
  EXPECT_NE(result.err.find("could not find struct"), std::string::npos)
      << result.err;
  EXPECT_NE(result.err.find("Scalar"), std::string::npos) << result.err;
}

TEST_F(CliTest, ArgumentError) {
  auto result = run({STRUCTOFF_POINT_OBJECT});
  EXPECT_EQ(result.status, 1);
  EXPECT_EQ(result.out, "");
  EXPECT_EQ(result.err.rfind("structoff: missing struct name\n", 0), 0u)
      << result.err;
}

TEST_F(CliTest, BatchWritesEveryStruct) {
  auto config = write_config(R"(
    <config>
      <package>com.example</package>
      <structs>
        <struct name="Point_t"/>
        <struct name="Anon_t" output="anon/Anon.java"/>
      </structs>
    </config>)");
  fs::create_directories(dir / "anon");
  auto result = run({"-c", config.string(), "-d", dir.string(),
                     STRUCTOFF_POINT_OBJECT});
  EXPECT_EQ(result.status, 0) << result.err;
  EXPECT_EQ(result.out, "");
  EXPECT_EQ(read_all(dir / "Point_t.java"),
            "package com.example;\n"
            "\n"
            "final class Point_t {\n"
            "  public static final int x = 0x0;\n"
            "  public static final int y = 0x4;\n"
            "}\n");
  EXPECT_NE(read_all(dir / "anon" / "Anon.java").find("final class Anon_t {"),
            std::string::npos);
}

TEST_F(CliTest, BatchWritesNothingOnFailure) {
  auto config = write_config(R"(
    <config><structs>
      <struct name="Point_t"/>
      <struct name="Missing"/>
    </structs></config>)");
  auto result = run({"-c", config.string(), "-d", dir.string(),
                     STRUCTOFF_POINT_OBJECT});
  EXPECT_EQ(result.status, 1);
  EXPECT_EQ(result.err.rfind("structoff: ", 0), 0u) << result.err;
  EXPECT_NE(result.err.find("Missing"), std::string::npos) << result.err;
  EXPECT_FALSE(fs::exists(dir / "Point_t.java"));
}

TEST_F(CliTest, BatchRejectsSharedOutputFile) {
  auto config = write_config(R"(
    <config><structs>
      <struct name="Point_t" output="Point.java"/>
      <struct name="Point"/>
    </structs></config>)");
  auto result = run({"-c", config.string(), "-d", dir.string(),
                     STRUCTOFF_POINT_OBJECT});
  EXPECT_EQ(result.status, 1);
  EXPECT_EQ(result.err.rfind("structoff: ", 0), 0u) << result.err;
  EXPECT_FALSE(fs::exists(dir / "Point.java"));
}
