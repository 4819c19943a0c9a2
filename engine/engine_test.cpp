#include "engine/engine.hpp"

#include <sys/types.h>
#include <chrono>
#include <cstdlib>
#include <fstream>
#include <unistd.h>
#include <string>
#include <thread>

#include <kj/encoding.h>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "util/file.hpp"
#include "util/which.hpp"

namespace {

using ::testing::HasSubstr;
using ::testing::StartsWith;

const std::string test_tmpdir =
    "/tmp/snipbox_engine_testdir_" + std::to_string(getpid());

#define REQUIRE_INTERPRETER(name)                        \
  if (util::which(name, engine::kSandboxPath).empty()) { \
    GTEST_SKIP() << name << " is not installed";         \
  }

bool IsDead(pid_t pid) {
  std::ifstream stat("/proc/" + std::to_string(pid) + "/stat");
  if (!stat) return true;
  std::string line;
  std::getline(stat, line);
  size_t paren = line.rfind(')');
  if (paren == std::string::npos || paren + 2 >= line.size()) return true;
  return line[paren + 2] == 'Z';
}

class EngineTest : public ::testing::Test {
 protected:
  void SetUp() override {
    if (util::File::Exists(test_tmpdir)) util::File::RemoveTree(test_tmpdir);
    util::File::MakeDirs(test_tmpdir);
    options_.temp_directory = test_tmpdir;
  }
  void TearDown() override { util::File::RemoveTree(test_tmpdir); }

  engine::ExecutionResult Run(const std::string& code,
                              int32_t timeout = engine::kDefaultTimeoutSeconds,
                              engine::Language language =
                                  engine::Language::PYTHON) {
    engine::ExecutionRequest request;
    request.language = language;
    request.code = code;
    request.timeout_seconds = timeout;
    return engine::Engine(options_).Run(request);
  }

  engine::EngineOptions options_;
};

// NOLINTNEXTLINE
TEST(ClampTimeoutTest, TestClamp) {
  EXPECT_EQ(engine::ClampTimeout(-5), 1);
  EXPECT_EQ(engine::ClampTimeout(0), 1);
  EXPECT_EQ(engine::ClampTimeout(1), 1);
  EXPECT_EQ(engine::ClampTimeout(30), 30);
  EXPECT_EQ(engine::ClampTimeout(120), 120);
  EXPECT_EQ(engine::ClampTimeout(1000000), 120);
}

// NOLINTNEXTLINE
TEST_F(EngineTest, TestHelloWorld) {
  REQUIRE_INTERPRETER("python3");
  auto result = Run("print('hello')");
  EXPECT_EQ(result.stdout_data, "hello\n");
  EXPECT_EQ(result.stderr_data, "");
  EXPECT_EQ(result.exit_code, 0);
  EXPECT_TRUE(result.files.empty());
}

// NOLINTNEXTLINE
TEST_F(EngineTest, TestExitCodeAndStderr) {
  REQUIRE_INTERPRETER("python3");
  auto result = Run("import sys\nprint('oops', file=sys.stderr)\nsys.exit(3)");
  EXPECT_EQ(result.stderr_data, "oops\n");
  EXPECT_EQ(result.exit_code, 3);
}

// NOLINTNEXTLINE
TEST_F(EngineTest, TestUncaughtException) {
  REQUIRE_INTERPRETER("python3");
  auto result = Run("1 / 0");
  EXPECT_EQ(result.exit_code, 1);
  EXPECT_THAT(result.stderr_data, HasSubstr("ZeroDivisionError"));
}

// NOLINTNEXTLINE
TEST_F(EngineTest, TestKilledBySignal) {
  REQUIRE_INTERPRETER("python3");
  auto result = Run("import os, signal\nos.kill(os.getpid(), signal.SIGTERM)");
  EXPECT_EQ(result.exit_code, -15);
}

// NOLINTNEXTLINE
TEST_F(EngineTest, TestTimeout) {
  REQUIRE_INTERPRETER("python3");
  auto start = std::chrono::steady_clock::now();
  auto result = Run(
      "import sys, time\nprint('partial')\nprint('err', file=sys.stderr)\n"
      "time.sleep(30)",
      1);
  auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                     std::chrono::steady_clock::now() - start)
                     .count();
  EXPECT_EQ(result.exit_code, engine::kTimeoutExitCode);
  EXPECT_EQ(result.stdout_data, "partial\n");
  EXPECT_EQ(result.stderr_data, "Execution timed out after 1 seconds\nerr\n");
  EXPECT_LT(elapsed, 1000 + engine::kDrainMillis);
}

// NOLINTNEXTLINE
TEST_F(EngineTest, TestTimeoutWithoutStderr) {
  REQUIRE_INTERPRETER("python3");
  auto result = Run("while True: pass", 1);
  EXPECT_EQ(result.exit_code, engine::kTimeoutExitCode);
  EXPECT_EQ(result.stderr_data, "Execution timed out after 1 seconds");
}

// NOLINTNEXTLINE
TEST_F(EngineTest, TestTimeoutKillsDescendants) {
  REQUIRE_INTERPRETER("python3");
  auto result = Run(
      "import subprocess, time\n"
      "p = subprocess.Popen(['sleep', '60'])\n"
      "print(p.pid, flush=True)\n"
      "time.sleep(60)",
      1);
  ASSERT_EQ(result.exit_code, engine::kTimeoutExitCode);
  pid_t child = std::stoi(result.stdout_data);
  bool dead = false;
  for (int i = 0; i < 100 && !dead; i++) {
    dead = IsDead(child);
    if (!dead) std::this_thread::sleep_for(std::chrono::milliseconds(20));
  }
  EXPECT_TRUE(dead);
}

// NOLINTNEXTLINE
TEST_F(EngineTest, TestBackgroundChildDoesNotHoldResult) {
  REQUIRE_INTERPRETER("python3");
  auto start = std::chrono::steady_clock::now();
  auto result = Run(
      "import subprocess\n"
      "subprocess.Popen(['sleep', '60'])\n"
      "print('done')");
  auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                     std::chrono::steady_clock::now() - start)
                     .count();
  EXPECT_EQ(result.exit_code, 0);
  EXPECT_EQ(result.stdout_data, "done\n");
  EXPECT_LT(elapsed, engine::kDrainMillis);
}

// NOLINTNEXTLINE
TEST_F(EngineTest, TestOutputTruncation) {
  REQUIRE_INTERPRETER("python3");
  auto result = Run("import sys\nsys.stdout.write('x' * 300000)");
  EXPECT_EQ(result.exit_code, 0);
  EXPECT_EQ(result.stdout_data.size(), engine::kMaxOutputBytes);
}

// NOLINTNEXTLINE
TEST_F(EngineTest, TestInvalidUtf8) {
  REQUIRE_INTERPRETER("python3");
  auto result = Run("import sys\nsys.stdout.buffer.write(b'a\\xffb')");
  EXPECT_EQ(result.stdout_data, "a\xEF\xBF\xBD" "b");
}

// NOLINTNEXTLINE
TEST_F(EngineTest, TestFiles) {
  REQUIRE_INTERPRETER("python3");
  auto result = Run(
      "import os\n"
      "out = os.environ['OUTPUT_DIR']\n"
      "open(os.path.join(out, 'b.txt'), 'w').write('b')\n"
      "open(os.path.join(out, 'a.txt'), 'w').write('a')\n"
      "open(os.path.join(out, 'big.bin'), 'wb').write(b'0' * (6 << 20))\n"
      "open(os.path.join(out, 'small.bin'), 'wb').write(bytes(range(256)) * "
      "4)\n"
      "os.mkdir(os.path.join(out, 'sub'))\n"
      "open(os.path.join(out, 'sub', 'c.txt'), 'w').write('c')\n");
  EXPECT_EQ(result.exit_code, 0);
  ASSERT_EQ(result.files.size(), 3);
  EXPECT_EQ(result.files[0].name, "a.txt");
  EXPECT_EQ(result.files[1].name, "b.txt");
  EXPECT_EQ(result.files[2].name, "small.bin");
  EXPECT_EQ(result.files[2].size, 1024);

  std::string expected;
  for (int i = 0; i < 4; i++) {
    for (int c = 0; c < 256; c++) expected += static_cast<char>(c);
  }
  auto decoded =
      kj::decodeBase64(kj::StringPtr(result.files[2].data.c_str()));
  EXPECT_EQ(std::string(decoded.begin(), decoded.end()), expected);
}

// NOLINTNEXTLINE
TEST_F(EngineTest, TestFilesCollectedAfterTimeout) {
  REQUIRE_INTERPRETER("python3");
  auto result = Run(
      "import os, time\n"
      "open(os.path.join(os.environ['OUTPUT_DIR'], 'x'), 'w').write('x')\n"
      "time.sleep(30)",
      1);
  EXPECT_EQ(result.exit_code, engine::kTimeoutExitCode);
  ASSERT_EQ(result.files.size(), 1);
  EXPECT_EQ(result.files[0].name, "x");
}

// NOLINTNEXTLINE
TEST_F(EngineTest, TestEnvironment) {
  REQUIRE_INTERPRETER("python3");
  setenv("SNIPBOX_TEST_SECRET", "leaked", 1);
  auto result = Run(
      "import os\n"
      "print(os.environ.get('SNIPBOX_TEST_SECRET'))\n"
      "print(os.environ['HOME'] == os.getcwd())\n"
      "print(os.environ['PATH'])\n"
      "print(os.environ['OUTPUT_DIR'] == os.path.join(os.getcwd(), "
      "'output'))\n");
  unsetenv("SNIPBOX_TEST_SECRET");
  EXPECT_EQ(result.stdout_data,
            std::string("None\nTrue\n") + engine::kSandboxPath + "\nTrue\n");
}

// NOLINTNEXTLINE
TEST_F(EngineTest, TestCleanup) {
  REQUIRE_INTERPRETER("python3");
  Run("open('scratch', 'w').write('x')");
  Run("import time\ntime.sleep(30)", 1);
  Run("import os\nos.chmod(os.environ['OUTPUT_DIR'], 0o500)");
  EXPECT_TRUE(util::File::ListDir(test_tmpdir).empty());
}

// NOLINTNEXTLINE
TEST_F(EngineTest, TestMissingInterpreter) {
  options_.search_path = "/nonexistent/snipbox";
  auto result = Run("print(1)");
  EXPECT_EQ(result.exit_code, 1);
  EXPECT_EQ(result.stdout_data, "");
  EXPECT_EQ(result.stderr_data, "Cannot find interpreter: python3");
  EXPECT_TRUE(util::File::ListDir(test_tmpdir).empty());
}

// NOLINTNEXTLINE
TEST_F(EngineTest, TestStagingFailure) {
  std::string not_a_dir = util::File::JoinPath(test_tmpdir, "file");
  util::File::WriteAll(not_a_dir, "");
  options_.temp_directory = not_a_dir;
  auto result = Run("print(1)");
  EXPECT_EQ(result.exit_code, 1);
  EXPECT_EQ(result.stdout_data, "");
  EXPECT_THAT(result.stderr_data, StartsWith("Failed to prepare workspace: "));
}

// NOLINTNEXTLINE
TEST_F(EngineTest, TestConcurrentExecutions) {
  REQUIRE_INTERPRETER("python3");
  const int kRuns = 4;
  std::vector<engine::ExecutionResult> results(kRuns);
  std::vector<std::thread> threads;
  for (int i = 0; i < kRuns; i++) {
    threads.emplace_back([this, i, &results]() {
      results[i] = Run(
          "import os, time\n"
          "out = os.environ['OUTPUT_DIR']\n"
          "time.sleep(0.3)\n"
          "print(sorted(os.listdir(out)))\n"
          "open(os.path.join(out, 'id.txt'), 'w').write('" +
          std::to_string(i) + "')\n");
    });
  }
  for (auto& t : threads) t.join();
  for (int i = 0; i < kRuns; i++) {
    EXPECT_EQ(results[i].exit_code, 0);
    EXPECT_EQ(results[i].stdout_data, "[]\n");
    ASSERT_EQ(results[i].files.size(), 1);
    auto decoded =
        kj::decodeBase64(kj::StringPtr(results[i].files[0].data.c_str()));
    EXPECT_EQ(std::string(decoded.begin(), decoded.end()), std::to_string(i));
  }
  EXPECT_TRUE(util::File::ListDir(test_tmpdir).empty());
}

// NOLINTNEXTLINE
TEST_F(EngineTest, TestNode) {
  REQUIRE_INTERPRETER("node");
  auto result = Run(
      "const fs = require('fs');\n"
      "fs.writeFileSync(process.env.OUTPUT_DIR + '/n.txt', 'node');\n"
      "console.log('hi from node');\n",
      engine::kDefaultTimeoutSeconds, engine::Language::NODE);
  EXPECT_EQ(result.exit_code, 0);
  EXPECT_EQ(result.stdout_data, "hi from node\n");
  ASSERT_EQ(result.files.size(), 1);
  EXPECT_EQ(result.files[0].name, "n.txt");
  EXPECT_EQ(result.files[0].size, 4);
}

}  // namespace
