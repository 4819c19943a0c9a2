#include "engine/collector.hpp"

#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>
#include <string>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "util/file.hpp"

namespace {

const std::string test_tmpdir =
    "/tmp/snipbox_collector_testdir_" + std::to_string(getpid());

class CollectorTest : public ::testing::Test {
 protected:
  void SetUp() override {
    if (util::File::Exists(test_tmpdir)) util::File::RemoveTree(test_tmpdir);
    util::File::MakeDirs(test_tmpdir);
  }
  void TearDown() override { util::File::RemoveTree(test_tmpdir); }

  std::string Path(const std::string& name) {
    return util::File::JoinPath(test_tmpdir, name);
  }
};

// NOLINTNEXTLINE
TEST_F(CollectorTest, TestSortedAndEncoded) {
  util::File::WriteAll(Path("b.txt"), "world");
  util::File::WriteAll(Path("a.txt"), "hello");
  util::File::WriteAll(Path("empty"), "");
  auto files = engine::CollectOutputFiles(test_tmpdir, 100);
  ASSERT_EQ(files.size(), 3);
  EXPECT_EQ(files[0].name, "a.txt");
  EXPECT_EQ(files[0].data, "aGVsbG8=");
  EXPECT_EQ(files[0].size, 5);
  EXPECT_EQ(files[1].name, "b.txt");
  EXPECT_EQ(files[1].data, "d29ybGQ=");
  EXPECT_EQ(files[2].name, "empty");
  EXPECT_EQ(files[2].data, "");
  EXPECT_EQ(files[2].size, 0);
}

// NOLINTNEXTLINE
TEST_F(CollectorTest, TestSizeCeiling) {
  util::File::WriteAll(Path("below"), std::string(9, 'x'));
  util::File::WriteAll(Path("exact"), std::string(10, 'x'));
  util::File::WriteAll(Path("above"), std::string(11, 'x'));
  auto files = engine::CollectOutputFiles(test_tmpdir, 10);
  ASSERT_EQ(files.size(), 1);
  EXPECT_EQ(files[0].name, "below");
  EXPECT_EQ(files[0].size, 9);
}

// NOLINTNEXTLINE
TEST_F(CollectorTest, TestSkipsNonRegular) {
  util::File::MakeDirs(Path("sub"));
  util::File::WriteAll(Path("sub/nested.txt"), "nested");
  ASSERT_EQ(symlink("/etc/passwd", Path("link").c_str()), 0);
  ASSERT_EQ(mkfifo(Path("fifo").c_str(), S_IRUSR | S_IWUSR), 0);
  util::File::WriteAll(Path("z.txt"), "z");
  auto files = engine::CollectOutputFiles(test_tmpdir, 100);
  ASSERT_EQ(files.size(), 1);
  EXPECT_EQ(files[0].name, "z.txt");
}

// NOLINTNEXTLINE
TEST_F(CollectorTest, TestBinaryContents) {
  std::string binary;
  for (int i = 0; i < 256; i++) binary += static_cast<char>(i);
  util::File::WriteAll(Path("bin"), binary);
  auto files = engine::CollectOutputFiles(test_tmpdir, 1000);
  ASSERT_EQ(files.size(), 1);
  EXPECT_EQ(files[0].size, 256);
  EXPECT_EQ(files[0].data.size(), 344);
}

// NOLINTNEXTLINE
TEST_F(CollectorTest, TestSymlinkedDirectory) {
  util::File::MakeDirs(Path("host"));
  util::File::WriteAll(Path("host/secret.txt"), "secret");
  ASSERT_EQ(symlink(Path("host").c_str(), Path("output").c_str()), 0);
  EXPECT_TRUE(engine::CollectOutputFiles(Path("output"), 100).empty());
  EXPECT_EQ(engine::CollectOutputFiles(Path("host"), 100).size(), 1);
}

// NOLINTNEXTLINE
TEST_F(CollectorTest, TestMissingDirectory) {
  EXPECT_TRUE(engine::CollectOutputFiles(Path("missing"), 100).empty());
}

}  // namespace
