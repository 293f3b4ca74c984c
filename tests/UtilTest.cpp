#include <gtest/gtest.h>

#include "util.h"

namespace mosaic {
namespace {

TEST(UtilTest, HumanSize) {
  EXPECT_EQ(HumanSize(0), "0 B");
  EXPECT_EQ(HumanSize(1023), "1023 B");
  EXPECT_EQ(HumanSize(1024), "1.0 KB");
  EXPECT_EQ(HumanSize(1536), "1.5 KB");
  EXPECT_EQ(HumanSize(5ull * 1024 * 1024), "5.0 MB");
}

TEST(UtilTest, TrimAndLower) {
  EXPECT_EQ(Trim("  a b \t"), "a b");
  EXPECT_EQ(Trim("   "), "");
  EXPECT_EQ(ToLower("MiXeD"), "mixed");
  EXPECT_TRUE(ContainsNoCase("Create File", "file"));
  EXPECT_FALSE(ContainsNoCase("Create Folder", "file"));
  EXPECT_TRUE(ContainsNoCase("anything", ""));
}

TEST(UtilTest, PathHelpers) {
  EXPECT_EQ(NormalizeDir("/a/b/"), "/a/b");
  EXPECT_EQ(NormalizeDir("/"), "/");
  EXPECT_EQ(NormalizeDir("/a/b\\c.txt/"), "/a/b\\c.txt");

  EXPECT_EQ(JoinPath("/", "x"), "/x");
  EXPECT_EQ(JoinPath("/a/", "x"), "/a/x");
  EXPECT_EQ(BaseName("/a/b.txt"), "b.txt");
  EXPECT_EQ(BaseName("/"), "");
  EXPECT_EQ(BaseName("/a/a\\b.txt"), "a\\b.txt");
  EXPECT_EQ(ParentPath("/a/a\\b.txt"), "/a");
  EXPECT_EQ(ParentPath("/a/b.txt"), "/a");
  EXPECT_EQ(ParentPath("/a"), "/");
  EXPECT_EQ(ParentPath("/"), "/");
  EXPECT_EQ(ParentPath("relative"), "");

  EXPECT_TRUE(IsAbsolutePath("/usr"));
  EXPECT_TRUE(IsAbsolutePath("D:\\x"));
  EXPECT_FALSE(IsAbsolutePath("Documents"));
}

TEST(UtilTest, EntryNames) {
  EXPECT_TRUE(IsValidEntryName("notes.txt"));
  EXPECT_FALSE(IsValidEntryName(""));
  EXPECT_FALSE(IsValidEntryName(".."));
  EXPECT_FALSE(IsValidEntryName("a/b"));
}

TEST(UtilTest, UniqueNamePicksSmallestFreeSuffix) {
  EXPECT_EQ(UniqueName("x.txt", {}), "x.txt");
  EXPECT_EQ(UniqueName("x.txt", {"x.txt"}), "x (1).txt");
  EXPECT_EQ(UniqueName("x.txt", {"x.txt", "x (1).txt", "x (3).txt"}), "x (2).txt");
  EXPECT_EQ(UniqueName("folder", {"folder"}), "folder (1)");
  EXPECT_EQ(UniqueName(".bashrc", {".bashrc"}), ".bashrc (1)");
  EXPECT_EQ(UniqueName("a.tar.gz", {"a.tar.gz"}), "a.tar (1).gz");
}

TEST(UtilTest, ParseFileInput) {
  std::string dir;
  std::string name;

  ASSERT_TRUE(ParseFileInput("notes.txt", "/home/u", &dir, &name).ok());
  EXPECT_EQ(dir, "/home/u");
  EXPECT_EQ(name, "notes.txt");

  ASSERT_TRUE(ParseFileInput("sub/notes.txt", "/home/u", &dir, &name).ok());
  EXPECT_EQ(dir, "/home/u/sub");
  EXPECT_EQ(name, "notes.txt");

  ASSERT_TRUE(ParseFileInput("/etc/x.conf", "/home/u", &dir, &name).ok());
  EXPECT_EQ(dir, "/etc");
  EXPECT_EQ(name, "x.conf");

  ASSERT_TRUE(ParseFileInput("/top", "/home/u", &dir, &name).ok());
  EXPECT_EQ(dir, "/");
  EXPECT_EQ(name, "top");

  ASSERT_TRUE(ParseFileInput("sub\\notes.txt", "/srv/odd\\dir", &dir, &name).ok());
  EXPECT_EQ(dir, "/srv/odd\\dir/sub");
  EXPECT_EQ(name, "notes.txt");

  const auto empty = ParseFileInput("   ", "/home/u", &dir, &name);
  EXPECT_TRUE(empty.failed());
  EXPECT_EQ(empty.kind, ErrorKind::Validation);
  EXPECT_EQ(empty.message, "Name cannot be empty");

  EXPECT_TRUE(ParseFileInput("sub/", "/home/u", &dir, &name).failed());
}

TEST(UtilTest, ResultHelpers) {
  EXPECT_TRUE(OkResult().ok());
  EXPECT_TRUE(SkippedResult("same").ok());
  EXPECT_TRUE(CanceledResult().cancelled());
  EXPECT_FALSE(CanceledResult().ok());
  const auto err = ErrorResult(ErrorKind::NotFound, "gone");
  EXPECT_TRUE(err.failed());
  EXPECT_STREQ(ErrorKindName(err.kind), "not-found");
}

}  // namespace
}  // namespace mosaic
