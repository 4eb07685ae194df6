#include <gtest/gtest.h>
#include <fstream>

#include "test_util.hpp"
#include "workspace.hpp"

namespace fs = std::filesystem;

namespace {

void write_file(const fs::path& path, const std::string& content) {
  std::ofstream f(path, std::ios::binary | std::ios::trunc);
  f << content;
}

} // namespace

// NOLINTNEXTLINE
TEST(valid_session_id, accepts_plain_names) {
  EXPECT_TRUE(valid_session_id("abc"));
  EXPECT_TRUE(valid_session_id("user-1.session_2"));
  EXPECT_TRUE(valid_session_id("..."));
  EXPECT_TRUE(valid_session_id(std::string(255, 'a')));
}

// NOLINTNEXTLINE
TEST(valid_session_id, rejects_path_like_names) {
  EXPECT_FALSE(valid_session_id(""));
  EXPECT_FALSE(valid_session_id("."));
  EXPECT_FALSE(valid_session_id(".."));
  EXPECT_FALSE(valid_session_id("a/b"));
  EXPECT_FALSE(valid_session_id(std::string("a\0b", 3)));
  EXPECT_FALSE(valid_session_id(std::string(256, 'a')));
}

// NOLINTNEXTLINE
TEST(is_artifact_name, recognized_extensions) {
  EXPECT_TRUE(is_artifact_name("plot.png"));
  EXPECT_TRUE(is_artifact_name("PLOT.PNG"));
  EXPECT_TRUE(is_artifact_name("table.xlsx"));
  EXPECT_TRUE(is_artifact_name("notes.md"));
  EXPECT_TRUE(is_artifact_name("data.json"));
  EXPECT_FALSE(is_artifact_name("script.js"));
  EXPECT_FALSE(is_artifact_name("blob.bin"));
  EXPECT_FALSE(is_artifact_name("png"));
}

// NOLINTNEXTLINE
TEST(workspace_manager, ensure_dir_is_idempotent) {
  TemporaryDirectory tmp;
  WorkspaceManager w(tmp.path / "root");
  fs::path dir = w.ensure_dir("s1");
  EXPECT_TRUE(dir.is_absolute());
  EXPECT_TRUE(fs::is_directory(dir));
  EXPECT_EQ(dir, fs::absolute(tmp.path / "root" / "s1").lexically_normal());
  write_file(dir / "keep.txt", "x");
  EXPECT_EQ(w.ensure_dir("s1"), dir);
  EXPECT_TRUE(fs::exists(dir / "keep.txt"));
}

// NOLINTNEXTLINE
TEST(workspace_manager, ensure_dir_fails_under_a_file) {
  TemporaryDirectory tmp;
  write_file(tmp.path / "root", "not a directory");
  WorkspaceManager w(tmp.path / "root");
  EXPECT_THROW(w.ensure_dir("s1"), std::runtime_error);
}

// NOLINTNEXTLINE
TEST(resolve, stays_inside_workspace) {
  TemporaryDirectory tmp;
  fs::path base = fs::absolute(tmp.path).lexically_normal();
  EXPECT_EQ(resolve(tmp.path, "a.txt"), base / "a.txt");
  EXPECT_EQ(resolve(tmp.path, "sub/../a.txt"), base / "a.txt");
  EXPECT_EQ(resolve(tmp.path, "./sub/b.csv"), base / "sub" / "b.csv");
  EXPECT_EQ(resolve(tmp.path, base.string() + "/c.txt"), base / "c.txt");
}

// NOLINTNEXTLINE
TEST(resolve, workspace_itself_has_no_trailing_separator) {
  TemporaryDirectory tmp;
  fs::path base = fs::absolute(tmp.path).lexically_normal();
  for (const std::string& relative : {".", "", "sub/..", "./", "sub/../"}) {
    EXPECT_EQ(resolve(tmp.path, relative), base) << relative;
  }
  EXPECT_EQ(resolve(tmp.path, "sub/"), base / "sub");
}

// NOLINTNEXTLINE
TEST(resolve, denies_escape) {
  TemporaryDirectory tmp;
  EXPECT_THROW(resolve(tmp.path, "../outside.txt"), CapabilityDenied);
  EXPECT_THROW(resolve(tmp.path, "sub/../../outside.txt"), CapabilityDenied);
  EXPECT_THROW(resolve(tmp.path, "/etc/passwd"), CapabilityDenied);
}

// NOLINTNEXTLINE
TEST(resolve, denies_symlink_out) {
  TemporaryDirectory tmp;
  TemporaryDirectory other;
  fs::create_directory_symlink(other.path, tmp.path / "link");
  EXPECT_THROW(resolve(tmp.path, "link/secret.txt"), CapabilityDenied);
}

// NOLINTNEXTLINE
TEST(artifacts, new_and_modified_recognized_files) {
  TemporaryDirectory tmp;
  write_file(tmp.path / "old.csv", "a,b\n");
  write_file(tmp.path / "same.png", "png");
  Snapshot before = snapshot(tmp.path);
  write_file(tmp.path / "old.csv", "a,b\n1,2\n");
  write_file(tmp.path / "z.svg", "<svg/>");
  write_file(tmp.path / "b.jpg", "jpg");
  write_file(tmp.path / "ignored.bin", "bin");
  fs::create_directory(tmp.path / "nested");
  write_file(tmp.path / "nested" / "deep.png", "png");
  EXPECT_EQ(artifacts(tmp.path, before), (std::vector<std::string>{"b.jpg", "old.csv", "z.svg"}));
}

// NOLINTNEXTLINE
TEST(artifacts, nothing_changed) {
  TemporaryDirectory tmp;
  write_file(tmp.path / "a.png", "png");
  Snapshot before = snapshot(tmp.path);
  EXPECT_TRUE(artifacts(tmp.path, before).empty());
}
