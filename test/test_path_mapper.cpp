#include "path_mapper.hpp"

#include "fake_remote.hpp"

#include <gtest/gtest.h>

using namespace treeup;

namespace {

const credentials creds{"user", "secret"};

remote_folder folder(const std::string& hash) {
  remote_folder f;
  f.hash = hash;
  return f;
}

}  // namespace

TEST(PathMapper, CreatesFolderOnce) {
  fake_remote remote;
  path_mapper mapper(remote);

  const remote_folder& first = mapper.resolve("/data/photos", folder("base"), creds);
  EXPECT_EQ(first.hash, "hash_photos");
  EXPECT_EQ(first.add_key, "key_photos");

  const remote_folder& second = mapper.resolve("/data/photos", folder("base"), creds);
  EXPECT_EQ(second.hash, "hash_photos");

  ASSERT_EQ(remote.calls.size(), 1);
  EXPECT_EQ(remote.calls[0].op, "mkdir");
  EXPECT_EQ(remote.calls[0].name, "photos");
  EXPECT_EQ(remote.calls[0].folder, "base");
  EXPECT_EQ(mapper.size(), 1);
}

TEST(PathMapper, NormalizesPaths) {
  fake_remote remote;
  path_mapper mapper(remote);

  mapper.resolve("/data/photos/", folder("base"), creds);
  mapper.resolve("/data/./photos", folder("base"), creds);
  mapper.resolve("/data/other/../photos", folder("base"), creds);

  EXPECT_EQ(remote.count("mkdir"), 1);
  EXPECT_EQ(remote.calls[0].name, "photos");
  EXPECT_TRUE(mapper.contains("/data/photos"));
}

TEST(PathMapper, DistinctDirectoriesWithSameName) {
  fake_remote remote;
  path_mapper mapper(remote);

  mapper.resolve("/a/docs", folder("base"), creds);
  mapper.resolve("/b/docs", folder("base"), creds);

  EXPECT_EQ(remote.count("mkdir"), 2);
  EXPECT_EQ(mapper.size(), 2);
}

TEST(PathMapper, FailureLeavesCacheUntouched) {
  fake_remote remote;
  remote.fail_folders.insert("photos");
  path_mapper mapper(remote);

  EXPECT_THROW(mapper.resolve("/data/photos", folder("base"), creds), folder_create_error);
  EXPECT_FALSE(mapper.contains("/data/photos"));
  EXPECT_EQ(mapper.size(), 0);

  // A later attempt contacts the remote again
  remote.fail_folders.clear();
  EXPECT_EQ(mapper.resolve("/data/photos", folder("base"), creds).hash, "hash_photos");
  EXPECT_EQ(remote.count("mkdir"), 2);
}

TEST(PathMapper, InsertedFolderIsReused) {
  fake_remote remote;
  path_mapper mapper(remote);

  mapper.insert("/data/photos", remote_folder{"existing", "KEY", ""});
  const remote_folder& resolved = mapper.resolve("/data/photos/", folder("base"), creds);

  EXPECT_EQ(resolved.hash, "existing");
  EXPECT_TRUE(remote.calls.empty());
  ASSERT_NE(mapper.find("/data/photos"), nullptr);
  EXPECT_EQ(mapper.find("/data/photos")->upload_key(), "KEY");
  EXPECT_EQ(mapper.find("/data/videos"), nullptr);
}

TEST(PathMapper, MalformedResponseNotCached) {
  fake_remote remote;
  remote.folder_bodies["photos"] = R"({"add_key": "XYZ"})";
  path_mapper mapper(remote);

  EXPECT_THROW(mapper.resolve("/data/photos", folder("base"), creds), folder_create_error);
  EXPECT_FALSE(mapper.contains("/data/photos"));
}

TEST(PathMapper, RelativePathsResolveAgainstWorkingDirectory) {
  fake_remote remote;
  path_mapper mapper(remote);

  const auto cwd = std::filesystem::current_path();
  ASSERT_FALSE(cwd.filename().empty());

  EXPECT_EQ(mapper.resolve(".", folder("base"), creds).hash, "hash_" + cwd.filename().string());
  mapper.resolve(cwd, folder("base"), creds);
  mapper.resolve("sub/..", folder("base"), creds);

  ASSERT_EQ(remote.count("mkdir"), 1);
  EXPECT_EQ(remote.calls[0].name, cwd.filename().string());
  EXPECT_TRUE(mapper.contains(cwd));
  EXPECT_EQ(path_mapper::normalize("."), cwd);
}
