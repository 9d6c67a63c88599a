#include "directory_listing.hpp"
#include "exception.hpp"
#include "filesystem.hpp"

#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

using namespace treeup;
namespace fs = std::filesystem;

class DirectoryListingTest : public ::testing::Test {
protected:
    void SetUp() override {
        // Create a temporary directory for testing
        test_dir = fs::temp_directory_path() / "treeup_test_listing";
        fs::remove_all(test_dir);
        fs::create_directories(test_dir);
    }

    void TearDown() override {
        // Clean up test directory
        fs::remove_all(test_dir);
    }

    void CreateFile(const fs::path& relative_path, const std::string& content = "test content") {
        fs::path full_path = test_dir / relative_path;
        fs::create_directories(full_path.parent_path());
        std::ofstream file(full_path);
        file << content;
    }

    void CreateDirectory(const fs::path& relative_path) {
        fs::create_directories(test_dir / relative_path);
    }

    void CreateSymlink(const fs::path& relative_path, const fs::path& target) {
        fs::path full_path = test_dir / relative_path;
        fs::create_directories(full_path.parent_path());
        std::error_code ec;
        fs::create_symlink(target, full_path, ec);
        // Skip test if symlinks not supported
        if (ec) {
            GTEST_SKIP() << "Symlinks not supported on this system";
        }
    }

    std::vector<std::string> Names(const std::vector<local_entry>& entries) {
        std::vector<std::string> names;
        for (const auto& entry : entries) {
            names.push_back(entry.name);
        }
        return names;
    }

    fs::path test_dir;
};

TEST_F(DirectoryListingTest, EmptyDirectory) {
    directory_listing listing(test_dir);
    EXPECT_TRUE(listing.empty());
    EXPECT_TRUE(listing.files().empty());
    EXPECT_TRUE(listing.directories().empty());
    EXPECT_EQ(count_files(test_dir), 0);
}

TEST_F(DirectoryListingTest, SeparatesFilesAndDirectories) {
    CreateFile("b.txt");
    CreateFile("a.txt", "12345");
    CreateDirectory("dir2");
    CreateDirectory("dir1");

    directory_listing listing(test_dir);

    EXPECT_EQ(Names(listing.files()), std::vector<std::string>({"a.txt", "b.txt"}));
    EXPECT_EQ(Names(listing.directories()), std::vector<std::string>({"dir1", "dir2"}));

    const local_entry& a = listing.files()[0];
    EXPECT_EQ(a.path, test_dir / "a.txt");
    EXPECT_EQ(a.size, 5);
    EXPECT_FALSE(a.is_directory);
    EXPECT_TRUE(listing.directories()[0].is_directory);
}

TEST_F(DirectoryListingTest, IsNotRecursive) {
    CreateFile("top.txt");
    CreateFile("sub/nested.txt");
    CreateFile("sub/deeper/leaf.txt");

    directory_listing listing(test_dir);

    EXPECT_EQ(Names(listing.files()), std::vector<std::string>({"top.txt"}));
    EXPECT_EQ(Names(listing.directories()), std::vector<std::string>({"sub"}));
}

TEST_F(DirectoryListingTest, SortedByName) {
    CreateFile("zeta.txt");
    CreateFile("Alpha.txt");
    CreateFile("beta.txt");
    CreateFile("10.txt");
    CreateFile("2.txt");

    directory_listing listing(test_dir);

    EXPECT_EQ(Names(listing.files()), std::vector<std::string>({"10.txt", "2.txt", "Alpha.txt", "beta.txt", "zeta.txt"}));
}

TEST_F(DirectoryListingTest, HiddenFilesIncluded) {
    CreateFile(".hidden");
    CreateDirectory(".config");

    directory_listing listing(test_dir);

    EXPECT_EQ(Names(listing.files()), std::vector<std::string>({".hidden"}));
    EXPECT_EQ(Names(listing.directories()), std::vector<std::string>({".config"}));
}

TEST_F(DirectoryListingTest, SymlinksSkipped) {
    CreateFile("target.txt");
    CreateDirectory("target_dir");
    CreateSymlink("link.txt", test_dir / "target.txt");
    CreateSymlink("link_dir", test_dir / "target_dir");
    CreateSymlink("dangling", test_dir / "nowhere");

    directory_listing listing(test_dir);

    EXPECT_EQ(Names(listing.files()), std::vector<std::string>({"target.txt"}));
    EXPECT_EQ(Names(listing.directories()), std::vector<std::string>({"target_dir"}));
}

TEST_F(DirectoryListingTest, MissingDirectoryThrows) {
    EXPECT_THROW(directory_listing(test_dir / "missing"), traversal_error);
}

TEST_F(DirectoryListingTest, CountFilesRecursive) {
    CreateFile("a.txt");
    CreateFile("sub/b.txt");
    CreateFile("sub/c.txt");
    CreateFile("sub/deeper/d.txt");
    CreateDirectory("empty");

    EXPECT_EQ(count_files(test_dir), 4);
    EXPECT_EQ(count_files(test_dir / "sub"), 3);
    EXPECT_EQ(count_files(test_dir / "missing"), 0);
}

TEST_F(DirectoryListingTest, StatReportsType) {
    CreateFile("a.txt", "abc");
    CreateDirectory("dir");

    file_stat st;
    treeup::stat(test_dir / "a.txt", st);
    EXPECT_EQ(st.type, entry_type::regular);
    EXPECT_EQ(st.size, 3);

    treeup::stat(test_dir / "dir", st);
    EXPECT_EQ(st.type, entry_type::directory);

    treeup::stat(test_dir / "missing", st);
    EXPECT_EQ(st.type, entry_type::missing);

    treeup::stat(test_dir / "a.txt" / "below", st);
    EXPECT_EQ(st.type, entry_type::missing);
}
