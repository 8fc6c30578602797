#include <algorithm>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <thread>
#include "../../src/storage/disk_storage.hpp"

using namespace Ferret::Storage;
namespace fs = std::filesystem;

class StorageTest : public ::testing::Test {
protected:
    void SetUp() override {
        if (fs::exists("test_storage_out"))
            fs::remove_all("test_storage_out");
    }

    void TearDown() override {
        if (fs::exists("test_storage_out"))
            fs::remove_all("test_storage_out");
    }
};

TEST_F(StorageTest, DiskStorageCreation) {
    DiskStorage storage("test_storage_out");
    EXPECT_TRUE(fs::is_directory("test_storage_out"));
    EXPECT_TRUE(storage.save("test.txt", "Hello World"));

    EXPECT_TRUE(fs::exists("test_storage_out/test.txt"));

    std::ifstream file("test_storage_out/test.txt");
    std::string   content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    EXPECT_EQ(content, "Hello World");
}

TEST_F(StorageTest, LoadRoundTrip) {
    DiskStorage storage("test_storage_out");
    storage.save("a.entry", "first");
    storage.save("a.entry", "second");

    auto loaded = storage.load("a.entry");
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(*loaded, "second");
    EXPECT_FALSE(storage.load("missing.entry").has_value());
}

TEST_F(StorageTest, BinaryStorage) {
    DiskStorage storage("test_storage_out");
    std::string binary_data("\x00\x01\x02\xff\xfe\x00", 6);
    storage.save("data.bin", binary_data);

    std::ifstream file("test_storage_out/data.bin", std::ios::binary);
    std::string   content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    EXPECT_EQ(content, binary_data);
}

TEST_F(StorageTest, RejectsPathLikeKeys) {
    DiskStorage storage("test_storage_out");
    EXPECT_FALSE(storage.save("deep/path/file.md", "x"));
    EXPECT_FALSE(storage.save("..", "x"));
    EXPECT_FALSE(storage.save("", "x"));
    EXPECT_FALSE(storage.load("../escape").has_value());
    EXPECT_FALSE(storage.remove("a/b"));
    EXPECT_FALSE(fs::exists("test_storage_out/deep"));
}

TEST_F(StorageTest, KeysIgnoreTemporaryFiles) {
    DiskStorage storage("test_storage_out");
    storage.save("one.entry", "1");
    storage.save("two.entry", "22");
    std::ofstream("test_storage_out/half-written.entry.123.0.tmp") << "partial";
    fs::create_directory("test_storage_out/subdir");

    auto keys = storage.keys();
    std::sort(keys.begin(), keys.end());
    EXPECT_EQ(keys, (std::vector<std::string>{"one.entry", "two.entry"}));
    EXPECT_EQ(storage.total_bytes(), 3u);
}

TEST_F(StorageTest, RemoveAndClear) {
    DiskStorage storage("test_storage_out");
    storage.save("a", "1");
    storage.save("b", "2");

    EXPECT_TRUE(storage.remove("a"));
    EXPECT_FALSE(storage.remove("a"));
    EXPECT_EQ(storage.keys().size(), 1u);

    storage.clear();
    EXPECT_TRUE(storage.keys().empty());
    EXPECT_EQ(storage.total_bytes(), 0u);
}

TEST_F(StorageTest, MissingDirectoryHasNoKeys) {
    DiskStorage storage("test_storage_out");
    fs::remove_all("test_storage_out");
    EXPECT_TRUE(storage.keys().empty());
    EXPECT_FALSE(storage.load("a").has_value());
}

TEST_F(StorageTest, ConcurrentWritersSameKey) {
    DiskStorage              storage("test_storage_out");
    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&storage, t]() {
            std::string body(1024, static_cast<char>('a' + t));
            for (int i = 0; i < 20; ++i)
                storage.save("shared.entry", body);
        });
    }
    for (auto& t : threads)
        t.join();

    auto loaded = storage.load("shared.entry");
    ASSERT_TRUE(loaded.has_value());
    ASSERT_EQ(loaded->size(), 1024u);
    EXPECT_EQ(std::count(loaded->begin(), loaded->end(), (*loaded)[0]), 1024);
    EXPECT_EQ(storage.keys().size(), 1u);
}
