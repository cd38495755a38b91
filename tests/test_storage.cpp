// tests/test_storage.cpp
// @brief FileStorage and MemoryStorage read/write behaviour.
// @invariant A successful write leaves exactly the given bytes behind.
// @ownership Test owns temporary files and removes them.

#include "TestHarness.hpp"

#include "quill/text/buffer.hpp"
#include "quill/text/storage.hpp"

#include <filesystem>
#include <string>

using quill::text::FileStorage;
using quill::text::MemoryStorage;

namespace
{
std::string tempPath(const char *name)
{
    return (std::filesystem::temp_directory_path() / name).string();
}
} // namespace

TEST(Storage, FileRoundTripTruncates)
{
    const std::string path = tempPath("quill_storage_roundtrip.txt");
    FileStorage storage;
    ASSERT_TRUE(storage.write(path, "a much longer first version\n").hasValue());
    ASSERT_TRUE(storage.write(path, "short").hasValue());
    const auto read = storage.read(path);
    ASSERT_TRUE(read.hasValue());
    EXPECT_EQ(read.value(), "short");
    std::filesystem::remove(path);
}

TEST(Storage, FileReadMissingReportsPath)
{
    FileStorage storage;
    const std::string path = tempPath("quill_storage_missing_does_not_exist.txt");
    std::filesystem::remove(path);
    const auto read = storage.read(path);
    ASSERT_FALSE(read.hasValue());
    EXPECT_EQ(read.error().path, path);
}

TEST(Storage, MemoryReadsWritesAndDenies)
{
    MemoryStorage storage;
    EXPECT_FALSE(storage.read("none").hasValue());
    storage.put("doc", "one");
    const auto seeded = storage.read("doc");
    ASSERT_TRUE(seeded.hasValue());
    EXPECT_EQ(seeded.value(), "one");
    ASSERT_TRUE(storage.write("doc", "two").hasValue());
    EXPECT_EQ(storage.files().at("doc"), "two");

    storage.denyWrites("doc");
    const auto denied = storage.write("doc", "three");
    ASSERT_FALSE(denied.hasValue());
    EXPECT_EQ(denied.error().message, "permission denied");
    EXPECT_EQ(storage.files().at("doc"), "two");
}

TEST(Storage, BufferSavesToLocalFile)
{
    const std::string path = tempPath("quill_storage_buffer_save.txt");
    quill::text::Buffer buffer;
    buffer.load(std::string("first\nsecond\n"));
    ASSERT_TRUE(buffer.save(path).hasValue());

    FileStorage storage;
    const auto read = storage.read(path);
    ASSERT_TRUE(read.hasValue());
    EXPECT_EQ(read.value(), "first\nsecond");
    std::filesystem::remove(path);

    const auto failed = buffer.save(tempPath("quill_no_such_dir") + "/x/y.txt");
    EXPECT_FALSE(failed.hasValue());
}

int main(int argc, char **argv)
{
    quill_test::init(&argc, &argv);
    return quill_test::run_all_tests();
}
