#include <gtest/gtest.h>
#include "sanityml/errors.hpp"
#include "sanityml/io/mapped_file.hpp"

#include <filesystem>
#include <fstream>

using namespace sanityml;
using namespace sanityml::io;
namespace fs = std::filesystem;

class MappedFileTest : public ::testing::Test {
protected:
    fs::path temp_dir;

    void SetUp() override {
        temp_dir = fs::temp_directory_path() / "sanityml_mapped_file_test";
        fs::create_directories(temp_dir);
    }

    void TearDown() override {
        fs::remove_all(temp_dir);
    }

    fs::path write_file(const std::string& name, const std::string& content) {
        fs::path path = temp_dir / name;
        std::ofstream out(path, std::ios::binary);
        out << content;
        return path;
    }
};

TEST_F(MappedFileTest, MapsRegularFile) {
    fs::path path = write_file("model.pkl", "hello mapped world");

    auto mapped = MappedFile::open(path);
    ASSERT_NE(mapped, nullptr);
    EXPECT_TRUE(mapped->is_valid());
    EXPECT_EQ(mapped->size(), 18u);
    EXPECT_EQ(std::string(reinterpret_cast<const char*>(mapped->data()), mapped->size()),
              "hello mapped world");
}

TEST_F(MappedFileTest, MissingOrEmptyFile) {
    EXPECT_EQ(MappedFile::open(temp_dir / "absent.pkl"), nullptr);
    EXPECT_EQ(MappedFile::open(write_file("empty.pkl", "")), nullptr);
    EXPECT_EQ(MappedFile::open(temp_dir), nullptr);
}

TEST_F(MappedFileTest, MoveTransfersMapping) {
    auto mapped = MappedFile::open(write_file("a.bin", "abc"));
    ASSERT_NE(mapped, nullptr);

    MappedFile moved(std::move(*mapped));
    EXPECT_FALSE(mapped->is_valid());
    EXPECT_EQ(mapped->size(), 0u);
    EXPECT_TRUE(moved.is_valid());
    EXPECT_EQ(moved.size(), 3u);
}

TEST_F(MappedFileTest, FileBufferLoad) {
    fs::path path = write_file("data.bin", std::string("\x80\x02N.", 4));

    FileBuffer buffer = FileBuffer::load(path, 1024);
    EXPECT_TRUE(buffer.is_mapped());
    ASSERT_EQ(buffer.size(), 4u);
    EXPECT_EQ(buffer.view()[0], 0x80);
    EXPECT_EQ(buffer.view()[3], '.');
}

TEST_F(MappedFileTest, FileBufferLimit) {
    fs::path path = write_file("big.bin", std::string(100, 'x'));

    EXPECT_THROW(FileBuffer::load(path, 99), StreamTooLargeError);
    EXPECT_NO_THROW(FileBuffer::load(path, 100));
}

TEST_F(MappedFileTest, FileBufferMissingFile) {
    try {
        FileBuffer::load(temp_dir / "absent.pkl", 1024);
        FAIL() << "expected ArtifactReadError";
    } catch (const ArtifactReadError& e) {
        EXPECT_EQ(e.kind(), ScanErrorKind::ReadError);
    }
}

TEST_F(MappedFileTest, FileBufferEmptyFile) {
    FileBuffer buffer = FileBuffer::load(write_file("empty.bin", ""), 1024);
    EXPECT_FALSE(buffer.is_mapped());
    EXPECT_EQ(buffer.size(), 0u);
    EXPECT_TRUE(buffer.view().empty());
}
