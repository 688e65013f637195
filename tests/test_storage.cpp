#include <filesystem>
#include <fstream>
#include <iterator>
#include <span>
#include <string>
#include <vector>

#include <flatdata/endian.hpp>
#include <flatdata/file_storage.hpp>
#include <flatdata/memory_storage.hpp>

#include <gtest/gtest.h>

namespace fs = std::filesystem;

using flatdata::ErrorKind;
using flatdata::ResourceStorageError;

namespace {

const std::string schema = "namespace test { struct A { x : u8 : 8; } }";

std::vector<uint8_t> bytesOf(std::span<const uint8_t> data) {
  return std::vector<uint8_t>(data.begin(), data.end());
}

// Storage that writes a second resource from inside a write
class ReentrantStorage : public flatdata::MemoryResourceStorage {
protected:
  bool writeBlob(const std::string &key, std::span<const std::span<const uint8_t>> parts,
                 ResourceStorageError *outError) override {
    if (key == "outer") {
      write("inner", "schema", {}, outError);
    }
    return MemoryResourceStorage::writeBlob(key, parts, outError);
  }
};

// Storage whose schema blob writes fail once armed
class FailingSchemaStorage : public flatdata::MemoryResourceStorage {
public:
  bool failSchemaWrites = false;

protected:
  bool writeBlob(const std::string &key, std::span<const std::span<const uint8_t>> parts,
                 ResourceStorageError *outError) override {
    if (failSchemaWrites && key == schemaKey("res")) {
      return flatdata::fail(outError, ResourceStorageError::io(key, "disk full"));
    }
    return MemoryResourceStorage::writeBlob(key, parts, outError);
  }
};

std::vector<uint8_t> readFile(const fs::path &path) {
  std::ifstream in(path, std::ios::binary);
  return std::vector<uint8_t>(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

} // namespace

TEST(MemoryStorageTest, WriteAndRead) {
  flatdata::MemoryResourceStorage storage;
  std::vector<uint8_t> data = {1, 2, 3};
  ResourceStorageError error;

  EXPECT_FALSE(storage.exists("res"));
  ASSERT_TRUE(storage.write("res", schema, data, &error)) << error.toString();
  EXPECT_TRUE(storage.exists("res"));

  auto read = storage.read("res", schema, &error);
  ASSERT_TRUE(read.has_value()) << error.toString();
  EXPECT_EQ(bytesOf(*read), data);

  // Padding follows the data
  for (size_t i = 0; i < flatdata::PADDING_SIZE; ++i) {
    EXPECT_EQ(read->data()[read->size() + i], 0) << "padding byte " << i;
  }

  const auto *blob = storage.blob("res");
  ASSERT_NE(blob, nullptr);
  EXPECT_EQ(blob->size(), flatdata::SIZE_HEADER + data.size() + flatdata::PADDING_SIZE);
  EXPECT_EQ(flatdata::readSizeHeader(blob->data()), data.size());

  auto storedSchema = storage.readSchema("res", &error);
  ASSERT_TRUE(storedSchema.has_value());
  EXPECT_EQ(*storedSchema, schema);
}

TEST(MemoryStorageTest, EmptyResource) {
  flatdata::MemoryResourceStorage storage;
  ASSERT_TRUE(storage.write("empty", schema, {}));
  auto read = storage.read("empty", schema);
  ASSERT_TRUE(read.has_value());
  EXPECT_TRUE(read->empty());
}

TEST(MemoryStorageTest, RewriteReplaces) {
  flatdata::MemoryResourceStorage storage;
  std::vector<uint8_t> first = {1, 2};
  std::vector<uint8_t> second = {3, 4, 5};
  ASSERT_TRUE(storage.write("res", schema, first));
  ASSERT_TRUE(storage.write("res", schema, second));

  auto read = storage.read("res", schema);
  ASSERT_TRUE(read.has_value());
  EXPECT_EQ(bytesOf(*read), second);

  std::vector<std::string> expectedNames = {"res"};
  EXPECT_EQ(storage.resourceNames(), expectedNames);
}

TEST(MemoryStorageTest, MissingSchema) {
  flatdata::MemoryResourceStorage storage;
  ResourceStorageError error;
  EXPECT_FALSE(storage.read("nothing", schema, &error).has_value());
  EXPECT_EQ(error.kind, ErrorKind::MissingSchema);
  EXPECT_EQ(error.resourceName, "nothing");
  EXPECT_FALSE(storage.readSchema("nothing").has_value());
}

TEST(MemoryStorageTest, WrongSignature) {
  flatdata::MemoryResourceStorage storage;
  ASSERT_TRUE(storage.write("res", schema, {}));

  ResourceStorageError error;
  std::string renamed = "namespace test { struct A { y : u8 : 8; } }";
  EXPECT_FALSE(storage.read("res", renamed, &error).has_value());
  EXPECT_EQ(error.kind, ErrorKind::WrongSignature);
  EXPECT_EQ(error.resourceName, "res");
  EXPECT_FALSE(error.diff.empty());
  EXPECT_NE(error.toString().find(error.diff), std::string::npos);
  EXPECT_FALSE(error.isRetryable());
}

TEST(MemoryStorageTest, MissingData) {
  flatdata::MemoryResourceStorage storage;
  ASSERT_TRUE(storage.write("res", schema, {}));
  storage.eraseBlob("res");

  ResourceStorageError error;
  EXPECT_FALSE(storage.read("res", schema, &error).has_value());
  EXPECT_EQ(error.kind, ErrorKind::MissingData);
}

TEST(MemoryStorageTest, UnexpectedDataSize) {
  flatdata::MemoryResourceStorage storage;
  std::vector<uint8_t> data = {1, 2, 3, 4};
  ASSERT_TRUE(storage.write("res", schema, data));

  // Recorded size disagrees with the blob
  std::vector<uint8_t> blob = *storage.blob("res");
  flatdata::writeSizeHeader(blob.data(), 100);
  storage.putBlob("res", blob);

  ResourceStorageError error;
  EXPECT_FALSE(storage.read("res", schema, &error).has_value());
  EXPECT_EQ(error.kind, ErrorKind::UnexpectedDataSize);

  // Blob too short to hold its framing
  storage.putBlob("res", {1, 2, 3});
  EXPECT_FALSE(storage.read("res", schema, &error).has_value());
  EXPECT_EQ(error.kind, ErrorKind::UnexpectedDataSize);
}

TEST(MemoryStorageTest, SchemaMustBeUtf8) {
  flatdata::MemoryResourceStorage storage;
  ASSERT_TRUE(storage.write("res", schema, {}));
  storage.putBlob("res.schema", {'a', 0xFF, 'b'});

  ResourceStorageError error;
  EXPECT_FALSE(storage.read("res", schema, &error).has_value());
  EXPECT_EQ(error.kind, ErrorKind::Utf8Error);
}

// Only one write may be in flight per storage
TEST(MemoryStorageTest, ReentrantWriteThrows) {
  ReentrantStorage storage;
  EXPECT_THROW(storage.write("outer", "schema", {}), std::logic_error);

  // The guard is released after the failed write
  EXPECT_TRUE(storage.write("other", "schema", {}));
}

// A rewrite that fails halfway must not pair new data with the old schema
TEST(MemoryStorageTest, InterruptedRewriteHidesStaleSchema) {
  FailingSchemaStorage storage;
  std::vector<uint8_t> old = {1, 2, 3};
  ASSERT_TRUE(storage.write("res", "schema-v1", old));

  storage.failSchemaWrites = true;
  ResourceStorageError error;
  std::vector<uint8_t> replacement(5, 9);
  EXPECT_FALSE(storage.write("res", "schema-v2", replacement, &error));
  EXPECT_EQ(error.kind, ErrorKind::Io);
  EXPECT_EQ(error.resourceName, "res");

  EXPECT_FALSE(storage.read("res", "schema-v1", &error).has_value());
  EXPECT_EQ(error.kind, ErrorKind::MissingSchema);
  EXPECT_FALSE(storage.read("res", "schema-v2", &error).has_value());
  EXPECT_EQ(error.kind, ErrorKind::MissingSchema);
}

TEST(ResourceStorageErrorTest, Rendering) {
  auto tooBig = ResourceStorageError::tooBig("vertices_data", 300);
  EXPECT_EQ(tooBig.kind, ErrorKind::TooBig);
  EXPECT_EQ(tooBig.size, 300);
  EXPECT_NE(tooBig.toString().find("vertices_data"), std::string::npos);
  EXPECT_NE(tooBig.toString().find("300"), std::string::npos);

  auto io = ResourceStorageError::io("Graph.archive", "archive already exists");
  EXPECT_TRUE(io.isRetryable());
  EXPECT_EQ(io.toString(), "resource io error [Graph.archive]: archive already exists");
}

class FileStorageTest : public ::testing::Test {
protected:
  void SetUp() override {
    tempDir_ = fs::temp_directory_path() / "flatdata_test_storage";
    fs::remove_all(tempDir_);
    fs::create_directories(tempDir_);
  }

  void TearDown() override { fs::remove_all(tempDir_); }

  fs::path tempDir_;
};

TEST_F(FileStorageTest, WriteAndRead) {
  std::vector<uint8_t> data = {10, 20, 30, 40, 50};
  ResourceStorageError error;
  {
    flatdata::FileResourceStorage storage(tempDir_);
    ASSERT_TRUE(storage.write("res", schema, data, &error)) << error.toString();
    auto read = storage.read("res", schema, &error);
    ASSERT_TRUE(read.has_value()) << error.toString();
    EXPECT_EQ(bytesOf(*read), data);
  }

  // One file per resource plus the schema sidecar
  EXPECT_TRUE(fs::exists(tempDir_ / "res"));
  EXPECT_TRUE(fs::exists(tempDir_ / "res.schema"));
  EXPECT_FALSE(fs::exists(tempDir_ / "res.tmp"));
  EXPECT_EQ(fs::file_size(tempDir_ / "res"),
            flatdata::SIZE_HEADER + data.size() + flatdata::PADDING_SIZE);
  EXPECT_EQ(fs::file_size(tempDir_ / "res.schema"), schema.size());

  // A fresh storage sees the same data
  flatdata::FileResourceStorage reopened(tempDir_);
  auto read = reopened.read("res", schema, &error);
  ASSERT_TRUE(read.has_value()) << error.toString();
  EXPECT_EQ(bytesOf(*read), data);
}

TEST_F(FileStorageTest, CreatesDirectory) {
  flatdata::FileResourceStorage storage(tempDir_ / "nested" / "dir");
  ASSERT_TRUE(storage.write("res", schema, {}));
  EXPECT_TRUE(fs::exists(tempDir_ / "nested" / "dir" / "res"));
  EXPECT_TRUE(storage.read("res", schema).has_value());
}

TEST_F(FileStorageTest, ReadsAreStable) {
  flatdata::FileResourceStorage storage(tempDir_);
  std::vector<uint8_t> data = {1, 2, 3};
  ASSERT_TRUE(storage.write("res", schema, data));

  auto first = storage.read("res", schema);
  auto second = storage.read("res", schema);
  ASSERT_TRUE(first && second);
  EXPECT_EQ(first->data(), second->data());
}

// A mapped resource cannot be replaced underneath its readers
TEST_F(FileStorageTest, RewriteOfMappedResourceFails) {
  flatdata::FileResourceStorage storage(tempDir_);
  std::vector<uint8_t> data = {1, 2, 3};
  ASSERT_TRUE(storage.write("res", schema, data));
  ASSERT_TRUE(storage.read("res", schema).has_value());

  ResourceStorageError error;
  EXPECT_FALSE(storage.write("res", schema, data, &error));
  EXPECT_EQ(error.kind, ErrorKind::Io);
  EXPECT_EQ(error.resourceName, "res");
}

TEST_F(FileStorageTest, MissingAndDamaged) {
  flatdata::FileResourceStorage storage(tempDir_);
  ResourceStorageError error;
  EXPECT_FALSE(storage.read("absent", schema, &error).has_value());
  EXPECT_EQ(error.kind, ErrorKind::MissingSchema);

  {
    std::ofstream(tempDir_ / "short.schema") << schema;
    std::ofstream(tempDir_ / "short", std::ios::binary) << "abc";
  }
  EXPECT_FALSE(storage.read("short", schema, &error).has_value());
  EXPECT_EQ(error.kind, ErrorKind::UnexpectedDataSize);
}

// A failed read maps only the schema; rewriting must not touch the data either
TEST_F(FileStorageTest, FailedRewriteLeavesResourceUntouched) {
  std::vector<uint8_t> old = {1, 2, 3};
  flatdata::FileResourceStorage storage(tempDir_);
  ASSERT_TRUE(storage.write("edges", "schema-v1", old));

  ResourceStorageError error;
  EXPECT_FALSE(storage.read("edges", "schema-v2", &error).has_value());
  EXPECT_EQ(error.kind, ErrorKind::WrongSignature);
  EXPECT_EQ(storage.mappedBlobs(), 1);

  auto dataBefore = readFile(tempDir_ / "edges");
  std::vector<uint8_t> replacement(5, 9);
  EXPECT_FALSE(storage.write("edges", "schema-v2", replacement, &error));
  EXPECT_EQ(error.kind, ErrorKind::Io);
  EXPECT_EQ(error.resourceName, "edges");

  EXPECT_EQ(readFile(tempDir_ / "edges"), dataBefore);
  flatdata::FileResourceStorage reopened(tempDir_);
  auto stored = reopened.readSchema("edges");
  ASSERT_TRUE(stored.has_value());
  EXPECT_EQ(*stored, "schema-v1");
  auto read = reopened.read("edges", "schema-v1", &error);
  ASSERT_TRUE(read.has_value()) << error.toString();
  EXPECT_EQ(bytesOf(*read), old);
}

// Blob level failures are reported under the resource name
TEST_F(FileStorageTest, WriteErrorNamesResource) {
  std::ofstream(tempDir_ / "occupied") << "not a directory";
  flatdata::FileResourceStorage storage(tempDir_ / "occupied");

  ResourceStorageError error;
  EXPECT_FALSE(storage.write("vertices", schema, {}, &error));
  EXPECT_EQ(error.kind, ErrorKind::Io);
  EXPECT_EQ(error.resourceName, "vertices");
  EXPECT_FALSE(error.message.empty());
}

TEST_F(FileStorageTest, LargeResource) {
  std::vector<uint8_t> data(1024 * 1024);
  for (size_t i = 0; i < data.size(); ++i) {
    data[i] = static_cast<uint8_t>(i * 7 % 256);
  }
  flatdata::FileResourceStorage storage(tempDir_);
  ASSERT_TRUE(storage.write("big", schema, data));

  auto read = storage.read("big", schema);
  ASSERT_TRUE(read.has_value());
  ASSERT_EQ(read->size(), data.size());
  EXPECT_EQ((*read)[data.size() / 2], data[data.size() / 2]);
  EXPECT_EQ(read->back(), data.back());

  // The padding follows the data inside the mapping
  EXPECT_EQ(read->data()[data.size() + flatdata::PADDING_SIZE - 1], 0);
  EXPECT_EQ(storage.mappedBlobs(), 2);
}

TEST_F(FileStorageTest, EmptySchemaAndData) {
  flatdata::FileResourceStorage storage(tempDir_);
  ASSERT_TRUE(storage.write("empty", "", {}));
  EXPECT_EQ(fs::file_size(tempDir_ / "empty.schema"), 0u);

  ResourceStorageError error;
  auto read = storage.read("empty", "", &error);
  ASSERT_TRUE(read.has_value()) << error.toString();
  EXPECT_TRUE(read->empty());
}
