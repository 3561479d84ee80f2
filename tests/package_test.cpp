#include "persistence/file_io.hpp"
#include "persistence/gzip.hpp"
#include "persistence/package.hpp"

#include "shardb.pb.h"

#include <filesystem>
#include <fstream>
#include <string>

#include <json/value.h>

#include <gtest/gtest.h>

namespace shardb::persistence {

// ── Fixture ──────────────────────────────────────────────────────────────────

class PackageTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        test_dir_ = std::filesystem::temp_directory_path() /
                    ("package_test_" + std::string(info->name()));
        std::filesystem::remove_all(test_dir_);
        std::filesystem::create_directories(test_dir_);
    }

    void TearDown() override {
        std::filesystem::remove_all(test_dir_);
    }

    void write_raw(const std::filesystem::path& path, const std::string& bytes) {
        std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
        ofs.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    }

    std::filesystem::path test_dir_;
};

// ── gzip ─────────────────────────────────────────────────────────────────────

TEST_F(PackageTest, GzipRoundTripsText) {
    const std::string input = "the quick brown fox jumps over the lazy dog";
    std::string compressed;
    ASSERT_FALSE(gzip_compress(input, compressed));

    // gzip magic.
    ASSERT_GE(compressed.size(), 2u);
    EXPECT_EQ(static_cast<unsigned char>(compressed[0]), 0x1f);
    EXPECT_EQ(static_cast<unsigned char>(compressed[1]), 0x8b);

    std::string output;
    ASSERT_FALSE(gzip_decompress(compressed, output));
    EXPECT_EQ(output, input);
}

TEST_F(PackageTest, GzipHandlesEmptyInput) {
    std::string compressed;
    ASSERT_FALSE(gzip_compress("", compressed));
    EXPECT_FALSE(compressed.empty());

    std::string output = "stale";
    ASSERT_FALSE(gzip_decompress(compressed, output));
    EXPECT_TRUE(output.empty());
}

TEST_F(PackageTest, GzipHandlesLargeInput) {
    // Several times the internal chunk size, highly compressible.
    const std::string input(200'000, 'z');
    std::string compressed;
    ASSERT_FALSE(gzip_compress(input, compressed));
    EXPECT_LT(compressed.size(), input.size());

    std::string output;
    ASSERT_FALSE(gzip_decompress(compressed, output));
    EXPECT_EQ(output, input);
}

TEST_F(PackageTest, GzipOutputIsDeterministic) {
    std::string a, b;
    ASSERT_FALSE(gzip_compress("same bytes", a));
    ASSERT_FALSE(gzip_compress("same bytes", b));
    EXPECT_EQ(a, b);
}

TEST_F(PackageTest, GzipRejectsGarbage) {
    std::string output;
    auto ec = gzip_decompress("definitely not gzip", output);
    EXPECT_TRUE(ec == std::errc::invalid_argument) << ec.message();
}

TEST_F(PackageTest, GzipRejectsTruncatedStream) {
    std::string compressed;
    ASSERT_FALSE(gzip_compress(std::string(4096, 'q') + "tail", compressed));
    compressed.resize(compressed.size() / 2);

    std::string output;
    auto ec = gzip_decompress(compressed, output);
    EXPECT_TRUE(ec == std::errc::invalid_argument) << ec.message();
}

// ── EncodedCompressedPackage ─────────────────────────────────────────────────

TEST_F(PackageTest, EncodedPackageRoundTripsMessage) {
    pb::ShardMeta meta;
    meta.set_id(7);
    auto* entry = meta.add_offsets();
    entry->set_key("alpha");
    entry->mutable_offset()->set_position(128);
    entry->mutable_offset()->set_length(42);

    EncodedCompressedPackage package{test_dir_ / "shard_7_meta.gob.gzip"};
    ASSERT_FALSE(package.save(meta));
    EXPECT_TRUE(std::filesystem::exists(package.path()));

    pb::ShardMeta loaded;
    auto ec = package.load(loaded);
    ASSERT_FALSE(ec) << ec.message();
    EXPECT_EQ(loaded.id(), 7u);
    ASSERT_EQ(loaded.offsets_size(), 1);
    EXPECT_EQ(loaded.offsets(0).key(), "alpha");
    EXPECT_EQ(loaded.offsets(0).offset().position(), 128u);
    EXPECT_EQ(loaded.offsets(0).offset().length(), 42u);
}

TEST_F(PackageTest, EncodedPackageLeavesNoTempFile) {
    pb::ShardMeta meta;
    meta.set_id(1);
    EncodedCompressedPackage package{test_dir_ / "meta.gz"};
    ASSERT_FALSE(package.save(meta));

    auto tmp = package.path();
    tmp += ".tmp";
    EXPECT_FALSE(std::filesystem::exists(tmp));
}

TEST_F(PackageTest, EncodedPackageMissingFileReportsSystemError) {
    EncodedCompressedPackage package{test_dir_ / "missing.gz"};
    pb::ShardMeta meta;
    auto ec = package.load(meta);
    EXPECT_TRUE(ec == std::errc::no_such_file_or_directory) << ec.message();
}

TEST_F(PackageTest, EncodedPackageRejectsUncompressedFile) {
    write_raw(test_dir_ / "plain.gz", "raw bytes, no gzip wrapper");
    EncodedCompressedPackage package{test_dir_ / "plain.gz"};
    pb::ShardMeta meta;
    auto ec = package.load(meta);
    EXPECT_TRUE(ec == std::errc::invalid_argument) << ec.message();
}

TEST_F(PackageTest, EncodedPackageRejectsUndecodablePayload) {
    // Valid gzip, but the payload is not a protobuf message.
    std::string compressed;
    ASSERT_FALSE(gzip_compress(std::string("\xff\xff\xff\xff\xff", 5), compressed));
    write_raw(test_dir_ / "bad.gz", compressed);

    EncodedCompressedPackage package{test_dir_ / "bad.gz"};
    pb::ShardMeta meta;
    auto ec = package.load(meta);
    EXPECT_TRUE(ec == std::errc::invalid_argument) << ec.message();
}

// ── CompressedPackage ────────────────────────────────────────────────────────

TEST_F(PackageTest, CompressedPackageRoundTripsBinary) {
    const std::string blob("a\0b\0c", 5);
    CompressedPackage package{test_dir_ / "blob.gzip"};
    ASSERT_FALSE(package.save(blob));

    std::string loaded;
    ASSERT_FALSE(package.load(loaded));
    EXPECT_EQ(loaded, blob);
}

// ── JSON documents ───────────────────────────────────────────────────────────

TEST_F(PackageTest, CompressedJsonRoundTrips) {
    Json::Value doc(Json::objectValue);
    doc["name"]    = "users";
    doc["objects"] = Json::Value(static_cast<Json::UInt64>(3));

    const auto path = test_dir_ / "users.json.gzip";
    ASSERT_FALSE(save_json(path, doc, /*compressed=*/true));

    Json::Value loaded;
    ASSERT_FALSE(load_json(path, loaded, /*compressed=*/true));
    EXPECT_EQ(loaded["name"].asString(), "users");
    EXPECT_EQ(loaded["objects"].asUInt64(), 3u);
}

TEST_F(PackageTest, PlainJsonIsReadableText) {
    Json::Value doc(Json::objectValue);
    doc["name"]    = "main";
    doc["version"] = 1;

    const auto path = test_dir_ / "main.shardb";
    ASSERT_FALSE(save_json(path, doc, /*compressed=*/false));

    std::string text;
    ASSERT_FALSE(read_file(path, text));
    EXPECT_NE(text.find("\"name\":\"main\""), std::string::npos) << text;
    EXPECT_NE(text.find("\"version\":1"), std::string::npos) << text;
}

TEST_F(PackageTest, LoadJsonRejectsMalformedText) {
    write_raw(test_dir_ / "broken.shardb", "{\"name\": ");
    Json::Value doc;
    auto ec = load_json(test_dir_ / "broken.shardb", doc, /*compressed=*/false);
    EXPECT_TRUE(ec == std::errc::invalid_argument) << ec.message();
}

// ── File helpers ─────────────────────────────────────────────────────────────

TEST_F(PackageTest, WriteFileAtomicReplacesContent) {
    const auto path = test_dir_ / "map.index";
    ASSERT_FALSE(write_file_atomic(path, "1\nold\n"));
    ASSERT_FALSE(write_file_atomic(path, "2\nnew\n"));

    std::string text;
    ASSERT_FALSE(read_file(path, text));
    EXPECT_EQ(text, "2\nnew\n");
}

TEST_F(PackageTest, Crc32MatchesKnownVector) {
    const std::string check = "123456789";
    EXPECT_EQ(crc32(reinterpret_cast<const uint8_t*>(check.data()), check.size()),
              0xCBF43926u);
}

} // namespace shardb::persistence
