#include "common/errors.hpp"
#include "storage/collection.hpp"

#include <algorithm>
#include <filesystem>
#include <stdexcept>
#include <string>

#include <gtest/gtest.h>

namespace shardb {

namespace {

struct User : CustomStructure {
    std::string name;
    int age = 0;

    std::vector<DataIndexField> data_index() const override {
        return {{"name", name}, {"age", std::to_string(age)}};
    }

    void restore(const std::vector<DataIndexField>& fields) override {
        for (const auto& f : fields) {
            if (f.name == "name") name = f.value;
            if (f.name == "age") age = std::stoi(f.value);
        }
    }
};

} // anonymous namespace

// ── Fixture ──────────────────────────────────────────────────────────────────

class CollectionTest : public ::testing::Test {
protected:
    static constexpr const char* kRelative = "collections/users";

    void SetUp() override {
        auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        root_ = std::filesystem::temp_directory_path() /
                ("collection_test_" + std::string(info->name()));
        std::filesystem::remove_all(root_);
        std::filesystem::create_directories(root_);

        std::unique_ptr<ConcurrentMap> map;
        ASSERT_FALSE(ConcurrentMap::create(root_, kRelative, map));
        collection_ = std::make_unique<Collection>(
            "users", kRelative, std::move(map), std::make_unique<CollectionCache>());
    }

    void TearDown() override {
        collection_.reset();
        std::filesystem::remove_all(root_);
    }

    std::filesystem::path descriptor_path() const {
        return root_ / kRelative / Collection::descriptor_filename("users");
    }

    std::filesystem::path root_;
    std::unique_ptr<Collection> collection_;
};

// ── Construction ─────────────────────────────────────────────────────────────

TEST_F(CollectionTest, ConstructorRequiresMapAndCache) {
    EXPECT_THROW(Collection("x", "collections/x", nullptr,
                            std::make_unique<CollectionCache>()),
                 std::invalid_argument);
}

TEST_F(CollectionTest, ExposesNameAndPaths) {
    EXPECT_EQ(collection_->name(), "users");
    EXPECT_EQ(collection_->path(), kRelative);
    EXPECT_EQ(collection_->storage_path().string(), (root_ / kRelative).string());
    EXPECT_EQ(Collection::descriptor_filename("users"), "users.json.gzip");
}

// ── Elements ─────────────────────────────────────────────────────────────────

TEST_F(CollectionTest, SetThenGet) {
    ASSERT_FALSE(collection_->set("alice", "30"));
    std::string value;
    ASSERT_FALSE(collection_->get("alice", value));
    EXPECT_EQ(value, "30");
    EXPECT_TRUE(collection_->contains("alice"));
    EXPECT_EQ(collection_->size(), 1u);
}

TEST_F(CollectionTest, GetMissingReturnsNotFound) {
    std::string value;
    EXPECT_EQ(collection_->get("nobody", value), make_error_code(Errc::not_found));
}

TEST_F(CollectionTest, GetFillsCacheAndSetInvalidatesIt) {
    ASSERT_FALSE(collection_->set("k", "v1"));
    std::string value;
    ASSERT_FALSE(collection_->get("k", value));
    ASSERT_TRUE(collection_->cache().get("k").has_value());

    ASSERT_FALSE(collection_->set("k", "v2"));
    EXPECT_FALSE(collection_->cache().get("k").has_value());
    ASSERT_FALSE(collection_->get("k", value));
    EXPECT_EQ(value, "v2");
}

TEST_F(CollectionTest, ValueReadBeforeSetIsNotCachedAfterIt) {
    ASSERT_FALSE(collection_->set("k", "old"));

    // A reader misses the cache and fetches "old" from the shards...
    const uint64_t generation = collection_->cache().generation();
    std::string stale = "old";

    // ...a writer replaces the value before the reader fills the cache.
    ASSERT_FALSE(collection_->set("k", "new"));
    EXPECT_FALSE(collection_->cache().fill("k", stale, generation));

    std::string value;
    ASSERT_FALSE(collection_->get("k", value));
    EXPECT_EQ(value, "new");
}

TEST_F(CollectionTest, ValueReadBeforeDelIsNotCachedAfterIt) {
    ASSERT_FALSE(collection_->set("k", "v"));
    const uint64_t generation = collection_->cache().generation();
    ASSERT_TRUE(collection_->del("k"));
    EXPECT_FALSE(collection_->cache().fill("k", "v", generation));

    std::string value;
    EXPECT_EQ(collection_->get("k", value), make_error_code(Errc::not_found));
}

TEST_F(CollectionTest, DelRemovesFromShardsAndCache) {
    ASSERT_FALSE(collection_->set("k", "v"));
    std::string value;
    ASSERT_FALSE(collection_->get("k", value));

    EXPECT_TRUE(collection_->del("k"));
    EXPECT_FALSE(collection_->del("k"));
    EXPECT_FALSE(collection_->cache().get("k").has_value());
    EXPECT_EQ(collection_->get("k", value), make_error_code(Errc::not_found));
}

TEST_F(CollectionTest, AddAllocatesSequentialIds) {
    uint64_t first = 0, second = 0;
    ASSERT_FALSE(collection_->add("a", first));
    ASSERT_FALSE(collection_->add("b", second));
    EXPECT_EQ(first, 1u);
    EXPECT_EQ(second, 2u);

    std::string value;
    ASSERT_FALSE(collection_->get("2", value));
    EXPECT_EQ(value, "b");
}

TEST_F(CollectionTest, KeysListsEveryElement) {
    ASSERT_FALSE(collection_->set("a", "1"));
    ASSERT_FALSE(collection_->set("b", "2"));
    auto keys = collection_->keys();
    std::sort(keys.begin(), keys.end());
    EXPECT_EQ(keys, (std::vector<std::string>{"a", "b"}));
}

// ── Structures ───────────────────────────────────────────────────────────────

TEST_F(CollectionTest, StructureRoundTripsThroughRegistry) {
    TypeRegistry registry;
    registry.register_type_name<User>("user");

    User ann;
    ann.name = "ann";
    ann.age  = 41;
    ASSERT_FALSE(collection_->put_structure("ann", ann, registry));

    std::unique_ptr<CustomStructure> out;
    ASSERT_FALSE(collection_->get_structure("ann", registry, out));
    auto* user = dynamic_cast<User*>(out.get());
    ASSERT_NE(user, nullptr);
    EXPECT_EQ(user->name, "ann");
    EXPECT_EQ(user->age, 41);
}

TEST_F(CollectionTest, UnregisteredStructureIsRejected) {
    TypeRegistry registry;
    User ann;
    EXPECT_EQ(collection_->put_structure("ann", ann, registry),
              make_error_code(Errc::unknown_type));
    EXPECT_FALSE(collection_->contains("ann"));
}

TEST_F(CollectionTest, StructureReadWithoutRegistrationIsUnknown) {
    TypeRegistry writer;
    writer.register_type_name<User>("user");
    User ann;
    ASSERT_FALSE(collection_->put_structure("ann", ann, writer));

    TypeRegistry reader;
    std::unique_ptr<CustomStructure> out;
    EXPECT_EQ(collection_->get_structure("ann", reader, out),
              make_error_code(Errc::unknown_type));
}

// ── Persistence ──────────────────────────────────────────────────────────────

TEST_F(CollectionTest, SyncWritesDescriptor) {
    ASSERT_FALSE(collection_->set("a", "1"));
    ASSERT_FALSE(collection_->set("b", "2"));
    ASSERT_FALSE(collection_->sync());

    CollectionDescriptor descriptor;
    ASSERT_FALSE(Collection::load_descriptor(descriptor_path(), descriptor));
    EXPECT_EQ(descriptor.name, "users");
    EXPECT_EQ(descriptor.path, kRelative);
    EXPECT_EQ(descriptor.objects, 2u);
    EXPECT_EQ(descriptor.shard_count, kShardCount);
}

TEST_F(CollectionTest, MissingDescriptorIsCorrupted) {
    CollectionDescriptor descriptor;
    EXPECT_EQ(Collection::load_descriptor(descriptor_path(), descriptor),
              make_error_code(Errc::corrupted_collection));
}

TEST_F(CollectionTest, DescriptorWithWrongShapeIsCorrupted) {
    Json::Value json(Json::objectValue);
    json["name"] = "users";
    CollectionDescriptor descriptor;
    EXPECT_EQ(CollectionDescriptor::from_json(json, descriptor),
              make_error_code(Errc::corrupted_collection));
}

TEST_F(CollectionTest, OptimizeKeepsElementsAndReportsReclaimedBytes) {
    for (int i = 0; i < 20; ++i) {
        ASSERT_FALSE(collection_->set("k" + std::to_string(i), "first"));
    }
    for (int i = 0; i < 20; ++i) {
        ASSERT_FALSE(collection_->set("k" + std::to_string(i), "second"));
    }
    ASSERT_TRUE(collection_->del("k0"));

    uint64_t stale = 0;
    for (std::size_t i = 0; i < kShardCount; ++i) {
        const auto& shard = collection_->map().shard(i);
        stale += shard.file_bytes() - shard.live_bytes();
    }

    uint64_t reclaimed = 0;
    ASSERT_FALSE(collection_->optimize(reclaimed));
    EXPECT_EQ(reclaimed, stale);
    EXPECT_EQ(collection_->size(), 19u);

    std::string value;
    ASSERT_FALSE(collection_->get("k7", value));
    EXPECT_EQ(value, "second");
}

} // namespace shardb
