#include <gtest/gtest.h>
#include <server/cache_store.hpp>
#include <core/utils.hpp>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <thread>
#include <atomic>
#include <vector>
#include <unistd.h>

namespace fs = std::filesystem;

class CacheStoreTest : public ::testing::Test {
protected:
    fs::path root;
    const std::string slot = "3f2b8c1e-9a4d-4e6f-8b7a-1c2d3e4f5a6b";

    void SetUp() override {
        root = fs::temp_directory_path() / ("volt_store_test_" + generate_uuid_v4());
    }

    void TearDown() override {
        fs::remove_all(root);
    }

    static std::string read_file(const fs::path& path) {
        std::ifstream in(path, std::ios::binary);
        std::stringstream ss;
        ss << in.rdbuf();
        return ss.str();
    }

    static std::string read_fd(int fd) {
        std::string out;
        char buf[4096];
        ssize_t n;
        while ((n = ::read(fd, buf, sizeof(buf))) > 0) out.append(buf, static_cast<size_t>(n));
        return out;
    }
};

TEST_F(CacheStoreTest, PushThenPull) {
    CacheStore store(root);
    ASSERT_EQ(store.push(slot, "archive-bytes", "fp1"), StoreStatus::Ok);

    EXPECT_EQ(read_file(store.archive_path(slot)), "archive-bytes");
    EXPECT_EQ(read_file(store.hash_path(slot)), "fp1");

    auto res = store.pull(slot, std::string("other"));
    ASSERT_EQ(res.status, StoreStatus::Ok);
    ASSERT_TRUE(res.archive.valid());
    EXPECT_EQ(res.size, 13u);
    EXPECT_EQ(res.fingerprint, "fp1");
    EXPECT_EQ(read_fd(res.archive.get()), "archive-bytes");
}

TEST_F(CacheStoreTest, MatchingFingerprintIsNotModified) {
    CacheStore store(root);
    ASSERT_EQ(store.push(slot, "data", "abc"), StoreStatus::Ok);

    auto res = store.pull(slot, std::string("abc"));
    EXPECT_EQ(res.status, StoreStatus::NotModified);
    EXPECT_FALSE(res.archive.valid());

    EXPECT_EQ(store.check(slot, std::string("abc")), StoreStatus::NotModified);
    EXPECT_EQ(store.check(slot, std::string("xyz")), StoreStatus::Changed);
}

TEST_F(CacheStoreTest, StoredFingerprintIsTrimmed) {
    CacheStore store(root);
    ASSERT_EQ(store.push(slot, "data", "abc"), StoreStatus::Ok);
    std::ofstream(store.hash_path(slot)) << "abc\n";

    EXPECT_EQ(store.pull(slot, std::string("abc")).status, StoreStatus::NotModified);
}

TEST_F(CacheStoreTest, NothingStored) {
    CacheStore store(root);
    EXPECT_EQ(store.pull(slot, std::string("abc")).status, StoreStatus::NotFound);
    EXPECT_EQ(store.check(slot, std::string("abc")), StoreStatus::NotFound);
    EXPECT_EQ(store.check(slot, std::nullopt), StoreStatus::NotFound);
    EXPECT_FALSE(store.stored_fingerprint(slot).has_value());
}

TEST_F(CacheStoreTest, BadRequests) {
    CacheStore store(root);
    ASSERT_EQ(store.push(slot, "data", "abc"), StoreStatus::Ok);

    EXPECT_EQ(store.pull(slot, std::nullopt).status, StoreStatus::BadRequest);
    EXPECT_EQ(store.check(slot, std::nullopt), StoreStatus::BadRequest);

    EXPECT_EQ(store.pull("not-a-uuid", std::string("abc")).status, StoreStatus::BadRequest);
    EXPECT_EQ(store.check("../../etc/passwd", std::string("abc")), StoreStatus::BadRequest);
    EXPECT_EQ(store.push("../escape", "x", "y"), StoreStatus::BadRequest);
    EXPECT_FALSE(fs::exists(root.parent_path() / "escape.zst"));
}

TEST_F(CacheStoreTest, MissingFingerprintStoresEmpty) {
    CacheStore store(root);
    ASSERT_EQ(store.push(slot, "data", ""), StoreStatus::Ok);
    auto fp = store.stored_fingerprint(slot);
    ASSERT_TRUE(fp.has_value());
    EXPECT_TRUE(fp->empty());

    // An empty stored fingerprint never matches a real one
    EXPECT_EQ(store.pull(slot, std::string("abc")).status, StoreStatus::Ok);
}

TEST_F(CacheStoreTest, PushOverwrites) {
    CacheStore store(root);
    ASSERT_EQ(store.push(slot, "first", "1"), StoreStatus::Ok);
    ASSERT_EQ(store.push(slot, "second", "2"), StoreStatus::Ok);

    EXPECT_EQ(read_file(store.archive_path(slot)), "second");
    EXPECT_EQ(*store.stored_fingerprint(slot), "2");
}

TEST_F(CacheStoreTest, AbortedUploadLeavesNothing) {
    CacheStore store(root);
    StagedUpload up;
    ASSERT_EQ(store.begin_push(slot, up), StoreStatus::Ok);
    std::ofstream(up.path) << "partial";
    store.abort_push(up);

    EXPECT_FALSE(fs::exists(up.path));
    EXPECT_FALSE(fs::exists(store.archive_path(slot)));
    EXPECT_EQ(store.pull(slot, std::string("x")).status, StoreStatus::NotFound);
}

TEST_F(CacheStoreTest, RemovesStaleStaging) {
    CacheStore store(root);
    StagedUpload a, b;
    ASSERT_EQ(store.begin_push(slot, a), StoreStatus::Ok);
    ASSERT_EQ(store.begin_push(slot, b), StoreStatus::Ok);
    EXPECT_NE(a.path, b.path);
    std::ofstream(a.path) << "a";
    std::ofstream(b.path) << "b";
    ASSERT_EQ(store.push(slot, "kept", "fp"), StoreStatus::Ok);

    EXPECT_EQ(store.remove_stale_staging(), 2);
    EXPECT_TRUE(fs::exists(store.archive_path(slot)));
    EXPECT_TRUE(fs::exists(store.hash_path(slot)));
}

TEST_F(CacheStoreTest, SlotLocksAreReleased) {
    CacheStore store(root);
    ASSERT_EQ(store.push(slot, "data", "fp"), StoreStatus::Ok);
    for (int i = 0; i < 200; i++) {
        auto other = generate_uuid_v4();
        EXPECT_EQ(store.pull(other, std::string("x")).status, StoreStatus::NotFound);
        EXPECT_EQ(store.check(other, std::string("x")), StoreStatus::NotFound);
    }
    // Only the most recent, already released, entry may remain
    EXPECT_LE(store.tracked_slots(), 1u);

    // A pull holding its archive open no longer holds the lock
    auto res = store.pull(slot, std::string("other"));
    ASSERT_EQ(res.status, StoreStatus::Ok);
    EXPECT_EQ(store.push(slot, "next", "fp2"), StoreStatus::Ok);
}

TEST_F(CacheStoreTest, ConcurrentPushesKeepPairsConsistent) {
    CacheStore store(root);
    const int writers = 8;
    const int rounds = 25;

    // Archive body and fingerprint both name the writer and round
    std::vector<std::thread> threads;
    for (int w = 0; w < writers; w++) {
        threads.emplace_back([&, w] {
            for (int r = 0; r < rounds; r++) {
                std::string tag = "w" + std::to_string(w) + "r" + std::to_string(r);
                EXPECT_EQ(store.push(slot, "body-" + tag + "|" + std::string(static_cast<size_t>(w * 100), '.'), tag),
                          StoreStatus::Ok);
            }
        });
    }

    std::atomic<bool> done{false};
    std::atomic<int> mismatches{0};
    std::thread reader([&] {
        while (!done) {
            auto res = store.pull(slot, std::string("never-matches"));
            if (res.status != StoreStatus::Ok) continue;
            std::string body = read_fd(res.archive.get());
            // Archive and fingerprint opened under one lock must belong to the same push
            std::string expected = "body-" + res.fingerprint + "|";
            if (body.compare(0, expected.size(), expected) != 0) mismatches++;
        }
    });

    for (auto& t : threads) t.join();
    done = true;
    reader.join();
    EXPECT_EQ(mismatches.load(), 0);

    auto fp = store.stored_fingerprint(slot);
    ASSERT_TRUE(fp.has_value());
    std::string body = read_file(store.archive_path(slot));
    std::string expected = "body-" + *fp + "|";
    EXPECT_EQ(body.compare(0, expected.size(), expected), 0) << *fp << " vs " << body.substr(0, 20);

    int leftovers = 0;
    for (const auto& e : fs::directory_iterator(root)) {
        if (e.path().extension() == ".part") leftovers++;
    }
    EXPECT_EQ(leftovers, 0);
}
