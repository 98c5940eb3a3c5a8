#include <gtest/gtest.h>
#include <fingerprint/fingerprint.hpp>
#include <fingerprint/sampling_hash.hpp>
#include <fingerprint/tree_hash.hpp>
#include <core/constants.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>
#include <filesystem>
#include <fstream>
#include <atomic>
#include <set>
#include <mutex>
#include <system_error>

namespace fs = std::filesystem;
using namespace fingerprint;

class FingerprintTest : public ::testing::Test {
protected:
    fs::path root;

    void SetUp() override {
        root = fs::temp_directory_path() / ("volt_fingerprint_test_" + generate_uuid_v4());
        fs::create_directories(root);
    }

    void TearDown() override {
        fs::remove_all(root);
    }

    void write_file(const std::string& rel, const std::string& content) {
        auto full = root / rel;
        fs::create_directories(full.parent_path());
        std::ofstream(full, std::ios::binary) << content;
    }

    // More files than the exact hash accepts
    void write_many(const std::string& dir, std::size_t count) {
        for (std::size_t i = 0; i < count; i++) {
            write_file(fmt::format("{}/{:03}/f{}.o", dir, i % 37, i), fmt::format("object {}", i));
        }
    }
};

TEST_F(FingerprintTest, EmptyListIsSentinel) {
    EXPECT_EQ(compute_fingerprint({}, root), SENTINEL_FINGERPRINT);
}

TEST_F(FingerprintTest, MissingDirIsSentinel) {
    EXPECT_EQ(compute_fingerprint({"nope"}, root), SENTINEL_FINGERPRINT);
}

TEST_F(FingerprintTest, ExactHashShape) {
    write_file("build/a.o", "aaa");
    auto fp = compute_fingerprint({"build"}, root);
    EXPECT_EQ(fp.size(), 64u);
    EXPECT_NE(fp, SENTINEL_FINGERPRINT);
    EXPECT_EQ(fp.find_first_not_of("0123456789abcdef"), std::string::npos);
}

TEST_F(FingerprintTest, OrderOfDirsDoesNotMatter) {
    write_file("a/x.txt", "x");
    write_file("b/y.txt", "y");
    write_file("c/z.txt", "z");

    auto fp = compute_fingerprint({"a", "b", "c"}, root);
    EXPECT_EQ(fp, compute_fingerprint({"c", "a", "b"}, root));
    EXPECT_EQ(fp, compute_fingerprint({"b", "./c/", "a"}, root));
    EXPECT_EQ(fp, compute_fingerprint({"a", "a", "b", "c"}, root));
}

TEST_F(FingerprintTest, StableAcrossCalls) {
    write_file("build/one", "1");
    write_file("build/sub/two", "22");
    auto first = compute_fingerprint({"build"}, root);
    for (int i = 0; i < 3; i++) {
        EXPECT_EQ(compute_fingerprint({"build"}, root), first);
    }
}

TEST_F(FingerprintTest, ExactPathSeesEveryContentChange) {
    write_file("build/lib.a", "abcdef");
    write_file("build/obj/main.o", "main");
    auto before = compute_fingerprint({"build"}, root);

    // Same size, same mtime, different bytes
    auto mtime = fs::last_write_time(root / "build/lib.a");
    write_file("build/lib.a", "abcdeF");
    fs::last_write_time(root / "build/lib.a", mtime);

    EXPECT_NE(compute_fingerprint({"build"}, root), before);
}

TEST_F(FingerprintTest, ExactPathIgnoresMtime) {
    write_file("build/lib.a", "abcdef");
    auto before = compute_fingerprint({"build"}, root);

    auto mtime = fs::last_write_time(root / "build/lib.a");
    fs::last_write_time(root / "build/lib.a", mtime - std::chrono::hours(5));

    EXPECT_EQ(compute_fingerprint({"build"}, root), before);
}

TEST_F(FingerprintTest, TreeHashFollowsNoSymlinks) {
    write_file("build/real", "data");
    fs::create_symlink("real", root / "build/link");
    auto with_link = exact_tree_hash(root / "build");
    ASSERT_TRUE(with_link.has_value());

    fs::remove(root / "build/link");
    fs::create_symlink("elsewhere", root / "build/link");
    auto retargeted = exact_tree_hash(root / "build");
    ASSERT_TRUE(retargeted.has_value());

    EXPECT_NE(*with_link, *retargeted);
}

TEST_F(FingerprintTest, PlanFollowsFileCount) {
    write_many("small", 10);
    EXPECT_TRUE(std::holds_alternative<ExactPlan>(choose_plan(root, {"small"})));

    write_many("big", EXACT_HASH_MAX_FILES + 1);
    EXPECT_TRUE(std::holds_alternative<SamplingPlan>(choose_plan(root, {"big"})));
    EXPECT_TRUE(std::holds_alternative<SamplingPlan>(choose_plan(root, {"small", "big"})));
}

TEST_F(FingerprintTest, SamplingPath) {
    write_many("target", 1100);
    auto fp = compute_fingerprint({"target"}, root);
    EXPECT_EQ(fp.size(), 16u);
    EXPECT_EQ(compute_fingerprint({"target"}, root), fp);

    // Size change
    write_file("target/000/f0.o", "object 0 grown");
    auto grown = compute_fingerprint({"target"}, root);
    EXPECT_NE(grown, fp);

    // Whole-second mtime change
    auto path = root / "target/001/f1.o";
    fs::last_write_time(path, fs::last_write_time(path) + std::chrono::seconds(10));
    EXPECT_NE(compute_fingerprint({"target"}, root), grown);
}

TEST_F(FingerprintTest, SamplingIgnoresWorkerCount) {
    write_many("target", 300);
    auto one = sampling_hash(root, {"target"}, 1);
    EXPECT_EQ(sampling_hash(root, {"target"}, 3), one);
    EXPECT_EQ(sampling_hash(root, {"target"}, 16), one);
}

TEST_F(FingerprintTest, SampledContentMatters) {
    // Find a path that gets its content read, then change only its bytes
    std::string rel;
    for (int i = 0; i < 1000 && rel.empty(); i++) {
        auto candidate = fmt::format("target/s{}.bin", i);
        if (should_sample(candidate)) rel = candidate;
    }
    ASSERT_FALSE(rel.empty());

    write_file(rel, "xxxx");
    FileRef ref{rel, root / rel};
    auto before = file_digest(ref);

    auto mtime = fs::last_write_time(ref.abs);
    write_file(rel, "yyyy");
    fs::last_write_time(ref.abs, mtime);
    EXPECT_NE(file_digest(ref), before);
}

TEST(FanOut, FinishesWhenThreadsCannotStart) {
    const std::size_t items = 500;
    std::atomic<std::size_t> next{0};
    std::atomic<std::size_t> done{0};
    std::mutex slots_mutex;
    std::set<unsigned> slots;

    auto work = [&](unsigned slot) {
        {
            std::lock_guard<std::mutex> lock(slots_mutex);
            slots.insert(slot);
        }
        for (std::size_t i = next++; i < items; i = next++) done++;
    };

    int started = 0;
    ThreadStarter start = [&](std::function<void()> fn) {
        if (started == 2) {
            throw std::system_error(std::make_error_code(std::errc::resource_unavailable_try_again));
        }
        started++;
        return std::thread(std::move(fn));
    };

    fan_out(8, work, start);
    EXPECT_EQ(done.load(), items);
    EXPECT_EQ(slots, (std::set<unsigned>{0, 1, 2}));
}

TEST(ShouldSample, RoughlyTenPercent) {
    int hits = 0;
    const int total = 20000;
    for (int i = 0; i < total; i++) {
        if (should_sample(fmt::format("build/obj/file{}.o", i))) hits++;
    }
    double ratio = static_cast<double>(hits) / total;
    EXPECT_GT(ratio, 0.08);
    EXPECT_LT(ratio, 0.12);

    EXPECT_EQ(should_sample("build/a.o"), should_sample("build/a.o"));
}

TEST(CombineHashes, RoundsAndXor) {
    std::vector<std::string> hashes = {
        std::string("0000000000000001") + std::string(48, 'f'),
        std::string("0000000000000002") + std::string(48, 'e'),
    };
    // round r: (1 + r) ^ (2 + r)
    EXPECT_EQ(combine_hashes(hashes),
              "0000000000000003"
              "0000000000000001"
              "0000000000000007"
              "0000000000000001");
}

TEST(CombineHashes, ShortHashesUseWholeValue) {
    EXPECT_EQ(combine_hashes({"00000000000000ff"}),
              "00000000000000ff"
              "0000000000000100"
              "0000000000000101"
              "0000000000000102");
}
