#include <gtest/gtest.h>
#include <platform/archive.hpp>
#include <fingerprint/fingerprint.hpp>
#include <core/constants.hpp>
#include <core/utils.hpp>
#include <archive.h>
#include <archive_entry.h>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <random>
#include <map>
#include <chrono>
#include <fmt/format.h>

namespace fs = std::filesystem;
using platform::ArchiveError;

class ArchiveTest : public ::testing::Test {
protected:
    fs::path src;
    fs::path dst;

    void SetUp() override {
        auto base = fs::temp_directory_path() / ("volt_archive_test_" + generate_uuid_v4());
        src = base / "src";
        dst = base / "dst";
        fs::create_directories(src);
        fs::create_directories(dst);
    }

    void TearDown() override {
        fs::remove_all(src.parent_path());
    }

    static void write_file(const fs::path& path, const std::string& content) {
        fs::create_directories(path.parent_path());
        std::ofstream(path, std::ios::binary) << content;
    }

    static std::string read_file(const fs::path& path) {
        std::ifstream in(path, std::ios::binary);
        std::stringstream ss;
        ss << in.rdbuf();
        return ss.str();
    }

    // Every regular file under root/dir, keyed by path relative to root
    static std::map<std::string, std::string> snapshot(const fs::path& root, const std::string& dir) {
        std::map<std::string, std::string> files;
        if (!fs::exists(root / dir)) return files;
        for (const auto& e : fs::recursive_directory_iterator(root / dir)) {
            if (e.is_regular_file() && !e.is_symlink()) {
                files[e.path().lexically_relative(root).generic_string()] = read_file(e.path());
            }
        }
        return files;
    }

    // Hand-built archive holding one file entry with an arbitrary name
    static std::string raw_archive(const std::string& name, const std::string& content) {
        std::string out;
        struct archive* a = archive_write_new();
        archive_write_set_format_pax_restricted(a);
        archive_write_add_filter_zstd(a);
        archive_write_open(a, &out, nullptr,
            [](struct archive*, void* client, const void* buf, size_t len) -> la_ssize_t {
                static_cast<std::string*>(client)->append(static_cast<const char*>(buf), len);
                return static_cast<la_ssize_t>(len);
            }, nullptr);

        struct archive_entry* e = archive_entry_new();
        archive_entry_set_pathname(e, name.c_str());
        archive_entry_set_filetype(e, AE_IFREG);
        archive_entry_set_perm(e, 0644);
        archive_entry_set_size(e, static_cast<la_int64_t>(content.size()));
        archive_write_header(a, e);
        archive_write_data(a, content.data(), content.size());
        archive_entry_free(e);

        archive_write_close(a);
        archive_write_free(a);
        return out;
    }
};

TEST_F(ArchiveTest, RoundTripSmall) {
    write_file(src / "build/a.o", "alpha");
    write_file(src / "build/nested/deep/b.o", "beta");
    write_file(src / "build/empty.txt", "");
    write_file(src / ".cache/dep.bin", std::string("\0\x01\x02\xff", 4));
    fs::create_directories(src / "build/empty_dir");

    platform::PackStats stats;
    auto data = platform::pack_dirs(src, {"build", ".cache"}, &stats);
    EXPECT_FALSE(data.empty());
    EXPECT_GE(stats.entries, 4u);
    EXPECT_EQ(stats.input_bytes, 5u + 4u + 0u + 4u);

    platform::unpack_dirs(data, dst, {"build", ".cache"});

    EXPECT_EQ(snapshot(dst, "build"), snapshot(src, "build"));
    EXPECT_EQ(snapshot(dst, ".cache"), snapshot(src, ".cache"));
    EXPECT_TRUE(fs::is_directory(dst / "build/empty_dir"));
}

TEST_F(ArchiveTest, RoundTripLarge) {
    // Past the parallel compression threshold
    std::mt19937 rng(7);
    std::string blob(9 * 1024 * 1024, '\0');
    for (auto& c : blob) c = static_cast<char>('a' + rng() % 8);
    write_file(src / "target/big.bin", blob);
    for (int i = 0; i < 50; i++) {
        write_file(src / ("target/obj/" + std::to_string(i) + ".o"), std::string(1000 + i, 'x'));
    }

    auto data = platform::pack_dirs(src, {"target"});
    EXPECT_LT(data.size(), blob.size());

    platform::unpack_dirs(data, dst, {"target"});
    EXPECT_EQ(snapshot(dst, "target"), snapshot(src, "target"));
}

TEST_F(ArchiveTest, RoundTripManyFilesKeepsFingerprint) {
    // Enough files that the fingerprint samples, which folds in mtime
    for (size_t i = 0; i < EXACT_HASH_MAX_FILES + 100; i++) {
        write_file(src / fmt::format("target/deps/{:02}/{}.rlib", i % 37, i),
                   fmt::format("object {}", i));
    }

    platform::unpack_dirs(platform::pack_dirs(src, {"target"}), dst, {"target"});

    EXPECT_EQ(snapshot(dst, "target").size(), EXACT_HASH_MAX_FILES + 100);
    EXPECT_EQ(snapshot(dst, "target"), snapshot(src, "target"));

    auto src_fp = fingerprint::compute_fingerprint({"target"}, src);
    EXPECT_EQ(src_fp.size(), 16u);
    EXPECT_EQ(fingerprint::compute_fingerprint({"target"}, dst), src_fp);
}

TEST_F(ArchiveTest, PreservesSymlinksAndMtime) {
    write_file(src / "build/real.txt", "real");
    fs::create_symlink("real.txt", src / "build/link.txt");
    // Archives carry whole seconds
    fs::file_time_type mtime = std::chrono::time_point_cast<std::chrono::seconds>(
        fs::last_write_time(src / "build/real.txt") - std::chrono::hours(24));
    fs::last_write_time(src / "build/real.txt", mtime);

    platform::unpack_dirs(platform::pack_dirs(src, {"build"}), dst, {"build"});

    ASSERT_TRUE(fs::is_symlink(dst / "build/link.txt"));
    EXPECT_EQ(fs::read_symlink(dst / "build/link.txt"), fs::path("real.txt"));
    EXPECT_EQ(fs::last_write_time(dst / "build/real.txt"), mtime);
}

TEST_F(ArchiveTest, UnpackReplacesExistingContents) {
    write_file(src / "build/keep.o", "new");
    write_file(dst / "build/stale.o", "old");
    write_file(dst / "build/keep.o", "old");
    write_file(dst / "other/untouched.txt", "mine");

    platform::unpack_dirs(platform::pack_dirs(src, {"build"}), dst, {"build"});

    EXPECT_FALSE(fs::exists(dst / "build/stale.o"));
    EXPECT_EQ(read_file(dst / "build/keep.o"), "new");
    EXPECT_EQ(read_file(dst / "other/untouched.txt"), "mine");
}

TEST_F(ArchiveTest, MissingDirIsSkippedOnPack) {
    write_file(src / "build/a.o", "a");
    auto data = platform::pack_dirs(src, {"build", "does_not_exist"});
    platform::unpack_dirs(data, dst, {"build", "does_not_exist"});
    EXPECT_EQ(read_file(dst / "build/a.o"), "a");
    EXPECT_FALSE(fs::exists(dst / "does_not_exist"));
}

TEST_F(ArchiveTest, CorruptInputLeavesDiskUntouched) {
    write_file(dst / "build/existing.o", "keep me");

    EXPECT_THROW(platform::unpack_dirs("", dst, {"build"}), ArchiveError);
    EXPECT_THROW(platform::unpack_dirs("definitely not zstd", dst, {"build"}), ArchiveError);

    write_file(src / "build/a.o", std::string(4096, 'q'));
    auto data = platform::pack_dirs(src, {"build"});
    EXPECT_THROW(platform::unpack_dirs(data.substr(0, data.size() / 2), dst, {"build"}), ArchiveError);

    EXPECT_EQ(read_file(dst / "build/existing.o"), "keep me");
}

TEST_F(ArchiveTest, RejectsEscapingPaths) {
    write_file(dst / "build/existing.o", "keep me");

    EXPECT_THROW(platform::unpack_dirs(raw_archive("../evil.txt", "x"), dst, {"build"}), ArchiveError);
    EXPECT_THROW(platform::unpack_dirs(raw_archive("build/../../evil.txt", "x"), dst, {"build"}), ArchiveError);
    EXPECT_THROW(platform::unpack_dirs(raw_archive("/tmp/evil.txt", "x"), dst, {"build"}), ArchiveError);

    EXPECT_FALSE(fs::exists(dst.parent_path() / "evil.txt"));
    EXPECT_EQ(read_file(dst / "build/existing.o"), "keep me");
}

TEST_F(ArchiveTest, IgnoresEntriesOutsideCacheDirs) {
    platform::unpack_dirs(raw_archive("src/main.c", "int main;"), dst, {"build"});
    EXPECT_FALSE(fs::exists(dst / "src/main.c"));
}
