#include <gtest/gtest.h>

#include <atomic>
#include <thread>
#include <unistd.h>

#include "core/seal_error.h"
#include "signing/digest_engine.h"
#include "test_helpers.h"
#include "utils/hex.h"

using namespace modelseal;
using namespace modelseal::test;

namespace {

ArtifactFileSet make_set(const fs::path& root, const std::vector<std::string>& names) {
    ArtifactFileSet set;
    set.root = root;
    for (const auto& n : names) set.files.push_back({root / n, n});
    return set;
}

std::string pattern(size_t size, uint8_t seed) {
    std::string out(size, '\0');
    for (size_t i = 0; i < size; ++i) out[i] = static_cast<char>((i * 31 + seed) & 0xFF);
    return out;
}

}  // namespace

TEST(DigestEngineTest, FileDigestMatchesKnownVectors) {
    TempDir dir;
    write_file(dir.path / "abc", "abc");
    write_file(dir.path / "empty", "");

    DigestEngine sha({HashAlgorithm::kSha256});
    auto abc = sha.hash_file(dir.path / "abc", "abc");
    EXPECT_EQ(to_hex(abc.digest), "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    EXPECT_EQ(abc.size, 3u);
    EXPECT_EQ(abc.relative_path, "abc");

    auto empty = sha.hash_file(dir.path / "empty", "empty");
    EXPECT_EQ(to_hex(empty.digest), "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
    EXPECT_EQ(empty.size, 0u);

    DigestEngine blake;
    EXPECT_EQ(to_hex(blake.hash_file(dir.path / "abc", "abc").digest),
              "ba80a53f981c4d0d6a2797b69f12f6e94c212f14685ac4b74b12bb6fdbffa2d1"
              "7d87c5392aab792dc252d5de4533cc9518d38aa8dbf1925ab92386edd4009923");
}

TEST(DigestEngineTest, WindowedHashEqualsOneShotHash) {
    TempDir dir;
    // Several windows plus a partial tail at the smallest (page-sized) window.
    const std::string content = pattern(3 * 4096 * 4 + 123, 7);
    write_file(dir.path / "big.bin", content);

    DigestOptions options;
    options.window_size = 1;
    DigestEngine engine(options);
    EXPECT_GE(engine.window_size(), 4096u);
    EXPECT_EQ(engine.window_size() % 4096, 0u);

    const auto digest = engine.hash_file(dir.path / "big.bin", "big.bin");
    EXPECT_EQ(digest.digest, hash_bytes(HashAlgorithm::kBlake2b512, content.data(), content.size()));
    EXPECT_EQ(digest.size, content.size());
}

TEST(DigestEngineTest, ResultDoesNotDependOnWorkerCount) {
    TempDir dir;
    std::vector<std::string> names;
    for (int i = 0; i < 12; ++i) {
        names.push_back("shard-" + std::to_string(10 + i) + ".bin");
        write_file(dir.path / names.back(), pattern(1000 + i * 517, static_cast<uint8_t>(i)));
    }
    const auto set = make_set(dir.path, names);

    DigestOptions single;
    single.workers = 1;
    DigestOptions many;
    many.workers = 8;
    const auto a = DigestEngine(single).compute(set);
    const auto b = DigestEngine(many).compute(set);

    EXPECT_EQ(a.files, b.files);
    EXPECT_EQ(a.root, b.root);
    ASSERT_EQ(a.files.size(), names.size());
    for (size_t i = 0; i < names.size(); ++i) EXPECT_EQ(a.files[i].relative_path, names[i]);
}

TEST(DigestEngineTest, WorkerCountIsBoundedByFiles) {
    DigestOptions options;
    options.workers = 16;
    DigestEngine engine(options);
    EXPECT_EQ(engine.worker_count(3), 3u);
    EXPECT_EQ(engine.worker_count(0), 1u);
    EXPECT_GE(DigestEngine().worker_count(100), 1u);
}

TEST(DigestEngineTest, TotalBytesSumsFileSizes) {
    TempDir dir;
    write_file(dir.path / "a.bin", std::string(10, 'a'));
    write_file(dir.path / "b.bin", std::string(20, 'b'));
    const auto result = DigestEngine().compute(make_set(dir.path, {"a.bin", "b.bin"}));
    EXPECT_EQ(result.total_bytes(), 30u);
    EXPECT_EQ(result.algorithm, HashAlgorithm::kBlake2b512);
    EXPECT_EQ(result.root.size(), 64u);
}

TEST(DigestEngineTest, RootDependsOnPathsSizesAndOrder) {
    const std::vector<uint8_t> d1(32, 0x11);
    const std::vector<uint8_t> d2(32, 0x22);
    const std::vector<FileDigest> base = {{"a.bin", d1, 10}, {"b.bin", d2, 20}};
    const auto root = DigestEngine::root_digest(HashAlgorithm::kSha256, base);
    EXPECT_EQ(root.size(), 32u);
    EXPECT_EQ(root, DigestEngine::root_digest(HashAlgorithm::kSha256, base));

    auto renamed = base;
    renamed[1].relative_path = "c.bin";
    EXPECT_NE(DigestEngine::root_digest(HashAlgorithm::kSha256, renamed), root);

    auto reordered = std::vector<FileDigest>{base[1], base[0]};
    EXPECT_NE(DigestEngine::root_digest(HashAlgorithm::kSha256, reordered), root);

    auto resized = base;
    resized[0].size = 11;
    EXPECT_NE(DigestEngine::root_digest(HashAlgorithm::kSha256, resized), root);

    // Same digests under swapped names.
    auto swapped = base;
    std::swap(swapped[0].digest, swapped[1].digest);
    std::swap(swapped[0].size, swapped[1].size);
    EXPECT_NE(DigestEngine::root_digest(HashAlgorithm::kSha256, swapped), root);

    EXPECT_NE(DigestEngine::root_digest(HashAlgorithm::kBlake2b512, base), root);
}

TEST(DigestEngineTest, SequenceEncodingIsUnambiguous) {
    const std::vector<uint8_t> d(4, 0xAA);
    // "ab" + "c" and "a" + "bc" must not encode identically.
    const std::vector<FileDigest> x = {{"ab", d, 1}, {"c", d, 1}};
    const std::vector<FileDigest> y = {{"a", d, 1}, {"bc", d, 1}};
    EXPECT_NE(DigestEngine::encode_sequence(x), DigestEngine::encode_sequence(y));

    const auto empty = DigestEngine::encode_sequence({});
    const std::string tag = "modelseal.root.v1";
    ASSERT_EQ(empty.size(), tag.size() + 8);
    EXPECT_EQ(std::string(empty.begin(), empty.begin() + static_cast<long>(tag.size())), tag);
}

TEST(DigestEngineTest, MissingFileFailsTheWholeComputation) {
    TempDir dir;
    write_file(dir.path / "a.bin", "a");
    const auto set = make_set(dir.path, {"a.bin", "gone.bin"});
    try {
        DigestEngine().compute(set);
        FAIL() << "expected SealError";
    } catch (const SealError& e) {
        EXPECT_EQ(e.code(), ErrorCode::kPartialHashFailure);
        EXPECT_EQ(e.path(), dir.path / "gone.bin");
    }
}

TEST(DigestEngineTest, EmptySetHasStableRoot) {
    ArtifactFileSet set;
    const auto result = DigestEngine().compute(set);
    EXPECT_TRUE(result.files.empty());
    EXPECT_EQ(result.root, DigestEngine::root_digest(HashAlgorithm::kBlake2b512, {}));
}

TEST(DigestEngineTest, FileShrinkingDuringHashIsAReadError) {
    TempDir dir;
    const fs::path file = dir.path / "shrinking.bin";
    constexpr off_t kFullSize = 256 * 1024 * 1024;
    constexpr off_t kShortSize = 4096;
    write_file(file, "");
    ASSERT_EQ(::truncate(file.c_str(), kFullSize), 0);

    DigestOptions options;
    options.workers = 1;
    options.window_size = 1 << 20;
    DigestEngine engine(options);

    // Keep cutting the file down and growing it back (sparse) until hashing ends.
    std::atomic<bool> done{false};
    std::thread resizer([&] {
        while (!done.load()) {
            if (::truncate(file.c_str(), kShortSize) != 0) break;
            std::this_thread::yield();
            if (::truncate(file.c_str(), kFullSize) != 0) break;
        }
    });

    try {
        const auto result = engine.compute(make_set(dir.path, {"shrinking.bin"}));
        EXPECT_EQ(result.files.size(), 1u);
        for (const auto& f : result.files) {
            EXPECT_TRUE(f.size == static_cast<uint64_t>(kFullSize) || f.size == static_cast<uint64_t>(kShortSize));
        }
    } catch (const SealError& e) {
        EXPECT_EQ(e.code(), ErrorCode::kPartialHashFailure);
        EXPECT_EQ(e.path(), file);
    }
    done.store(true);
    resizer.join();
}
