#include <gtest/gtest.h>
#include <spdlog/sinks/ostream_sink.h>
#include <spdlog/spdlog.h>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <sys/stat.h>
#include <vector>

#include "core/seal_error.h"
#include "test_helpers.h"
#include "utils/atomic_file.h"
#include "utils/hash.h"
#include "utils/hex.h"
#include "utils/logger.h"

using namespace modelseal;
using modelseal::test::EnvGuard;
using modelseal::test::TempDir;
namespace fs = std::filesystem;

TEST(LoggerTest, InitSetsLevelAndWritesToSink) {
    auto original_logger = spdlog::default_logger();
    auto original_level = spdlog::get_level();
    std::stringstream ss;
    auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(ss);
    modelseal::logger::init("debug", "%v", "", {sink});

    spdlog::info("hello");
    EXPECT_EQ(spdlog::default_logger()->level(), spdlog::level::debug);
    auto output = ss.str();
    EXPECT_NE(output.find("hello"), std::string::npos);

    // Restore default logger to avoid dangling stream sinks in later tests.
    spdlog::set_default_logger(std::move(original_logger));
    spdlog::set_level(original_level);
    spdlog::drop("modelseal");
}

TEST(LoggerTest, ParseLevelFallsBackToWarn) {
    EXPECT_EQ(modelseal::logger::parse_level("DEBUG"), spdlog::level::debug);
    EXPECT_EQ(modelseal::logger::parse_level("warning"), spdlog::level::warn);
    EXPECT_EQ(modelseal::logger::parse_level("error"), spdlog::level::err);
    EXPECT_EQ(modelseal::logger::parse_level("off"), spdlog::level::off);
    EXPECT_EQ(modelseal::logger::parse_level("chatty"), spdlog::level::warn);
}

TEST(LoggerTest, InitFromEnvWritesJsonLogsToFile) {
    auto original_logger = spdlog::default_logger();
    auto original_level = spdlog::get_level();

    EnvGuard env_guard({"MODELSEAL_LOG_DIR", "MODELSEAL_LOG_LEVEL", "MODELSEAL_LOG_RETENTION_DAYS"});

    TempDir tmp;
    setenv("MODELSEAL_LOG_DIR", tmp.path.string().c_str(), 1);
    setenv("MODELSEAL_LOG_LEVEL", "info", 1);

    modelseal::logger::init_from_env();
    spdlog::info("hello");
    spdlog::default_logger()->flush();

    std::string log_path = modelseal::logger::get_log_file_path(modelseal::logger::get_log_dir());

    spdlog::set_default_logger(std::move(original_logger));
    spdlog::set_level(original_level);
    spdlog::drop("modelseal");

    std::ifstream ifs(log_path);
    ASSERT_TRUE(ifs.is_open());

    std::string line;
    bool found = false;
    while (std::getline(ifs, line)) {
        if (line.find("hello") != std::string::npos) {
            found = true;
            EXPECT_EQ(line.front(), '{');
            EXPECT_NE(line.find("\"level\""), std::string::npos);
            EXPECT_NE(line.find("\"msg\":\"hello\""), std::string::npos);
            break;
        }
    }

    EXPECT_TRUE(found);
}

TEST(HexTest, EncodesLowercaseAndDecodesEitherCase) {
    const std::vector<uint8_t> bytes = {0x00, 0x7f, 0xAB, 0xff};
    EXPECT_EQ(to_hex(bytes), "007fabff");
    EXPECT_EQ(from_hex("007FABff"), bytes);
    EXPECT_EQ(from_hex(""), std::vector<uint8_t>{});
    EXPECT_FALSE(from_hex("abc").has_value());
    EXPECT_FALSE(from_hex("zz").has_value());
}

TEST(HashTest, AlgorithmNamesAndSizes) {
    EXPECT_STREQ(to_string(HashAlgorithm::kBlake2b512), "BLAKE2b512");
    EXPECT_STREQ(to_string(HashAlgorithm::kSha256), "SHA256");
    EXPECT_EQ(parse_hash_algorithm("blake2b512"), HashAlgorithm::kBlake2b512);
    EXPECT_EQ(parse_hash_algorithm("SHA256"), HashAlgorithm::kSha256);
    EXPECT_FALSE(parse_hash_algorithm("MD5").has_value());
    EXPECT_EQ(digest_size(HashAlgorithm::kBlake2b512), 64u);
    EXPECT_EQ(digest_size(HashAlgorithm::kSha256), 32u);
}

TEST(HashTest, IncrementalEqualsOneShot) {
    Hasher hasher(HashAlgorithm::kSha256);
    hasher.update("ab", 2);
    hasher.update("c", 1);
    EXPECT_EQ(to_hex(hasher.finish()), "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    EXPECT_EQ(to_hex(hash_bytes(HashAlgorithm::kSha256, "abc", 3)),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(AtomicFileTest, WritesAndReplacesContent) {
    TempDir tmp;
    const auto target = tmp.path / "out.json";
    write_file_atomic(target, "first");
    write_file_atomic(target, "second");
    EXPECT_EQ(read_file_bytes(target, 1024), "second");

    size_t entries = 0;
    for (const auto& e : fs::directory_iterator(tmp.path)) {
        (void)e;
        ++entries;
    }
    EXPECT_EQ(entries, 1u);
}

TEST(AtomicFileTest, AppliesPermissions) {
    TempDir tmp;
    const auto target = tmp.path / "secret";
    write_file_atomic(target, "x", fs::perms::owner_read | fs::perms::owner_write);
    struct stat st {};
    ASSERT_EQ(::stat(target.c_str(), &st), 0);
    EXPECT_EQ(st.st_mode & 0777, 0600u);
}

TEST(AtomicFileTest, FailureLeavesTargetUntouched) {
    TempDir tmp;
    try {
        write_file_atomic(tmp.path / "missing-dir" / "out", "data");
        FAIL() << "expected SealError";
    } catch (const SealError& e) {
        EXPECT_EQ(e.code(), ErrorCode::kIoError);
    }
    EXPECT_FALSE(fs::exists(tmp.path / "missing-dir"));
}

TEST(AtomicFileTest, ReadRejectsOversizedAndMissingFiles) {
    TempDir tmp;
    modelseal::test::write_file(tmp.path / "big", std::string(100, 'x'));
    EXPECT_THROW(read_file_bytes(tmp.path / "big", 10), SealError);
    EXPECT_THROW(read_file_bytes(tmp.path / "none", 10), SealError);
}

TEST(SealErrorTest, CarriesCodeAndPath) {
    SealError err(ErrorCode::kMissingReference, "referenced file does not exist", "/m/shard-2.safetensors");
    EXPECT_EQ(err.code(), ErrorCode::kMissingReference);
    EXPECT_EQ(err.path(), fs::path("/m/shard-2.safetensors"));
    EXPECT_NE(std::string(err.what()).find("shard-2"), std::string::npos);
    EXPECT_STREQ(to_string(ErrorCode::kPartialHashFailure), "PARTIAL_HASH_FAILURE");
    EXPECT_STREQ(to_string(ErrorCode::kInvalidKeyMaterial), "INVALID_KEY_MATERIAL");
}
