// Drives the command entry points the way main() does and checks exit codes
// and printed reports.

#include <gtest/gtest.h>

#include <iostream>
#include <sstream>

#include "cli/commands.h"
#include "test_helpers.h"

namespace modelseal {
namespace cli {
namespace {

using test::EnvGuard;
using test::TempDir;
using test::write_file;
namespace fs = std::filesystem;

// Redirects std::cout and std::cerr for the lifetime of the object.
class OutputCapture {
public:
    OutputCapture() : old_out_(std::cout.rdbuf(out_.rdbuf())), old_err_(std::cerr.rdbuf(err_.rdbuf())) {}
    ~OutputCapture() {
        std::cout.rdbuf(old_out_);
        std::cerr.rdbuf(old_err_);
    }

    std::string out() const { return out_.str(); }
    std::string err() const { return err_.str(); }

private:
    std::ostringstream out_;
    std::ostringstream err_;
    std::streambuf* old_out_;
    std::streambuf* old_err_;
};

class CliCommandsTest : public ::testing::Test {
protected:
    CliCommandsTest() : env_({"MODELSEAL_CONFIG", "MODELSEAL_HASH_ALGORITHM", "MODELSEAL_SIGNATURE_EXT"}) {
        setenv("MODELSEAL_CONFIG", (tmp_.path / "no-config.json").c_str(), 1);
        unsetenv("MODELSEAL_HASH_ALGORITHM");
        unsetenv("MODELSEAL_SIGNATURE_EXT");
    }

    int create_keys() {
        CreateKeyOptions options;
        options.private_key = (tmp_.path / "key.der").string();
        options.public_key = (tmp_.path / "key.pub").string();
        OutputCapture capture;
        return commands::createKey(options);
    }

    int run_sign(const fs::path& path, std::string* out = nullptr) {
        SignCommandOptions options;
        options.path = path.string();
        options.key = (tmp_.path / "key.der").string();
        OutputCapture capture;
        int code = commands::sign(options);
        if (out) *out = capture.out();
        return code;
    }

    int run_verify(const fs::path& path, std::string* out = nullptr, std::string* err = nullptr) {
        VerifyCommandOptions options;
        options.path = path.string();
        options.key = (tmp_.path / "key.pub").string();
        OutputCapture capture;
        int code = commands::verify(options);
        if (out) *out = capture.out();
        if (err) *err = capture.err();
        return code;
    }

    TempDir tmp_;
    EnvGuard env_;
};

TEST_F(CliCommandsTest, CreateSignVerifyRoundTrip) {
    ASSERT_EQ(create_keys(), commands::kExitOk);
    EXPECT_TRUE(fs::exists(tmp_.path / "key.der"));
    EXPECT_TRUE(fs::exists(tmp_.path / "key.pub"));

    const fs::path dir = tmp_.path / "model";
    write_file(dir / "a.bin", std::string(10, 'a'));
    write_file(dir / "b.bin", std::string(20, 'b'));

    std::string out;
    ASSERT_EQ(run_sign(dir, &out), commands::kExitOk);
    EXPECT_NE(out.find("a.bin"), std::string::npos);
    EXPECT_NE(out.find("Signed 2 file(s), 30 bytes"), std::string::npos);
    EXPECT_NE(out.find("model.signature"), std::string::npos);

    ASSERT_EQ(run_verify(dir, &out), commands::kExitOk);
    EXPECT_NE(out.find("Signature: valid"), std::string::npos);
    EXPECT_NE(out.find("Verified 2 file(s)"), std::string::npos);
}

TEST_F(CliCommandsTest, VerifyReportsMismatchesAndFails) {
    ASSERT_EQ(create_keys(), commands::kExitOk);
    const fs::path dir = tmp_.path / "model";
    write_file(dir / "a.bin", std::string(10, 'a'));
    write_file(dir / "b.bin", std::string(20, 'b'));
    ASSERT_EQ(run_sign(dir), commands::kExitOk);

    test::append_file(dir / "b.bin", "!");
    std::string out;
    EXPECT_EQ(run_verify(dir, &out), commands::kExitFailure);
    EXPECT_NE(out.find("MISMATCH  b.bin  length-mismatch"), std::string::npos);
    EXPECT_NE(out.find("Verification FAILED: 1 content mismatch(es)"), std::string::npos);
}

TEST_F(CliCommandsTest, VerifyWithoutSignatureFails) {
    ASSERT_EQ(create_keys(), commands::kExitOk);
    write_file(tmp_.path / "model" / "a.bin", "a");
    std::string err;
    EXPECT_EQ(run_verify(tmp_.path / "model", nullptr, &err), commands::kExitFailure);
    EXPECT_NE(err.find("MALFORMED_MANIFEST"), std::string::npos);
}

TEST_F(CliCommandsTest, SignWithMissingKeyFails) {
    write_file(tmp_.path / "model" / "a.bin", "a");
    EXPECT_EQ(run_sign(tmp_.path / "model"), commands::kExitFailure);
    EXPECT_FALSE(fs::exists(tmp_.path / "model.signature"));
}

TEST_F(CliCommandsTest, SignReportsUnencodableFileName) {
    ASSERT_EQ(create_keys(), commands::kExitOk);
    const fs::path dir = tmp_.path / "model";
    write_file(dir / "a.bin", "a");
    write_file(dir / "b\xff.bin", "b");

    SignCommandOptions options;
    options.path = dir.string();
    options.key = (tmp_.path / "key.der").string();
    OutputCapture capture;
    EXPECT_EQ(commands::sign(options), commands::kExitFailure);
    EXPECT_NE(capture.err().find("not valid UTF-8"), std::string::npos);
    EXPECT_FALSE(fs::exists(tmp_.path / "model.signature"));
}

TEST_F(CliCommandsTest, CreateKeyRejectsIdenticalPaths) {
    CreateKeyOptions options;
    options.private_key = (tmp_.path / "k").string();
    options.public_key = (tmp_.path / "k").string();
    OutputCapture capture;
    EXPECT_EQ(commands::createKey(options), commands::kExitUsage);
}

TEST_F(CliCommandsTest, UnknownFormatIsUsageError) {
    SignCommandOptions options;
    options.path = (tmp_.path / "m").string();
    options.key = (tmp_.path / "key.der").string();
    options.format = "tflite";
    OutputCapture capture;
    EXPECT_EQ(commands::sign(options), commands::kExitUsage);
    EXPECT_NE(capture.err().find("unknown format 'tflite'"), std::string::npos);
}

TEST_F(CliCommandsTest, InspectPrintsTensorSummary) {
    const fs::path file = tmp_.path / "tiny.safetensors";
    write_file(file, test::small_safetensors());

    InspectOptions options;
    options.path = file.string();
    options.detail = "full";
    OutputCapture capture;
    ASSERT_EQ(commands::inspect(options), commands::kExitOk);
    const std::string out = capture.out();
    EXPECT_NE(out.find("Format:       SafeTensors (0.x)"), std::string::npos);
    EXPECT_NE(out.find("Tensors:      2"), std::string::npos);
    EXPECT_NE(out.find("Dtypes:       F32"), std::string::npos);
    EXPECT_NE(out.find("embed.weight  F32  [2, 2]"), std::string::npos);
    EXPECT_NE(out.find("format: pt"), std::string::npos);
}

TEST_F(CliCommandsTest, InspectFilterNarrowsTensorList) {
    const fs::path file = tmp_.path / "tiny.safetensors";
    write_file(file, test::small_safetensors());

    InspectOptions options;
    options.path = file.string();
    options.filter = "lm_head";
    OutputCapture capture;
    ASSERT_EQ(commands::inspect(options), commands::kExitOk);
    const std::string out = capture.out();
    EXPECT_NE(out.find("Tensor list (1):"), std::string::npos);
    EXPECT_EQ(out.find("embed.weight  F32"), std::string::npos);
}

TEST_F(CliCommandsTest, InspectUnknownFileFails) {
    write_file(tmp_.path / "notes.txt", "hello");
    InspectOptions options;
    options.path = (tmp_.path / "notes.txt").string();
    OutputCapture capture;
    EXPECT_EQ(commands::inspect(options), commands::kExitFailure);
    EXPECT_NE(capture.err().find("unsupported file format"), std::string::npos);
}

}  // namespace
}  // namespace cli
}  // namespace modelseal
