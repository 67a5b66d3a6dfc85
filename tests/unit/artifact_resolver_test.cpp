#include <gtest/gtest.h>

#include <unistd.h>

#include "core/seal_error.h"
#include "model/adapter_registry.h"
#include "signing/artifact_resolver.h"
#include "test_helpers.h"
#include "utils/config.h"

using namespace modelseal;
using namespace modelseal::test;

namespace {

class ArtifactResolverTest : public ::testing::Test {
protected:
    ArtifactResolverTest() : registry_(AdapterRegistry::with_defaults(SealConfig{})), resolver_(&registry_) {}

    ErrorCode resolve_error(const fs::path& path, const ResolveOptions& options = {}) {
        try {
            resolver_.resolve(path, options);
        } catch (const SealError& e) {
            return e.code();
        }
        ADD_FAILURE() << "resolve did not throw for " << path;
        return ErrorCode::kInvalidArgument;
    }

    void write_index(const fs::path& path, const std::vector<std::string>& shards) {
        nlohmann::json map = nlohmann::json::object();
        for (size_t i = 0; i < shards.size(); ++i) map["t" + std::to_string(i)] = shards[i];
        write_file(path, nlohmann::json{{"weight_map", map}}.dump());
    }

    TempDir dir_;
    AdapterRegistry registry_;
    ArtifactResolver resolver_;
};

}  // namespace

TEST_F(ArtifactResolverTest, SingleFileIsItsOwnArtifact) {
    write_file(dir_.path / "model.gguf", "data");
    const auto set = resolver_.resolve(dir_.path / "model.gguf");
    ASSERT_EQ(set.files.size(), 1u);
    EXPECT_EQ(set.files[0].relative_path, "model.gguf");
    EXPECT_EQ(set.root, dir_.path);
}

TEST_F(ArtifactResolverTest, UnknownFormatFileIsSignedAlone) {
    write_file(dir_.path / "notes.txt", "hello");
    write_file(dir_.path / "other.txt", "ignored");
    const auto set = resolver_.resolve(dir_.path / "notes.txt");
    ASSERT_EQ(set.files.size(), 1u);
    EXPECT_EQ(set.files[0].relative_path, "notes.txt");
}

TEST_F(ArtifactResolverTest, DirectoryWalkIsRecursiveAndSorted) {
    write_file(dir_.path / "b.bin", "b");
    write_file(dir_.path / "a.bin", "a");
    write_file(dir_.path / "sub" / "z.bin", "z");
    write_file(dir_.path / "sub" / "deeper" / "c.bin", "c");
    write_file(dir_.path / "B.bin", "B");

    const auto set = resolver_.resolve(dir_.path);
    const std::vector<std::string> expected = {"B.bin", "a.bin", "b.bin", "sub/deeper/c.bin", "sub/z.bin"};
    EXPECT_EQ(set.relative_paths(), expected);
    for (const auto& f : set.files) {
        EXPECT_TRUE(f.absolute_path.is_absolute());
        EXPECT_TRUE(fs::exists(f.absolute_path));
    }
}

TEST_F(ArtifactResolverTest, ResolutionIsIdempotent) {
    for (int i = 9; i >= 0; --i) write_file(dir_.path / ("f" + std::to_string(i)), std::to_string(i));
    const auto first = resolver_.resolve(dir_.path);
    const auto second = resolver_.resolve(dir_.path.string() + "/");
    EXPECT_EQ(first.relative_paths(), second.relative_paths());
    EXPECT_EQ(first.root, second.root);
}

TEST_F(ArtifactResolverTest, DirectoryWalkSkipsSignatureFiles) {
    write_file(dir_.path / "model.safetensors", small_safetensors());
    write_file(dir_.path / "model.safetensors.signature", "{}");
    write_file(dir_.path / "sub" / "old.signature", "{}");

    const auto set = resolver_.resolve(dir_.path);
    EXPECT_EQ(set.relative_paths(), std::vector<std::string>{"model.safetensors"});
}

TEST_F(ArtifactResolverTest, ExplicitExclusionsAreSkipped) {
    write_file(dir_.path / "a.bin", "a");
    write_file(dir_.path / "custom.sig", "{}");

    ResolveOptions options;
    options.excluded.push_back(dir_.path / "custom.sig");
    const auto set = resolver_.resolve(dir_.path, options);
    EXPECT_EQ(set.relative_paths(), std::vector<std::string>{"a.bin"});
}

TEST_F(ArtifactResolverTest, IndexIncludesReferencedShards) {
    write_file(dir_.path / "model-00001.safetensors", "one");
    write_file(dir_.path / "model-00002.safetensors", "two");
    write_file(dir_.path / "unrelated.bin", "x");
    write_index(dir_.path / "model.safetensors.index.json",
                {"model-00002.safetensors", "model-00001.safetensors", "model-00002.safetensors"});

    const auto set = resolver_.resolve(dir_.path / "model.safetensors.index.json");
    const std::vector<std::string> expected = {"model-00001.safetensors", "model-00002.safetensors",
                                               "model.safetensors.index.json"};
    EXPECT_EQ(set.relative_paths(), expected);
}

TEST_F(ArtifactResolverTest, MissingShardIsMissingReference) {
    write_file(dir_.path / "model-00001.safetensors", "one");
    write_index(dir_.path / "model.safetensors.index.json", {"model-00001.safetensors", "model-00002.safetensors"});
    EXPECT_EQ(resolve_error(dir_.path / "model.safetensors.index.json"), ErrorCode::kMissingReference);
}

TEST_F(ArtifactResolverTest, LenientModeRecordsMissingShards) {
    write_file(dir_.path / "model-00001.safetensors", "one");
    write_index(dir_.path / "model.safetensors.index.json", {"model-00001.safetensors", "model-00002.safetensors"});

    ResolveOptions options;
    options.mode = ResolveMode::kLenient;
    const auto set = resolver_.resolve(dir_.path / "model.safetensors.index.json", options);
    EXPECT_EQ(set.files.size(), 2u);
    EXPECT_EQ(set.missing, std::vector<std::string>{"model-00002.safetensors"});
}

TEST_F(ArtifactResolverTest, IndexReferencesCannotEscapeTheDirectory) {
    write_file(dir_.path / "outside.safetensors", "x");
    write_index(dir_.path / "inner" / "model.safetensors.index.json", {"../outside.safetensors"});
    EXPECT_EQ(resolve_error(dir_.path / "inner" / "model.safetensors.index.json"),
              ErrorCode::kUnresolvableArtifact);

    write_index(dir_.path / "abs.safetensors.index.json", {(dir_.path / "outside.safetensors").string()});
    EXPECT_EQ(resolve_error(dir_.path / "abs.safetensors.index.json"), ErrorCode::kUnresolvableArtifact);
}

TEST_F(ArtifactResolverTest, IndexReferenceToSignatureFileFailsResolution) {
    write_file(dir_.path / "shard.safetensors", "one");
    write_file(dir_.path / "shard.signature", "{}");
    write_index(dir_.path / "model.safetensors.index.json", {"shard.safetensors", "shard.signature"});
    EXPECT_EQ(resolve_error(dir_.path / "model.safetensors.index.json"), ErrorCode::kUnresolvableArtifact);

    ResolveOptions options;
    options.excluded.push_back(dir_.path / "custom.sig");
    write_file(dir_.path / "custom.sig", "{}");
    write_index(dir_.path / "model.safetensors.index.json", {"shard.safetensors", "custom.sig"});
    EXPECT_EQ(resolve_error(dir_.path / "model.safetensors.index.json", options), ErrorCode::kUnresolvableArtifact);
}

TEST_F(ArtifactResolverTest, IndexListingOrderDoesNotChangeResolution) {
    const std::vector<std::string> shards = {"model-00001.safetensors", "model-00002.safetensors",
                                             "model-00003.safetensors"};
    for (const auto& s : shards) write_file(dir_.path / s, s);
    const fs::path index = dir_.path / "model.safetensors.index.json";

    write_index(index, shards);
    const auto forward = resolver_.resolve(index);
    write_index(index, std::vector<std::string>(shards.rbegin(), shards.rend()));
    const auto reversed = resolver_.resolve(index);

    EXPECT_EQ(forward.relative_paths(), reversed.relative_paths());
    EXPECT_EQ(forward.relative_paths().front(), "model-00001.safetensors");
}

TEST_F(ArtifactResolverTest, NonUtf8FileNameFailsResolution) {
    write_file(dir_.path / "model" / "a.bin", "a");
    write_file(dir_.path / "model" / "b\xff.bin", "b");
    EXPECT_EQ(resolve_error(dir_.path / "model"), ErrorCode::kUnresolvableArtifact);
}

TEST_F(ArtifactResolverTest, Utf8FileNamesAreKept) {
    write_file(dir_.path / "model" / "gewichte-\xc3\xbc.bin", "a");
    const auto set = resolver_.resolve(dir_.path / "model");
    EXPECT_EQ(set.relative_paths(), std::vector<std::string>{"gewichte-\xc3\xbc.bin"});
}

TEST_F(ArtifactResolverTest, SymlinkCycleFailsResolution) {
    write_file(dir_.path / "model" / "a.bin", "a");
    fs::create_directory_symlink(dir_.path / "model", dir_.path / "model" / "loop");
    EXPECT_EQ(resolve_error(dir_.path / "model"), ErrorCode::kUnresolvableArtifact);
}

TEST_F(ArtifactResolverTest, BrokenSymlinkFailsResolution) {
    write_file(dir_.path / "model" / "a.bin", "a");
    fs::create_symlink(dir_.path / "missing.bin", dir_.path / "model" / "dangling.bin");
    EXPECT_EQ(resolve_error(dir_.path / "model"), ErrorCode::kUnresolvableArtifact);
}

TEST_F(ArtifactResolverTest, SymlinkedFilesAreFollowed) {
    write_file(dir_.path / "store" / "blob", "content");
    write_file(dir_.path / "model" / "a.bin", "a");
    fs::create_symlink(dir_.path / "store" / "blob", dir_.path / "model" / "linked.bin");

    const auto set = resolver_.resolve(dir_.path / "model");
    const std::vector<std::string> expected = {"a.bin", "linked.bin"};
    EXPECT_EQ(set.relative_paths(), expected);
}

TEST_F(ArtifactResolverTest, UnreadableFileFailsResolution) {
    if (geteuid() == 0) GTEST_SKIP() << "permission checks do not apply to root";
    write_file(dir_.path / "model" / "a.bin", "a");
    write_file(dir_.path / "model" / "secret.bin", "s");
    fs::permissions(dir_.path / "model" / "secret.bin", fs::perms::none);
    EXPECT_EQ(resolve_error(dir_.path / "model"), ErrorCode::kUnresolvableArtifact);
}

TEST_F(ArtifactResolverTest, NonexistentPathDependsOnMode) {
    EXPECT_EQ(resolve_error(dir_.path / "nope"), ErrorCode::kUnresolvableArtifact);

    ResolveOptions options;
    options.mode = ResolveMode::kLenient;
    const auto set = resolver_.resolve(dir_.path / "nope", options);
    EXPECT_TRUE(set.files.empty());
}

TEST_F(ArtifactResolverTest, SignatureFileIsNotAnArtifact) {
    write_file(dir_.path / "model.signature", "{}");
    EXPECT_EQ(resolve_error(dir_.path / "model.signature"), ErrorCode::kUnresolvableArtifact);
}

TEST_F(ArtifactResolverTest, EmptyDirectoryResolvesToNoFiles) {
    fs::create_directories(dir_.path / "empty");
    EXPECT_TRUE(resolver_.resolve(dir_.path / "empty").files.empty());
}
