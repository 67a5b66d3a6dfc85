#include "model/isolated_adapter.h"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "core/seal_error.h"
#include "utils/config.h"

extern char** environ;

namespace fs = std::filesystem;

namespace modelseal {

namespace {
constexpr size_t MAX_SANDBOX_OUTPUT = 256 * 1024 * 1024;
constexpr const char* SANDBOX_MOUNT_DIR = "/model";

std::string to_lower_ascii(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

bool ends_with(const std::string& value, const std::string& suffix) {
    if (value.size() < suffix.size()) return false;
    return value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}
}  // namespace

SandboxSettings SandboxSettings::from_config(const SealConfig& config) {
    SandboxSettings settings;
    settings.runtime = config.sandbox_runtime;
    settings.image = config.sandbox_image;
    return settings;
}

int run_process(const std::vector<std::string>& args, std::string& output) {
    if (args.empty()) {
        return -1;
    }

    std::vector<char*> argv;
    argv.reserve(args.size() + 1);
    for (const auto& a : args) {
        argv.push_back(const_cast<char*>(a.c_str()));
    }
    argv.push_back(nullptr);

    int fds[2];
    if (pipe(fds) != 0) {
        return -1;
    }

    posix_spawn_file_actions_t actions;
    posix_spawn_file_actions_init(&actions);
    posix_spawn_file_actions_addclose(&actions, fds[0]);
    posix_spawn_file_actions_adddup2(&actions, fds[1], STDOUT_FILENO);
    posix_spawn_file_actions_addclose(&actions, fds[1]);

    pid_t pid;
    int spawn_result = posix_spawnp(&pid, argv[0], &actions, nullptr, argv.data(), environ);
    posix_spawn_file_actions_destroy(&actions);
    close(fds[1]);
    if (spawn_result != 0) {
        close(fds[0]);
        return -1;
    }

    output.clear();
    char buf[8192];
    bool overflow = false;
    while (true) {
        ssize_t n = read(fds[0], buf, sizeof(buf));
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) break;
        if (output.size() + static_cast<size_t>(n) > MAX_SANDBOX_OUTPUT) {
            overflow = true;
            continue;  // keep draining so the child does not block
        }
        output.append(buf, static_cast<size_t>(n));
    }
    close(fds[0]);

    int status = 0;
    if (waitpid(pid, &status, 0) == -1) {
        return -1;
    }
    if (overflow) {
        output.clear();
        return -1;
    }
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

IsolatedPyTorchAdapter::IsolatedPyTorchAdapter(SandboxSettings settings, ProcessRunner runner)
    : settings_(std::move(settings)), runner_(std::move(runner)) {}

bool IsolatedPyTorchAdapter::accepts(const fs::path& path, Scope scope) const {
    (void)scope;
    const std::string ext = to_lower_ascii(path.extension().string());
    const std::string file_name = to_lower_ascii(path.filename().string());
    return ext == ".pt" || ext == ".pth" ||
           // cases like diffusion_pytorch_model.fp16.bin
           (file_name.find("pytorch_model") != std::string::npos && ends_with(file_name, ".bin"));
}

std::vector<std::string> IsolatedPyTorchAdapter::sandbox_command(const fs::path& absolute_path) const {
    const std::string target = std::string(SANDBOX_MOUNT_DIR) + "/" + absolute_path.filename().string();
    return {
        settings_.runtime,
        "run",
        "--rm",
        "--network=none",
        "--read-only",
        "--security-opt=no-new-privileges",
        "-v",
        absolute_path.string() + ":" + target + ":ro",
        settings_.image,
        target,
    };
}

CanonicalModel IsolatedPyTorchAdapter::decode(const fs::path& path) const {
    std::error_code ec;
    const fs::path absolute = fs::canonical(path, ec);
    if (ec) throw SealError(ErrorCode::kDecodeError, "cannot resolve model path (" + ec.message() + ")", path);
    if (absolute.string().find(':') != std::string::npos) {
        throw SealError(ErrorCode::kDecodeError, "path cannot be mounted into the sandbox", path);
    }
    const uint64_t file_size = fs::file_size(absolute, ec);
    if (ec) throw SealError(ErrorCode::kDecodeError, "failed to stat (" + ec.message() + ")", path);

    const auto command = sandbox_command(absolute);
    spdlog::info("Inspecting {} in sandbox image {}", absolute.string(), settings_.image);

    std::string output;
    const int rc = runner_(command, output);
    if (rc != 0) {
        throw SealError(ErrorCode::kDecodeError,
                        "sandboxed inspector failed with status " + std::to_string(rc), path);
    }

    nlohmann::json j;
    try {
        j = nlohmann::json::parse(output);
    } catch (const nlohmann::json::exception& e) {
        throw SealError(ErrorCode::kDecodeError,
                        std::string("sandboxed inspector returned invalid JSON (") + e.what() + ")", path);
    }

    CanonicalModel model = canonical_model_from_json(j);
    if (model.format != ModelFormat::PyTorch) {
        throw SealError(ErrorCode::kDecodeError,
                        std::string("sandboxed inspector reported format ") + to_string(model.format), path);
    }
    // Local facts win over what the sandbox reports.
    model.file_path = path;
    model.file_size = file_size;
    model.backing_files.clear();
    model.validate();
    return model;
}

}  // namespace modelseal
