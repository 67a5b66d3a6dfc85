#include "signing/digest_engine.h"

#include <algorithm>
#include <atomic>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <exception>
#include <fcntl.h>
#include <mutex>
#include <sys/stat.h>
#include <thread>
#include <unistd.h>
#include <spdlog/spdlog.h>

#include "core/seal_error.h"

namespace fs = std::filesystem;

namespace modelseal {

namespace {

constexpr const char* ROOT_DOMAIN_TAG = "modelseal.root.v1";
constexpr size_t READ_CHUNK_SIZE = 1 << 20;

class FileHandle {
public:
    explicit FileHandle(int fd) : fd_(fd) {}
    ~FileHandle() {
        if (fd_ >= 0) ::close(fd_);
    }
    FileHandle(const FileHandle&) = delete;
    FileHandle& operator=(const FileHandle&) = delete;

    int get() const { return fd_; }

private:
    int fd_;
};

[[noreturn]] void hash_fail(const std::string& message, const fs::path& path) {
    throw SealError(ErrorCode::kPartialHashFailure, message, path);
}

void append_u64_le(std::vector<uint8_t>& out, uint64_t value) {
    for (int i = 0; i < 8; ++i) {
        out.push_back(static_cast<uint8_t>(value >> (8 * i)));
    }
}

// Bounded positional reads. A file that shrinks underneath us shows up as a
// short read.
void read_window(int fd, uint64_t offset, size_t length, Hasher& hasher, std::vector<uint8_t>& buffer,
                 const fs::path& path) {
    buffer.resize(std::min<size_t>(length, READ_CHUNK_SIZE));
    size_t done = 0;
    while (done < length) {
        const size_t want = std::min(buffer.size(), length - done);
        ssize_t n = ::pread(fd, buffer.data(), want, static_cast<off_t>(offset + done));
        if (n < 0 && errno == EINTR) continue;
        if (n < 0) hash_fail(std::string("read failed (") + std::strerror(errno) + ")", path);
        if (n == 0) hash_fail("file truncated while hashing", path);
        hasher.update(buffer.data(), static_cast<size_t>(n));
        done += static_cast<size_t>(n);
    }
}

}  // namespace

uint64_t DigestResult::total_bytes() const {
    uint64_t total = 0;
    for (const auto& f : files) total += f.size;
    return total;
}

DigestEngine::DigestEngine(DigestOptions options) : options_(options) {
    long page = ::sysconf(_SC_PAGESIZE);
    const size_t page_size = page > 0 ? static_cast<size_t>(page) : 4096;
    size_t window = std::max(options_.window_size, page_size);
    window_size_ = (window + page_size - 1) / page_size * page_size;
}

size_t DigestEngine::worker_count(size_t file_count) const {
    size_t workers = options_.workers;
    if (workers == 0) {
        workers = std::max<unsigned>(1, std::thread::hardware_concurrency());
    }
    return std::max<size_t>(1, std::min(workers, file_count));
}

FileDigest DigestEngine::hash_file(const fs::path& absolute_path, const std::string& relative_path) const {
    FileHandle file(::open(absolute_path.c_str(), O_RDONLY | O_CLOEXEC));
    if (file.get() < 0) {
        hash_fail(std::string("cannot open (") + std::strerror(errno) + ")", absolute_path);
    }

    struct stat st {};
    if (::fstat(file.get(), &st) != 0) {
        hash_fail(std::string("cannot stat (") + std::strerror(errno) + ")", absolute_path);
    }
    if (!S_ISREG(st.st_mode)) hash_fail("not a regular file", absolute_path);

    const uint64_t size = static_cast<uint64_t>(st.st_size);
    Hasher hasher(options_.algorithm);
    std::vector<uint8_t> buffer;

    for (uint64_t offset = 0; offset < size; offset += window_size_) {
        const size_t length = static_cast<size_t>(std::min<uint64_t>(window_size_, size - offset));
        read_window(file.get(), offset, length, hasher, buffer, absolute_path);
    }

    struct stat after {};
    if (::fstat(file.get(), &after) != 0 || after.st_size != st.st_size) {
        hash_fail("file changed while hashing", absolute_path);
    }

    FileDigest out;
    out.relative_path = relative_path;
    out.digest = hasher.finish();
    out.size = size;
    return out;
}

DigestResult DigestEngine::compute(const ArtifactFileSet& set) const {
    const auto started = std::chrono::steady_clock::now();

    DigestResult result;
    result.algorithm = options_.algorithm;
    // Each worker writes only to the slot of the index it claimed.
    result.files.resize(set.files.size());

    std::atomic<bool> ok{true};
    std::atomic<size_t> index{0};
    std::mutex error_mutex;
    std::exception_ptr first_error;

    auto worker = [&]() {
        while (true) {
            size_t idx = index.fetch_add(1);
            if (idx >= set.files.size() || !ok.load()) break;
            const auto& file = set.files[idx];
            try {
                result.files[idx] = hash_file(file.absolute_path, file.relative_path);
                spdlog::debug("Hashed {} ({} bytes)", file.relative_path, result.files[idx].size);
            } catch (const std::exception&) {
                std::lock_guard<std::mutex> lock(error_mutex);
                if (!first_error) first_error = std::current_exception();
                ok.store(false);
                break;
            }
        }
    };

    const size_t conc = worker_count(set.files.size());
    std::vector<std::thread> workers;
    workers.reserve(conc);
    for (size_t i = 0; i < conc; ++i) {
        workers.emplace_back(worker);
    }
    for (auto& th : workers) {
        if (th.joinable()) th.join();
    }

    if (first_error) {
        try {
            std::rethrow_exception(first_error);
        } catch (const SealError&) {
            throw;
        } catch (const std::exception& e) {
            throw SealError(ErrorCode::kPartialHashFailure, e.what());
        }
    }

    result.root = root_digest(options_.algorithm, result.files);

    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    spdlog::info("Hashed {} file(s), {} bytes with {} in {} ms ({} worker(s))", result.files.size(),
                 result.total_bytes(), to_string(options_.algorithm), elapsed.count(), conc);
    return result;
}

std::vector<uint8_t> DigestEngine::encode_sequence(const std::vector<FileDigest>& files) {
    std::vector<uint8_t> out(ROOT_DOMAIN_TAG, ROOT_DOMAIN_TAG + std::strlen(ROOT_DOMAIN_TAG));
    append_u64_le(out, files.size());
    for (const auto& f : files) {
        append_u64_le(out, f.relative_path.size());
        out.insert(out.end(), f.relative_path.begin(), f.relative_path.end());
        append_u64_le(out, f.size);
        append_u64_le(out, f.digest.size());
        out.insert(out.end(), f.digest.begin(), f.digest.end());
    }
    return out;
}

std::vector<uint8_t> DigestEngine::root_digest(HashAlgorithm algorithm, const std::vector<FileDigest>& files) {
    const auto encoded = encode_sequence(files);
    return hash_bytes(algorithm, encoded.data(), encoded.size());
}

}  // namespace modelseal
