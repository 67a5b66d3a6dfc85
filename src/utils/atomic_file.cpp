#include "utils/atomic_file.h"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <fstream>
#include <sys/stat.h>
#include <unistd.h>
#include <vector>

#include "core/seal_error.h"

namespace fs = std::filesystem;

namespace modelseal {

namespace {
std::string errno_text() {
    return std::strerror(errno);
}
}  // namespace

void write_file_atomic(const fs::path& target, const std::string& content, fs::perms permissions) {
    const fs::path dir = target.has_parent_path() ? target.parent_path() : fs::path(".");
    std::string tmpl = (dir / ("." + target.filename().string() + ".tmp-XXXXXX")).string();
    std::vector<char> buf(tmpl.begin(), tmpl.end());
    buf.push_back('\0');

    int fd = ::mkstemp(buf.data());
    if (fd < 0) {
        throw SealError(ErrorCode::kIoError, "cannot create temporary file (" + errno_text() + ")", target);
    }
    const fs::path tmp_path(buf.data());

    auto abandon = [&](const std::string& message) {
        const std::string reason = message + " (" + errno_text() + ")";
        if (fd >= 0) ::close(fd);
        std::error_code ec;
        fs::remove(tmp_path, ec);
        throw SealError(ErrorCode::kIoError, reason, target);
    };

    if (::fchmod(fd, static_cast<mode_t>(permissions)) != 0) abandon("cannot set permissions");

    size_t written = 0;
    while (written < content.size()) {
        ssize_t n = ::write(fd, content.data() + written, content.size() - written);
        if (n < 0 && errno == EINTR) continue;
        if (n < 0) abandon("write failed");
        written += static_cast<size_t>(n);
    }
    if (::fsync(fd) != 0) abandon("fsync failed");
    if (::close(fd) != 0) {
        fd = -1;
        abandon("close failed");
    }
    fd = -1;

    if (::rename(tmp_path.c_str(), target.c_str()) != 0) abandon("rename failed");
}

std::string read_file_bytes(const fs::path& path, size_t max_size) {
    std::error_code ec;
    const auto size = fs::file_size(path, ec);
    if (ec) throw SealError(ErrorCode::kIoError, "cannot stat (" + ec.message() + ")", path);
    if (size > max_size) throw SealError(ErrorCode::kIoError, "file is too large", path);

    std::ifstream in(path, std::ios::binary);
    if (!in) throw SealError(ErrorCode::kIoError, "cannot open", path);
    std::string data(static_cast<size_t>(size), '\0');
    if (size > 0 && !in.read(data.data(), static_cast<std::streamsize>(size))) {
        throw SealError(ErrorCode::kIoError, "read failed", path);
    }
    return data;
}

}  // namespace modelseal
