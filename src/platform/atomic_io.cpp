#include "pkgstage/platform.hpp"

#include <atomic>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <random>
#include <sstream>

#include <fcntl.h>
#include <unistd.h>

namespace pkgstage {

namespace fs = std::filesystem;

namespace {

std::string errno_text() {
    return std::strerror(errno);
}

// Owns a file descriptor for the duration of one write
class FdGuard {
public:
    explicit FdGuard(int fd) : fd_(fd) {}
    ~FdGuard() { reset(); }

    FdGuard(const FdGuard&) = delete;
    FdGuard& operator=(const FdGuard&) = delete;

    int get() const { return fd_; }

    // Close now; false if close() reported an error
    bool reset() {
        if (fd_ < 0) return true;
        int rc = ::close(fd_);
        fd_ = -1;
        return rc == 0;
    }

private:
    int fd_;
};

bool write_all(int fd, const std::string& content) {
    const char* data = content.data();
    size_t remaining = content.size();
    while (remaining > 0) {
        ssize_t n = ::write(fd, data, remaining);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        data += n;
        remaining -= static_cast<size_t>(n);
    }
    return true;
}

// Persist a rename by syncing the directory that holds the entry
bool sync_directory(const std::string& dir, std::string& error) {
    FdGuard fd(::open(dir.empty() ? "." : dir.c_str(), O_RDONLY | O_DIRECTORY));
    if (fd.get() < 0) {
        error = "cannot open " + dir + ": " + errno_text();
        return false;
    }
    if (::fsync(fd.get()) != 0) {
        error = "cannot sync " + dir + ": " + errno_text();
        return false;
    }
    return true;
}

} // namespace

std::string make_temp_path(const std::string& base) {
    static std::atomic<unsigned> counter{0};
    static const unsigned seed = std::random_device{}();

    std::ostringstream ss;
    ss << base << ".tmp." << std::hex << ::getpid() << '.' << seed << '.' << counter++;
    return ss.str();
}

AtomicWriteResult atomic_write_file(const std::string& path, const std::string& content) {
    AtomicWriteResult result;
    std::string temp = make_temp_path(path);

    FdGuard fd(::open(temp.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0644));
    if (fd.get() < 0) {
        result.error = "cannot create " + temp + ": " + errno_text();
        return result;
    }

    bool staged = write_all(fd.get(), content) && ::fsync(fd.get()) == 0;
    std::string failure = staged ? "" : errno_text();
    if (!fd.reset() && staged) {
        staged = false;
        failure = errno_text();
    }
    if (!staged) {
        ::unlink(temp.c_str());
        result.error = "cannot write " + path + ": " + failure;
        return result;
    }

    if (std::rename(temp.c_str(), path.c_str()) != 0) {
        result.error = "cannot move " + temp + " to " + path + ": " + errno_text();
        ::unlink(temp.c_str());
        return result;
    }

    if (!sync_directory(get_parent_directory(path), result.error)) {
        return result;
    }

    result.ok = true;
    return result;
}

AtomicWriteResult replace_directory(const std::string& from, const std::string& to) {
    AtomicWriteResult result;
    std::error_code ec;

    if (fs::exists(to, ec)) {
        fs::remove_all(to, ec);
        if (ec) {
            result.error = "cannot remove previous " + to + ": " + ec.message();
            return result;
        }
    }

    fs::rename(from, to, ec);
    if (ec) {
        result.error = "cannot move " + from + " to " + to + ": " + ec.message();
        return result;
    }

    if (!sync_directory(get_parent_directory(to), result.error)) {
        return result;
    }

    result.ok = true;
    return result;
}

} // namespace pkgstage
