#include "output_file.h"
#include "errors.h"

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <system_error>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace {

DownloadError ioError(const std::string& what, const std::string& path, int err) {
    return DownloadError(ErrorKind::IOError,
                         what + " " + path + ": " + std::strerror(err));
}

int openForWrite(const std::string& path) {
    // Ensure the directory exists
    fs::path dir = fs::path(path).parent_path();
    if (!dir.empty()) {
        std::error_code ec;
        fs::create_directories(dir, ec);
        if (ec) {
            throw DownloadError(ErrorKind::IOError,
                                "cannot create directory " + dir.string() + ": " + ec.message());
        }
    }

    int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_CLOEXEC, 0644);
    if (fd < 0) {
        throw ioError("cannot open", path, errno);
    }
    return fd;
}

/// pwrite until everything is written.
size_t writeFully(int fd, const std::string& path, const char* data, size_t size, int64_t offset) {
    if (offset < 0) {
        throw DownloadError(ErrorKind::IOError,
                            "negative offset " + std::to_string(offset) + " for " + path);
    }

    size_t done = 0;
    while (done < size) {
        ssize_t n = ::pwrite(fd, data + done, size - done,
                             static_cast<off_t>(offset + static_cast<int64_t>(done)));
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            throw ioError("write failed at offset " + std::to_string(offset + done) + " in",
                          path, errno);
        }
        if (n == 0) {
            throw DownloadError(ErrorKind::IOError,
                                "write made no progress at offset "
                                + std::to_string(offset + done) + " in " + path);
        }
        done += static_cast<size_t>(n);
    }
    return done;
}

} // namespace

OutputFile::OutputFile(const std::string& path, int64_t total_length)
    : path_(path)
    , size_(total_length)
{
    if (total_length < 0) {
        throw DownloadError(ErrorKind::IOError,
                            "negative size " + std::to_string(total_length) + " for " + path);
    }

    fd_ = openForWrite(path_);
    if (::ftruncate(fd_, static_cast<off_t>(size_)) != 0) {
        int err = errno;
        ::close(fd_);
        fd_ = -1;
        throw ioError("cannot size", path_, err);
    }
}

OutputFile::~OutputFile()
{
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

size_t OutputFile::write(const char* data, size_t size, int64_t offset)
{
    if (offset + static_cast<int64_t>(size) > size_) {
        throw DownloadError(ErrorKind::IOError,
                            "write of " + std::to_string(size) + " bytes at "
                            + std::to_string(offset) + " exceeds " + path_
                            + " (" + std::to_string(size_) + " bytes)");
    }
    return writeFully(fd_, path_, data, size, offset);
}

void OutputFile::sync()
{
    if (::fsync(fd_) != 0) {
        throw ioError("fsync failed for", path_, errno);
    }
}

size_t OutputFile::writeAt(const std::string& path, const std::string& buffer, int64_t offset)
{
    int fd = openForWrite(path);
    size_t written = 0;
    try {
        written = writeFully(fd, path, buffer.data(), buffer.size(), offset);
    } catch (const DownloadError&) {
        ::close(fd);
        throw;
    }
    if (::close(fd) != 0) {
        throw ioError("close failed for", path, errno);
    }
    return written;
}
