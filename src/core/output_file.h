#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

/// Destination file of a download job.
///
/// Opened (created if absent) and sized exactly once, then shared by every
/// block worker. write() uses pwrite(2) on the single descriptor, so workers
/// writing disjoint ranges need no locking. Closed by the destructor.
class OutputFile {
public:
    /// Open or create path and set its size to total_length.
    /// Missing parent directories are created.
    /// @throws DownloadError(IOError)
    OutputFile(const std::string& path, int64_t total_length);
    ~OutputFile();

    OutputFile(const OutputFile&) = delete;
    OutputFile& operator=(const OutputFile&) = delete;

    /// Place size bytes at offset. Returns size; short writes are continued.
    /// @throws DownloadError(IOError)
    size_t write(const char* data, size_t size, int64_t offset);

    /// Flush data to stable storage.
    /// @throws DownloadError(IOError)
    void sync();

    const std::string& path() const { return path_; }
    int64_t size() const { return size_; }

    /// Standalone positional write: create path if absent, never truncate,
    /// leave bytes outside [offset, offset + size) untouched.
    /// @throws DownloadError(IOError)
    static size_t writeAt(const std::string& path, const std::string& buffer, int64_t offset);

private:
    std::string path_;
    int64_t size_;
    int fd_ = -1;
};
