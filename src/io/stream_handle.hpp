#pragma once

#include <cstddef>
#include <istream>
#include <memory>
#include <string>
#include <utility>

namespace genotrack {

enum class OpenMode { kRead, kWrite, kAppend };

// Scoped line/byte stream. The destructor releases the underlying file
// (and codec state) exactly once; close() may be called any number of times.
class StreamHandle {
public:
    virtual ~StreamHandle() = default;

    StreamHandle(const StreamHandle&) = delete;
    StreamHandle& operator=(const StreamHandle&) = delete;

    // Read one line without its trailing '\n'. Returns false at end of stream.
    virtual bool read_line(std::string& line) = 0;

    // Read up to n bytes. Returns bytes read; 0 at end of stream.
    virtual size_t read(void* buf, size_t n) = 0;

    virtual void write(const std::string& data) = 0;

    // Throws IOError if the final flush or close fails.
    virtual void close() = 0;

    virtual bool is_open() const = 0;

    const std::string& path() const { return path_; }

protected:
    explicit StreamHandle(std::string path) : path_(std::move(path)) {}

private:
    std::string path_;
};

// True if the final path component ends in ".gz" (case-sensitive).
bool has_gz_suffix(const std::string& path);

// Open path raw, or through zlib if it has the .gz suffix. The suffix alone
// decides; content is never inspected.
// Throws NotFoundError if a file opened for reading does not exist,
// IOError on any other open failure.
std::unique_ptr<StreamHandle> open_maybe_gzip(const std::string& path,
                                              OpenMode mode = OpenMode::kRead);

// Always open through zlib, regardless of suffix.
std::unique_ptr<StreamHandle> open_gzip(const std::string& path,
                                        OpenMode mode = OpenMode::kRead);

// Always open raw.
std::unique_ptr<StreamHandle> open_plain(const std::string& path,
                                         OpenMode mode = OpenMode::kRead);

// Read-only handle over an existing istream (not owned). name is used
// in error messages only.
std::unique_ptr<StreamHandle> make_istream_handle(std::istream& in,
                                                  const std::string& name = "-");

} // namespace genotrack
