#include "io/stream_handle.hpp"
#include "io/chunked_io.hpp"
#include "core/config.hpp"
#include "core/errors.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>

#include <zlib.h>

namespace genotrack {

namespace {

constexpr int LINE_CHUNK = 4096;

const char* mode_name(OpenMode mode) {
    switch (mode) {
    case OpenMode::kRead:   return "reading";
    case OpenMode::kWrite:  return "writing";
    case OpenMode::kAppend: return "appending";
    }
    return "?";
}

[[noreturn]] void throw_open_error(const std::string& path, OpenMode mode, int err) {
    if (mode == OpenMode::kRead && err == ENOENT) {
        throw NotFoundError("cannot open '" + path + "': no such file");
    }
    std::string msg = "cannot open '" + path + "' for " + mode_name(mode);
    if (err != 0) {
        msg += ": ";
        msg += std::strerror(err);
    }
    throw IOError(msg);
}

// Strip the '\n' that fgets/gzgets leave in the buffer. Returns true if
// the chunk completed a line.
bool append_chunk(std::string& line, const char* buf) {
    size_t len = std::strlen(buf);
    if (len > 0 && buf[len - 1] == '\n') {
        line.append(buf, len - 1);
        return true;
    }
    line.append(buf, len);
    return false;
}

class PlainStream : public StreamHandle {
public:
    PlainStream(const std::string& path, OpenMode mode)
        : StreamHandle(path), mode_(mode) {
        const char* fmode = "rb";
        if (mode == OpenMode::kWrite) fmode = "wb";
        else if (mode == OpenMode::kAppend) fmode = "ab";

        errno = 0;
        fp_ = std::fopen(path.c_str(), fmode);
        if (!fp_) throw_open_error(path, mode, errno);
    }

    ~PlainStream() override { release(); }

    bool read_line(std::string& line) override {
        require_readable();
        line.clear();
        char buf[LINE_CHUNK];
        bool got_any = false;
        while (std::fgets(buf, sizeof(buf), fp_)) {
            got_any = true;
            if (append_chunk(line, buf)) return true;
        }
        if (std::ferror(fp_)) {
            throw IOError("read error on '" + path() + "'");
        }
        return got_any;
    }

    size_t read(void* buf, size_t n) override {
        require_readable();
        size_t got = std::fread(buf, 1, n, fp_);
        if (got < n && std::ferror(fp_)) {
            throw IOError("read error on '" + path() + "'");
        }
        return got;
    }

    void write(const std::string& data) override {
        if (!fp_ || mode_ == OpenMode::kRead) {
            throw IOError("'" + path() + "' is not open for writing");
        }
        if (data.empty()) return;
        if (std::fwrite(data.data(), 1, data.size(), fp_) != data.size()) {
            throw IOError("write error on '" + path() + "'");
        }
    }

    void close() override {
        if (release() != 0) {
            throw IOError("close failed for '" + path() + "'");
        }
    }

    bool is_open() const override { return fp_ != nullptr; }

private:
    void require_readable() const {
        if (!fp_ || mode_ != OpenMode::kRead) {
            throw IOError("'" + path() + "' is not open for reading");
        }
    }

    int release() noexcept {
        if (!fp_) return 0;
        int rc = std::fclose(fp_);
        fp_ = nullptr;
        return rc;
    }

    FILE* fp_ = nullptr;
    OpenMode mode_;
};

class GzipStream : public StreamHandle {
public:
    GzipStream(const std::string& path, OpenMode mode)
        : StreamHandle(path), mode_(mode) {
        // "wb1": compression level 1, as for the track store's own filters
        std::string gzmode = "rb";
        if (mode == OpenMode::kWrite) {
            gzmode = "wb" + std::to_string(GZIP_WRITE_LEVEL);
        } else if (mode == OpenMode::kAppend) {
            gzmode = "ab" + std::to_string(GZIP_WRITE_LEVEL);
        }

        errno = 0;
        gz_ = gzopen(path.c_str(), gzmode.c_str());
        if (!gz_) throw_open_error(path, mode, errno);
    }

    ~GzipStream() override { release(); }

    bool read_line(std::string& line) override {
        require_readable();
        line.clear();
        char buf[LINE_CHUNK];
        bool got_any = false;
        while (gzgets(gz_, buf, sizeof(buf)) != nullptr) {
            got_any = true;
            if (append_chunk(line, buf)) return true;
        }
        check_error();
        return got_any;
    }

    size_t read(void* buf, size_t n) override {
        require_readable();
        auto* out = static_cast<char*>(buf);
        size_t total = for_each_chunk(n, GZ_MAX_CHUNK, [&](size_t off, size_t len) -> size_t {
            int got = gzread(gz_, out + off, static_cast<unsigned>(len));
            if (got < 0) check_error();
            return got > 0 ? static_cast<size_t>(got) : 0;
        });
        check_error();
        return total;
    }

    void write(const std::string& data) override {
        if (!gz_ || mode_ == OpenMode::kRead) {
            throw IOError("'" + path() + "' is not open for writing");
        }
        if (data.empty()) return;
        size_t wrote = for_each_chunk(data.size(), GZ_MAX_CHUNK, [&](size_t off, size_t len) -> size_t {
            int n = gzwrite(gz_, data.data() + off, static_cast<unsigned>(len));
            return n > 0 ? static_cast<size_t>(n) : 0;
        });
        if (wrote != data.size()) {
            check_error();
            throw IOError("write error on '" + path() + "'");
        }
    }

    void close() override {
        int rc = release();
        if (rc != Z_OK) {
            throw IOError("gzclose failed for '" + path() + "' (zlib error "
                          + std::to_string(rc) + ")");
        }
    }

    bool is_open() const override { return gz_ != nullptr; }

private:
    void require_readable() const {
        if (!gz_ || mode_ != OpenMode::kRead) {
            throw IOError("'" + path() + "' is not open for reading");
        }
    }

    void check_error() const {
        int errnum = Z_OK;
        const char* msg = gzerror(gz_, &errnum);
        if (errnum != Z_OK && errnum != Z_STREAM_END) {
            throw IOError("zlib error on '" + path() + "': " + msg);
        }
    }

    int release() noexcept {
        if (!gz_) return Z_OK;
        int rc = gzclose(gz_);
        gz_ = nullptr;
        return rc;
    }

    gzFile gz_ = nullptr;
    OpenMode mode_;
};

class IstreamHandle : public StreamHandle {
public:
    IstreamHandle(std::istream& in, const std::string& name)
        : StreamHandle(name), in_(&in) {}

    bool read_line(std::string& line) override {
        require_open();
        if (std::getline(*in_, line)) return true;
        if (in_->bad()) throw IOError("read error on '" + path() + "'");
        return false;
    }

    size_t read(void* buf, size_t n) override {
        require_open();
        in_->read(static_cast<char*>(buf), static_cast<std::streamsize>(n));
        if (in_->bad()) throw IOError("read error on '" + path() + "'");
        return static_cast<size_t>(in_->gcount());
    }

    void write(const std::string&) override {
        throw IOError("'" + path() + "' is read-only");
    }

    void close() override { in_ = nullptr; }

    bool is_open() const override { return in_ != nullptr; }

private:
    void require_open() const {
        if (!in_) throw IOError("'" + path() + "' is closed");
    }

    std::istream* in_;
};

} // namespace

bool has_gz_suffix(const std::string& path) {
    auto slash = path.rfind('/');
    size_t base = (slash == std::string::npos) ? 0 : slash + 1;
    auto dot = path.rfind(EXT_SEP);
    if (dot == std::string::npos || dot < base) return false;
    return path.compare(dot + 1, std::string::npos, EXT_GZ) == 0;
}

std::unique_ptr<StreamHandle> open_maybe_gzip(const std::string& path, OpenMode mode) {
    if (has_gz_suffix(path)) {
        return open_gzip(path, mode);
    }
    return open_plain(path, mode);
}

std::unique_ptr<StreamHandle> open_gzip(const std::string& path, OpenMode mode) {
    return std::make_unique<GzipStream>(path, mode);
}

std::unique_ptr<StreamHandle> open_plain(const std::string& path, OpenMode mode) {
    return std::make_unique<PlainStream>(path, mode);
}

std::unique_ptr<StreamHandle> make_istream_handle(std::istream& in, const std::string& name) {
    return std::make_unique<IstreamHandle>(in, name);
}

} // namespace genotrack
