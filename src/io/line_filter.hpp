#pragma once

#include <string>

#include "io/stream_handle.hpp"

namespace genotrack {

// True if line starts with the '#' comment character.
bool is_comment_line(const std::string& line);

// Wraps another handle and drops '#' comment lines from read_line().
// Raw read() and write() pass through unfiltered. The wrapped handle is
// not owned; close() leaves it open.
class CommentFilter : public StreamHandle {
public:
    explicit CommentFilter(StreamHandle& inner);

    bool read_line(std::string& line) override;
    size_t read(void* buf, size_t n) override { return inner_->read(buf, n); }
    void write(const std::string& data) override { inner_->write(data); }
    void close() override { closed_ = true; }
    bool is_open() const override { return !closed_ && inner_->is_open(); }

    size_t skipped() const { return skipped_; }

private:
    StreamHandle* inner_;
    bool closed_ = false;
    size_t skipped_ = 0;
};

} // namespace genotrack
