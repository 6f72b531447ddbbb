#include "io/line_filter.hpp"
#include "core/config.hpp"
#include "core/errors.hpp"

namespace genotrack {

bool is_comment_line(const std::string& line) {
    return !line.empty() && line[0] == COMMENT_CHAR;
}

CommentFilter::CommentFilter(StreamHandle& inner)
    : StreamHandle(inner.path()), inner_(&inner) {}

bool CommentFilter::read_line(std::string& line) {
    if (closed_) throw IOError("'" + path() + "' is closed");
    while (inner_->read_line(line)) {
        if (!is_comment_line(line)) return true;
        skipped_++;
    }
    return false;
}

} // namespace genotrack
