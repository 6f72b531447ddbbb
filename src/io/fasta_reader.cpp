#include "io/fasta_reader.hpp"
#include "core/config.hpp"
#include "core/errors.hpp"

#include <cctype>
#include <iostream>
#include <utility>

namespace genotrack {

static void rstrip(std::string& s) {
    size_t end = s.size();
    while (end > 0 && std::isspace(static_cast<unsigned char>(s[end - 1])))
        end--;
    s.resize(end);
}

// Label is the definition line minus the sigil, trimmed on both sides.
static std::string extract_label(const std::string& line) {
    size_t start = 1;
    while (start < line.size() && std::isspace(static_cast<unsigned char>(line[start])))
        start++;
    return line.substr(start);
}

FastaReader::FastaReader(StreamHandle& in) : in_(&in) {}

FastaReader::Result FastaReader::next() {
    if (state_ == State::kExhausted) {
        if (end_reported_) {
            throw SequenceExhaustedError("record reader for '" + in_->path()
                                         + "' advanced past end of stream");
        }
        return end_of_stream();
    }

    std::string line;
    while (in_->read_line(line)) {
        line_no_++;
        rstrip(line);
        if (line.empty()) continue;

        if (line[0] == RECORD_SIGIL) {
            std::string label = extract_label(line);
            if (pending_label_) {
                Result res = emit_pending();
                pending_label_ = std::move(label);
                return res;
            }
            pending_label_ = std::move(label);
            state_ = State::kAccumulating;
            continue;
        }

        if (!pending_label_) {
            state_ = State::kExhausted;
            end_reported_ = true;
            throw MalformedInputError(in_->path() + ":" + std::to_string(line_no_)
                                      + ": sequence data before first '>' definition line");
        }
        body_ += line;
    }

    state_ = State::kExhausted;
    if (pending_label_) {
        return emit_pending();
    }
    return end_of_stream();
}

bool FastaReader::read_next(FastaRecord& rec) {
    Result res = next();
    if (!res.has_record()) return false;
    rec = std::move(res.record);
    return true;
}

FastaReader::Result FastaReader::emit_pending() {
    Result res;
    res.status = Status::kRecord;
    res.record.label = std::move(*pending_label_);
    res.record.body = std::move(body_);
    pending_label_.reset();
    body_.clear();
    records_read_++;
    return res;
}

FastaReader::Result FastaReader::end_of_stream() {
    end_reported_ = true;
    return Result{};
}

std::vector<FastaRecord> read_fasta_stream(StreamHandle& in) {
    std::vector<FastaRecord> records;
    FastaReader reader(in);
    FastaRecord rec;
    while (reader.read_next(rec)) {
        records.push_back(std::move(rec));
    }
    return records;
}

std::vector<FastaRecord> read_fasta(const std::string& path, bool require_records) {
    std::vector<FastaRecord> records;
    if (path == "-") {
        auto in = make_istream_handle(std::cin, "<stdin>");
        records = read_fasta_stream(*in);
    } else {
        auto in = open_maybe_gzip(path, OpenMode::kRead);
        records = read_fasta_stream(*in);
        in->close();
    }

    if (require_records && records.empty()) {
        throw MalformedInputError("no '>' records found in '" + path + "'");
    }
    return records;
}

} // namespace genotrack
