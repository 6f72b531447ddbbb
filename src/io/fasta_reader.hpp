#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "io/stream_handle.hpp"

namespace genotrack {

struct FastaRecord {
    std::string label; // definition line after '>', whitespace-trimmed
    std::string body;  // body lines concatenated, trailing whitespace stripped
};

// Lazy, forward-only reader of '>'-framed records.
//
//   FastaReader reader(*handle);
//   FastaRecord rec;
//   while (reader.read_next(rec)) { ... }
//
// Blank lines are ignored. Body lines before the first definition line
// raise MalformedInputError at the offending line. After end of stream has
// been reported once, further calls raise SequenceExhaustedError.
class FastaReader {
public:
    enum class Status { kRecord, kEndOfStream };

    struct Result {
        Status status = Status::kEndOfStream;
        FastaRecord record;

        bool has_record() const { return status == Status::kRecord; }
    };

    // in must outlive the reader.
    explicit FastaReader(StreamHandle& in);

    Result next();

    // Returns false at end of stream.
    bool read_next(FastaRecord& rec);

    size_t line_number() const { return line_no_; }
    size_t records_read() const { return records_read_; }

private:
    enum class State { kSeeking, kAccumulating, kExhausted };

    Result emit_pending();
    Result end_of_stream();

    StreamHandle* in_;
    State state_ = State::kSeeking;
    std::optional<std::string> pending_label_;
    std::string body_;
    bool end_reported_ = false;
    size_t line_no_ = 0;
    size_t records_read_ = 0;
};

// Read all records from path (.gz handled transparently, "-" for stdin).
// If require_records is set, an input with no records raises
// MalformedInputError.
std::vector<FastaRecord> read_fasta(const std::string& path,
                                    bool require_records = false);

// Read all remaining records from an open stream.
std::vector<FastaRecord> read_fasta_stream(StreamHandle& in);

} // namespace genotrack
