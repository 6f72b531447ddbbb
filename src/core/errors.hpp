#pragma once

#include <stdexcept>
#include <string>

namespace genotrack {

// Base of every error raised by genotrack. Nothing below is recovered
// internally; callers decide whether to report and exit.
class Error : public std::runtime_error {
public:
    explicit Error(const std::string& msg) : std::runtime_error(msg) {}
};

// File or stream could not be opened, read, written or closed.
class IOError : public Error {
public:
    explicit IOError(const std::string& msg) : Error(msg) {}
};

// Path did not exist at open time.
class NotFoundError : public IOError {
public:
    explicit NotFoundError(const std::string& msg) : IOError(msg) {}
};

// Record framing violated (body before first '>'), or no records where
// at least one was required.
class MalformedInputError : public Error {
public:
    explicit MalformedInputError(const std::string& msg) : Error(msg) {}
};

class InvalidArgumentError : public Error {
public:
    explicit InvalidArgumentError(const std::string& msg) : Error(msg) {}
};

// Observation count or extrema shape disagrees with the accumulation session.
class InconsistentShapeError : public Error {
public:
    explicit InconsistentShapeError(const std::string& msg) : Error(msg) {}
};

// A record reader was advanced after it already reported end of stream.
class SequenceExhaustedError : public Error {
public:
    explicit SequenceExhaustedError(const std::string& msg) : Error(msg) {}
};

} // namespace genotrack
