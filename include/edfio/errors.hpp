#pragma once

#include <stdexcept>
#include <string>

namespace edfio {

// Base class of every error thrown by the codec.
class Error : public std::runtime_error {
public:
  explicit Error(const std::string& what) : std::runtime_error(what) {}
};

// Unparseable or truncated header, or a header whose field sizes do not add up
// to the declared header byte count.
class MalformedHeaderError : public Error {
public:
  explicit MalformedHeaderError(const std::string& what) : Error(what) {}
};

// A block passed to RecordWriter does not match the header (channel count or
// samples per record), or a header is missing numeric channel fields.
class RecordShapeError : public Error {
public:
  explicit RecordShapeError(const std::string& what) : Error(what) {}
};

// Block, channel or sample index outside the recording.
class OutOfRangeError : public Error {
public:
  explicit OutOfRangeError(const std::string& what) : Error(what) {}
};

// Underlying storage failure (open, seek, read, write, rename).
class IOError : public Error {
public:
  explicit IOError(const std::string& what) : Error(what) {}
};

// Operation on a session that is closed or not in the required state.
class SessionClosedError : public Error {
public:
  explicit SessionClosedError(const std::string& what) : Error(what) {}
};

} // namespace edfio
