#pragma once

#include "edfio/diagnostics.hpp"
#include "edfio/types.hpp"

#include <fstream>
#include <string>

namespace edfio {

// How close() replaces the "-1" record count written with the header.
enum class FinalizeStrategy {
  // Seek to byte 236 and overwrite the 8-byte field.
  kPatchInPlace = 0,
  // Copy the file into a temporary sibling with the true count and rename it
  // over the original. Produces the same bytes as kPatchInPlace.
  kRewriteAtomic,
};

struct RecordWriterOptions {
  FinalizeStrategy finalize{FinalizeStrategy::kPatchInPlace};

  // Receives out-of-range warnings (empty => "Warning: ..." on stderr).
  DiagnosticSink sink;
};

// Append-only EDF/BDF writer.
//
// Usage:
//   RecordWriter w;
//   w.open("out.edf");
//   w.write_header(header);
//   w.append_block(block);   // once per data record
//   w.close();               // patches the record count
//
// Lifecycle: kUnopened -> kOpen -> kHeaderWritten -> kClosed. A call that is not
// legal in the current state throws SessionClosedError. If the writer is
// destroyed without close(), the file keeps the "-1" record count so readers
// can tell it was never finalized.
//
// Samples are stored as 16-bit (EDF) or 24-bit (BDF) little-endian integers:
//   digital = round((physical - offset) / scale)
// Values outside [physical_min, physical_max] are reported to the sink and
// written anyway. They are not clipped; a value beyond the sample width wraps.
//
// A RecordWriter must be used by one thread at a time.
class RecordWriter {
public:
  enum class State {
    kUnopened = 0,
    kOpen,
    kHeaderWritten,
    kClosed,
  };

  RecordWriter() = default;
  explicit RecordWriter(RecordWriterOptions opts);

  RecordWriter(const RecordWriter&) = delete;
  RecordWriter& operator=(const RecordWriter&) = delete;

  // Create or truncate path. Throws IOError if it cannot be created.
  void open(const std::string& path);

  // Serialize the header (filling defaults), write it and derive the
  // calibration. Allowed once, after open().
  //
  // An empty subtype becomes "bdf" for a .bdf path and "edf" otherwise.
  // Throws RecordShapeError for subtype "edf" on a .bdf path, since the blank
  // reserved field would be read back as 24-bit.
  void write_header(const Header& header);

  // Append one data record. block must hold nchan entries with n_samps[c]
  // physical values each; otherwise RecordShapeError and nothing is written.
  void append_block(const Block& block);

  // Write the final record count and end the session.
  void close();

  State state() const { return state_; }
  long long record_count() const { return n_records_; }

  // Header as written (defaults filled, data_offset/data_size derived).
  const Header& header() const;
  const Calibration& calibration() const;

private:
  void require_state(State wanted, const char* op) const;
  void patch_in_place();
  void rewrite_atomic();

  RecordWriterOptions opts_;
  State state_{State::kUnopened};
  std::string path_;
  std::fstream f_;
  Header header_;
  Calibration calibration_;
  long long n_records_{0};
};

const char* writer_state_name(RecordWriter::State s);

// Rename tmp_path over target_path (same directory). If the rename is refused
// because the target exists, the target is removed and the rename retried.
// Throws IOError on failure: tmp_path is deleted if target_path is still
// intact, and kept (and named in the message) if it is not.
void replace_file_from_temp(const std::string& tmp_path, const std::string& target_path);

} // namespace edfio
