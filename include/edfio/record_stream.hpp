#pragma once

#include "edfio/diagnostics.hpp"
#include "edfio/types.hpp"

#include <fstream>
#include <string>
#include <vector>

namespace edfio {

struct RecordStreamOptions {
  // Receives record-length repairs and prefiltering ambiguities.
  DiagnosticSink sink;
};

// Random-access reader for EDF/EDF+/BDF data records.
//
// - open() parses the header and derives the per-channel calibration
// - read_block() returns one data record in physical units
// - read_samples()/read_signal() stitch records into a per-channel timeline
// - files that were never finalized (record count "-1") get their record count
//   inferred from the file size
//
// Reads have no side effects on the file, so independent RecordStream objects
// may read the same file in parallel. A single RecordStream must be used by one
// thread at a time.
class RecordStream {
public:
  RecordStream() = default;
  explicit RecordStream(RecordStreamOptions opts);

  RecordStream(const RecordStream&) = delete;
  RecordStream& operator=(const RecordStream&) = delete;

  // Throws IOError if the file cannot be opened, MalformedHeaderError if the
  // header is invalid, SessionClosedError if this stream was opened before
  // (a closed stream cannot be reopened; use a new RecordStream).
  const Header& open(const std::string& path);

  void close();
  bool is_open() const { return open_; }

  // Any call other than close() on a closed stream throws SessionClosedError.
  // One data record, one vector per channel in header order.
  // Throws OutOfRangeError unless 0 <= index < n_records.
  Block read_block(long long index);

  // Samples begin..end (inclusive) of one channel, counted over the whole
  // recording. Throws OutOfRangeError for an invalid channel or range.
  std::vector<double> read_samples(int channel, long long begin, long long end);

  // The full timeline of one channel (empty if it stores no samples).
  std::vector<double> read_signal(int channel);

  const Header& header() const;
  const Calibration& calibration() const;

  std::vector<std::string> signal_labels() const;
  int n_signals() const;
  // n_samps[c] / record_length, in Hz.
  std::vector<double> signal_frequencies() const;
  // n_samps[c] * n_records.
  std::vector<long long> n_samples() const;

private:
  void require_open(const char* op) const;
  void read_channel_block(long long index, size_t channel, std::vector<double>* out);

  RecordStreamOptions opts_;
  bool open_{false};
  bool used_{false};
  std::string path_;
  std::ifstream f_;
  Header header_;
  Calibration calibration_;
  long long record_bytes_{0};
  std::vector<long long> channel_offsets_;  // byte offset of each channel inside a record
};

} // namespace edfio
