#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace edfio {

// Fixed byte layout of the EDF/BDF header.
inline constexpr int kFileHeaderBytes = 256;
inline constexpr int kChannelHeaderBytes = 256;
inline constexpr int kRecordCountOffset = 236;
inline constexpr int kRecordCountWidth = 8;
inline constexpr long long kUnknownRecordCount = -1;

// Global (256-byte) part of the header.
//
// Notes:
// - n_records == -1 means the file was never finalized. HeaderCodec replaces it
//   with a count inferred from the file size when the size is known.
// - data_offset is the byte position of the first data record; it always
//   equals the header size field (256 + 256 * nchan).
// - data_size is the number of bytes per stored sample: 2 for EDF/EDF+,
//   3 for BDF ("24BIT" / "bdf" subtype).
struct FileHeader {
  std::string version{"0"};
  std::string subject_id;
  std::string recording_id;

  int day{1};
  int month{1};
  int year{85};
  int hour{0};
  int minute{0};
  int second{0};

  std::string subtype;
  long long n_records{kUnknownRecordCount};
  double record_length{1.0};
  int nchan{0};

  int data_size{2};
  long long data_offset{0};

  // Parsed from the prefiltering strings ("HP:0.1Hz LP:70Hz").
  double highpass{0.0};
  std::optional<double> lowpass;
};

// Per-channel header fields, stored as parallel arrays of length nchan
// (the same field-major order used on disk).
struct ChannelHeader {
  std::vector<std::string> labels;
  std::vector<std::string> transducers;
  std::vector<std::string> units;
  std::vector<double> physical_min;
  std::vector<double> physical_max;
  std::vector<int> digital_min;
  std::vector<int> digital_max;
  std::vector<std::string> prefiltering;
  std::vector<int> n_samps;

  size_t size() const { return n_samps.size(); }
};

struct Header {
  FileHeader file;
  ChannelHeader channels;
};

// Linear digital <-> physical mapping of one channel.
//
// fallback is set when the declared ranges were empty or inverted and the
// identity mapping (scale 1, offset 0) was substituted.
struct ChannelCalibration {
  double scale{1.0};
  double offset{0.0};
  bool fallback{false};
};

using Calibration = std::vector<ChannelCalibration>;

// Physical-unit samples for one data record, one vector per channel.
using Block = std::vector<std::vector<double>>;

} // namespace edfio
