#include "edfio/record_stream.hpp"

#include "edfio/calibration.hpp"
#include "edfio/errors.hpp"
#include "edfio/header_codec.hpp"
#include "edfio/sample_codec.hpp"

#include <filesystem>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

namespace edfio {

RecordStream::RecordStream(RecordStreamOptions opts) : opts_(std::move(opts)) {}

void RecordStream::require_open(const char* op) const {
  if (!open_) {
    throw SessionClosedError(std::string("RecordStream: ") + op + " on a stream that is not open");
  }
}

const Header& RecordStream::open(const std::string& path) {
  if (used_) {
    throw SessionClosedError("RecordStream: open() called twice; use a new RecordStream for " + path);
  }

  const std::filesystem::path p = std::filesystem::u8path(path);
  f_.open(p, std::ios::binary);
  if (!f_) throw IOError("RecordStream: failed to open: " + path);

  Header h;
  Calibration cal;
  try {
    std::error_code ec;
    const std::uintmax_t size = std::filesystem::file_size(p, ec);
    if (ec) throw IOError("RecordStream: cannot stat " + path + ": " + ec.message());

    HeaderParseOptions hopts;
    hopts.extension_hint = path;
    hopts.total_size = size;
    hopts.sink = opts_.sink;

    h = parse_header(f_, hopts);
    cal = derive_calibration(h.channels);
  } catch (const Error&) {
    f_.close();
    throw;
  }

  channel_offsets_.assign(h.channels.size(), 0);
  long long pos = 0;
  for (size_t c = 0; c < h.channels.size(); ++c) {
    channel_offsets_[c] = pos;
    pos += static_cast<long long>(h.channels.n_samps[c]) * h.file.data_size;
  }

  header_ = std::move(h);
  calibration_ = std::move(cal);
  record_bytes_ = record_bytes(header_);
  path_ = path;
  used_ = true;
  open_ = true;
  return header_;
}

void RecordStream::close() {
  if (f_.is_open()) f_.close();
  open_ = false;
  used_ = true;
}

void RecordStream::read_channel_block(long long index, size_t channel, std::vector<double>* out) {
  const int data_size = header_.file.data_size;
  const long long n = header_.channels.n_samps[channel];
  std::vector<unsigned char> buf(static_cast<size_t>(n * data_size));

  f_.clear();
  f_.seekg(static_cast<std::streamoff>(header_.file.data_offset + index * record_bytes_ +
                                       channel_offsets_[channel]),
           std::ios::beg);
  f_.read(reinterpret_cast<char*>(buf.data()), static_cast<std::streamsize>(buf.size()));
  if (static_cast<size_t>(f_.gcount()) != buf.size()) {
    throw IOError("RecordStream: unexpected end of file in record " + std::to_string(index) +
                  " of " + path_);
  }

  const ChannelCalibration& cal = calibration_[channel];
  out->reserve(out->size() + static_cast<size_t>(n));
  for (size_t i = 0; i < buf.size(); i += static_cast<size_t>(data_size)) {
    out->push_back(to_physical(decode_sample_le(&buf[i], data_size), cal));
  }
}

Block RecordStream::read_block(long long index) {
  require_open("read_block()");
  if (index < 0 || index >= header_.file.n_records) {
    throw OutOfRangeError("RecordStream: record " + std::to_string(index) + " outside [0, " +
                          std::to_string(header_.file.n_records) + ")");
  }

  const int data_size = header_.file.data_size;
  std::vector<unsigned char> buf(static_cast<size_t>(record_bytes_));
  f_.clear();
  f_.seekg(static_cast<std::streamoff>(header_.file.data_offset + index * record_bytes_), std::ios::beg);
  f_.read(reinterpret_cast<char*>(buf.data()), static_cast<std::streamsize>(buf.size()));
  if (static_cast<size_t>(f_.gcount()) != buf.size()) {
    throw IOError("RecordStream: unexpected end of file in record " + std::to_string(index) +
                  " of " + path_);
  }

  Block block(header_.channels.size());
  size_t pos = 0;
  for (size_t c = 0; c < block.size(); ++c) {
    const int n = header_.channels.n_samps[c];
    block[c].reserve(static_cast<size_t>(n));
    for (int i = 0; i < n; ++i) {
      block[c].push_back(to_physical(decode_sample_le(&buf[pos], data_size), calibration_[c]));
      pos += static_cast<size_t>(data_size);
    }
  }
  return block;
}

std::vector<double> RecordStream::read_samples(int channel, long long begin, long long end) {
  require_open("read_samples()");
  if (channel < 0 || channel >= header_.file.nchan) {
    throw OutOfRangeError("RecordStream: channel " + std::to_string(channel) + " outside [0, " +
                          std::to_string(header_.file.nchan) + ")");
  }
  const size_t ch = static_cast<size_t>(channel);
  const long long n = header_.channels.n_samps[ch];
  const long long total = n * header_.file.n_records;
  if (begin > end || begin < 0 || end >= total) {
    throw OutOfRangeError("RecordStream: sample range [" + std::to_string(begin) + ", " +
                          std::to_string(end) + "] invalid for channel " + std::to_string(channel) +
                          " with " + std::to_string(total) + " samples");
  }

  const long long begin_block = begin / n;
  const long long end_block = end / n;

  std::vector<double> data;
  for (long long b = begin_block; b <= end_block; ++b) {
    read_channel_block(b, ch, &data);
  }

  const long long first = begin - begin_block * n;
  const long long last = end - begin_block * n;
  return std::vector<double>(data.begin() + first, data.begin() + last + 1);
}

std::vector<double> RecordStream::read_signal(int channel) {
  require_open("read_signal()");
  if (channel < 0 || channel >= header_.file.nchan) {
    throw OutOfRangeError("RecordStream: channel " + std::to_string(channel) + " outside [0, " +
                          std::to_string(header_.file.nchan) + ")");
  }
  const long long total =
      static_cast<long long>(header_.channels.n_samps[static_cast<size_t>(channel)]) *
      header_.file.n_records;
  if (total <= 0) return {};
  return read_samples(channel, 0, total - 1);
}

const Header& RecordStream::header() const {
  require_open("header()");
  return header_;
}

const Calibration& RecordStream::calibration() const {
  require_open("calibration()");
  return calibration_;
}

std::vector<std::string> RecordStream::signal_labels() const {
  require_open("signal_labels()");
  return header_.channels.labels;
}

int RecordStream::n_signals() const {
  require_open("n_signals()");
  return header_.file.nchan;
}

std::vector<double> RecordStream::signal_frequencies() const {
  require_open("signal_frequencies()");
  std::vector<double> fs;
  fs.reserve(header_.channels.size());
  for (int n : header_.channels.n_samps) {
    fs.push_back(static_cast<double>(n) / header_.file.record_length);
  }
  return fs;
}

std::vector<long long> RecordStream::n_samples() const {
  require_open("n_samples()");
  std::vector<long long> out;
  out.reserve(header_.channels.size());
  for (int n : header_.channels.n_samps) {
    out.push_back(static_cast<long long>(n) * header_.file.n_records);
  }
  return out;
}

} // namespace edfio
