#include "edfio/record_writer.hpp"

#include "edfio/calibration.hpp"
#include "edfio/errors.hpp"
#include "edfio/header_codec.hpp"
#include "edfio/sample_codec.hpp"
#include "edfio/utils.hpp"

#include <algorithm>
#include <filesystem>
#include <sstream>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

namespace edfio {

namespace {

std::filesystem::path make_tmp_path_same_dir(const std::filesystem::path& target) {
  const std::filesystem::path dir = target.has_parent_path() ? target.parent_path()
                                                             : std::filesystem::path();
  const std::string name = target.filename().u8string() + ".edfio-tmp";
  return dir.empty() ? std::filesystem::u8path(name) : (dir / std::filesystem::u8path(name));
}

void copy_bytes(std::istream& in, std::ostream& out, long long n, std::vector<char>* buf) {
  while (n > 0) {
    const long long chunk = std::min<long long>(n, static_cast<long long>(buf->size()));
    in.read(buf->data(), static_cast<std::streamsize>(chunk));
    if (in.gcount() != chunk) {
      throw IOError("RecordWriter: unexpected end of file while rewriting");
    }
    out.write(buf->data(), static_cast<std::streamsize>(chunk));
    if (!out) throw IOError("RecordWriter: failed writing temporary file");
    n -= chunk;
  }
}

std::string format_value(double v) {
  std::ostringstream oss;
  oss << v;
  return oss.str();
}

} // namespace

const char* writer_state_name(RecordWriter::State s) {
  switch (s) {
    case RecordWriter::State::kUnopened: return "unopened";
    case RecordWriter::State::kOpen: return "open";
    case RecordWriter::State::kHeaderWritten: return "header-written";
    case RecordWriter::State::kClosed: return "closed";
  }
  return "unknown";
}

void replace_file_from_temp(const std::string& tmp_path, const std::string& target_path) {
  const std::filesystem::path tmp = std::filesystem::u8path(tmp_path);
  const std::filesystem::path target = std::filesystem::u8path(target_path);

  std::error_code ec;
  std::filesystem::rename(tmp, target, ec);
  if (!ec) return;

  // Some platforms refuse to rename over an existing file.
  std::error_code rm_ec;
  std::filesystem::remove(target, rm_ec);
  std::error_code ex_ec;
  if (rm_ec || std::filesystem::exists(target, ex_ec)) {
    // The target is untouched; drop the temporary copy.
    std::filesystem::remove(tmp, rm_ec);
    throw IOError("RecordWriter: failed to replace " + target_path + ": " + ec.message());
  }

  ec.clear();
  std::filesystem::rename(tmp, target, ec);
  if (ec) {
    // The target is gone, so the temporary file is the only copy left.
    throw IOError("RecordWriter: failed to replace " + target_path + ": " + ec.message() +
                  "; the data was left in " + tmp_path);
  }
}

RecordWriter::RecordWriter(RecordWriterOptions opts) : opts_(std::move(opts)) {}

void RecordWriter::require_state(State wanted, const char* op) const {
  if (state_ != wanted) {
    throw SessionClosedError(std::string("RecordWriter: ") + op + " is not allowed in state '" +
                             writer_state_name(state_) + "' (requires '" + writer_state_name(wanted) + "')");
  }
}

void RecordWriter::open(const std::string& path) {
  require_state(State::kUnopened, "open()");

  f_.open(std::filesystem::u8path(path),
          std::ios::in | std::ios::out | std::ios::trunc | std::ios::binary);
  if (!f_) throw IOError("RecordWriter: failed to open for writing: " + path);

  path_ = path;
  state_ = State::kOpen;
}

void RecordWriter::write_header(const Header& header) {
  require_state(State::kOpen, "write_header()");

  Header h = header;
  const std::string ext = file_extension_lower(path_);
  if (h.file.subtype.empty()) {
    h.file.subtype = (ext == "bdf") ? "bdf" : "edf";
  }
  std::string bytes;
  Calibration cal;
  try {
    // Plain EDF leaves the reserved field blank, and readers take a blank
    // field in a .bdf file to mean 24-bit samples.
    if (ext == "bdf" && to_lower(h.file.subtype) == "edf") {
      throw RecordShapeError("RecordWriter: subtype 'edf' cannot be written to a .bdf path: " + path_);
    }
    bytes = serialize_header(&h);
    cal = derive_calibration(h.channels);
  } catch (const Error&) {
    f_.close();
    state_ = State::kClosed;
    throw;
  }

  f_.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
  f_.flush();
  if (!f_) {
    f_.close();
    state_ = State::kClosed;
    throw IOError("RecordWriter: failed writing header to " + path_);
  }

  header_ = std::move(h);
  calibration_ = std::move(cal);
  n_records_ = 0;
  state_ = State::kHeaderWritten;
}

void RecordWriter::append_block(const Block& block) {
  require_state(State::kHeaderWritten, "append_block()");

  const ChannelHeader& ch = header_.channels;
  const size_t nchan = static_cast<size_t>(header_.file.nchan);
  const int data_size = header_.file.data_size;

  // Validate the whole block before touching the file.
  std::string shape_error;
  if (block.size() != nchan) {
    shape_error = "block has " + std::to_string(block.size()) + " channels, header declares " +
                  std::to_string(nchan);
  } else {
    for (size_t c = 0; c < nchan; ++c) {
      if (block[c].size() != static_cast<size_t>(ch.n_samps[c])) {
        shape_error = "channel " + std::to_string(c) + " ('" + ch.labels[c] + "') has " +
                      std::to_string(block[c].size()) + " samples, expected " +
                      std::to_string(ch.n_samps[c]);
        break;
      }
    }
  }
  if (!shape_error.empty()) {
    f_.close();
    state_ = State::kClosed;
    throw RecordShapeError("RecordWriter: " + shape_error);
  }

  std::vector<unsigned char> buf(static_cast<size_t>(record_bytes(header_)));
  size_t pos = 0;
  for (size_t c = 0; c < nchan; ++c) {
    const std::vector<double>& x = block[c];
    if (!x.empty()) {
      const auto mm = std::minmax_element(x.begin(), x.end());
      if (*mm.first < ch.physical_min[c]) {
        report(opts_.sink, DiagnosticKind::kRange,
               "Value exceeds physical_min: " + format_value(*mm.first) + " (channel '" +
                   ch.labels[c] + "', record " + std::to_string(n_records_) + ")");
      }
      if (*mm.second > ch.physical_max[c]) {
        report(opts_.sink, DiagnosticKind::kRange,
               "Value exceeds physical_max: " + format_value(*mm.second) + " (channel '" +
                   ch.labels[c] + "', record " + std::to_string(n_records_) + ")");
      }
    }

    for (double v : x) {
      encode_sample_le(to_digital(v, calibration_[c]), data_size, &buf[pos]);
      pos += static_cast<size_t>(data_size);
    }
  }

  f_.write(reinterpret_cast<const char*>(buf.data()), static_cast<std::streamsize>(buf.size()));
  if (!f_) {
    f_.close();
    state_ = State::kClosed;
    throw IOError("RecordWriter: failed writing data record " + std::to_string(n_records_) +
                  " to " + path_);
  }
  ++n_records_;
}

void RecordWriter::close() {
  if (state_ == State::kOpen) {
    // No header was written: nothing to patch.
    f_.close();
    state_ = State::kClosed;
    return;
  }
  require_state(State::kHeaderWritten, "close()");
  state_ = State::kClosed;

  f_.flush();
  if (!f_) {
    f_.close();
    throw IOError("RecordWriter: failed flushing " + path_);
  }

  if (opts_.finalize == FinalizeStrategy::kRewriteAtomic) {
    f_.close();
    rewrite_atomic();
  } else {
    patch_in_place();
    f_.close();
  }
}

void RecordWriter::patch_in_place() {
  const std::string field = pad_field(std::to_string(n_records_), kRecordCountWidth);
  f_.seekp(kRecordCountOffset, std::ios::beg);
  f_.write(field.data(), static_cast<std::streamsize>(field.size()));
  f_.flush();
  if (!f_) throw IOError("RecordWriter: failed to patch the record count in " + path_);
}

void RecordWriter::rewrite_atomic() {
  const std::filesystem::path target = std::filesystem::u8path(path_);
  const std::filesystem::path tmp = make_tmp_path_same_dir(target);
  const long long data_offset = header_.file.data_offset;
  const long long bsize = record_bytes(header_);

  try {
    std::ifstream in(target, std::ios::binary);
    if (!in) throw IOError("RecordWriter: failed to reopen " + path_);
    std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
    if (!out) throw IOError("RecordWriter: failed to create temporary file " + tmp.u8string());

    std::vector<char> buf(static_cast<size_t>(std::max<long long>(bsize, 64 * 1024)));
    copy_bytes(in, out, kRecordCountOffset, &buf);

    in.seekg(kRecordCountWidth, std::ios::cur);
    const std::string field = pad_field(std::to_string(n_records_), kRecordCountWidth);
    out.write(field.data(), static_cast<std::streamsize>(field.size()));

    copy_bytes(in, out, data_offset - kRecordCountOffset - kRecordCountWidth, &buf);
    for (long long r = 0; r < n_records_; ++r) copy_bytes(in, out, bsize, &buf);

    out.flush();
    out.close();
    if (!out) throw IOError("RecordWriter: failed writing temporary file " + tmp.u8string());
  } catch (const Error&) {
    std::error_code rm_ec;
    std::filesystem::remove(tmp, rm_ec);
    throw;
  }

  replace_file_from_temp(tmp.u8string(), path_);
}

const Header& RecordWriter::header() const {
  require_state(State::kHeaderWritten, "header()");
  return header_;
}

const Calibration& RecordWriter::calibration() const {
  require_state(State::kHeaderWritten, "calibration()");
  return calibration_;
}

} // namespace edfio
