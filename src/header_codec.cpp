#include "edfio/header_codec.hpp"

#include "edfio/errors.hpp"
#include "edfio/utils.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <limits>
#include <numeric>
#include <regex>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace edfio {

namespace {

// Reads fixed-width fields and counts the bytes consumed so that the final
// position can be checked against the declared header size.
class FieldReader {
public:
  explicit FieldReader(std::istream& in) : in_(in) {}

  std::string raw(size_t n, const char* field) {
    std::string s(n, '\0');
    in_.read(&s[0], static_cast<std::streamsize>(n));
    if (static_cast<size_t>(in_.gcount()) != n) {
      throw MalformedHeaderError(std::string("HeaderCodec: unexpected end of header while reading ") +
                                 field + " (offset " + std::to_string(consumed_) + ")");
    }
    consumed_ += static_cast<long long>(n);
    return s;
  }

  std::string text(size_t n, const char* field) { return trim(raw(n, field)); }

  long long consumed() const { return consumed_; }

private:
  std::istream& in_;
  long long consumed_{0};
};

int parse_int_field(const std::string& s, const char* field) {
  try {
    return to_int(s);
  } catch (const std::exception& e) {
    throw MalformedHeaderError(std::string("HeaderCodec: invalid ") + field + ": " + e.what());
  }
}

long long parse_long_field(const std::string& s, const char* field) {
  try {
    return to_long_long(s);
  } catch (const std::exception& e) {
    throw MalformedHeaderError(std::string("HeaderCodec: invalid ") + field + ": " + e.what());
  }
}

double parse_double_field(const std::string& s, const char* field) {
  double v = 0.0;
  try {
    v = to_double(s);
  } catch (const std::exception& e) {
    throw MalformedHeaderError(std::string("HeaderCodec: invalid ") + field + ": " + e.what());
  }
  if (!std::isfinite(v)) {
    throw MalformedHeaderError(std::string("HeaderCodec: non-finite ") + field + " '" + trim(s) + "'");
  }
  return v;
}

// Digital limits are integers, but some writers emit them as "-2048.0".
int parse_digital_field(const std::string& s, const char* field) {
  const double v = parse_double_field(s, field);
  if (v != std::floor(v) || v < static_cast<double>(std::numeric_limits<int>::min()) ||
      v > static_cast<double>(std::numeric_limits<int>::max())) {
    throw MalformedHeaderError(std::string("HeaderCodec: ") + field + " is not an integer: '" +
                               trim(s) + "'");
  }
  return static_cast<int>(v);
}

void parse_triplet(const std::string& s, const char* field, int* a, int* b, int* c) {
  std::vector<int> groups;
  try {
    groups = extract_digit_groups(s);
  } catch (const std::exception& e) {
    throw MalformedHeaderError(std::string("HeaderCodec: invalid ") + field + ": " + e.what());
  }
  if (groups.size() < 3) {
    throw MalformedHeaderError(std::string("HeaderCodec: ") + field + " '" + trim(s) +
                               "' has fewer than 3 numeric components");
  }
  *a = groups[0];
  *b = groups[1];
  *c = groups[2];
}

// Numeric value of an HP:/LP: token such as "0.1Hz", "70", "DC" or "NaN".
// Returns false for NaN and unparseable tokens.
bool filter_token_value(const std::string& token, bool highpass, double* out) {
  const std::string low = to_lower(token);
  if (low == "nan") return false;
  if (low == "dc") {
    if (!highpass) return false;
    *out = 0.0;
    return true;
  }
  static const std::regex kLeadingNumber(R"(^[+-]?(\d+\.?\d*|\.\d+))");
  std::smatch m;
  if (!std::regex_search(token, m, kLeadingNumber)) return false;
  try {
    *out = to_double(m.str(0));
  } catch (const std::exception&) {
    return false;
  }
  return std::isfinite(*out);
}

std::vector<double> collect_filter_values(const std::vector<std::string>& prefiltering,
                                          bool highpass) {
  static const std::regex kHighpass(R"(HP:\s*([^\s;,]+))", std::regex::icase);
  static const std::regex kLowpass(R"(LP:\s*([^\s;,]+))", std::regex::icase);
  const std::regex& re = highpass ? kHighpass : kLowpass;

  std::vector<double> values;
  // The last channel's entry conventionally terminates the record and is skipped.
  const size_t n = prefiltering.empty() ? 0 : prefiltering.size() - 1;
  for (size_t ch = 0; ch < n; ++ch) {
    const std::string& s = prefiltering[ch];
    for (auto it = std::sregex_iterator(s.begin(), s.end(), re); it != std::sregex_iterator(); ++it) {
      double v = 0.0;
      if (filter_token_value((*it)[1].str(), highpass, &v)) values.push_back(v);
    }
  }
  return values;
}

void resolve_filters(const std::vector<std::string>& prefiltering, FileHeader* file,
                     const DiagnosticSink& sink) {
  const std::vector<double> hp = collect_filter_values(prefiltering, /*highpass=*/true);
  const std::vector<double> lp = collect_filter_values(prefiltering, /*highpass=*/false);

  file->highpass = 0.0;
  if (!hp.empty()) {
    const auto mm = std::minmax_element(hp.begin(), hp.end());
    file->highpass = *mm.second;
    if (*mm.first != *mm.second) {
      report(sink, DiagnosticKind::kHeaderAmbiguity,
             "Channels contain different highpass filters. Highest filter setting will be stored.");
    }
  }

  file->lowpass.reset();
  if (!lp.empty()) {
    const auto mm = std::minmax_element(lp.begin(), lp.end());
    file->lowpass = *mm.first;
    if (*mm.first != *mm.second) {
      report(sink, DiagnosticKind::kHeaderAmbiguity,
             "Channels contain different lowpass filters. Lowest filter setting will be stored.");
    }
  }
}

std::string two_digit_triplet(int a, int b, int c) {
  std::ostringstream oss;
  oss << std::setfill('0') << std::setw(2) << a << '.' << std::setw(2) << b << '.'
      << std::setw(2) << c;
  return oss.str();
}

void write_field(std::string* out, const std::string& s, size_t width) {
  out->append(pad_field(s, width));
}

template <typename T>
void fill_text_defaults(std::vector<T>* v, size_t nchan, bool index_labels) {
  if (v->size() < nchan) {
    v->assign(nchan, T{});
    if (index_labels) {
      for (size_t i = 0; i < nchan; ++i) (*v)[i] = std::to_string(i);
    }
  } else if (v->size() > nchan) {
    v->resize(nchan);
  }
}

template <typename T>
void require_channel_array(const std::vector<T>& v, size_t nchan, const char* field) {
  if (v.size() != nchan) {
    throw RecordShapeError(std::string("HeaderCodec: ") + field + " has " + std::to_string(v.size()) +
                           " entries, expected nchan=" + std::to_string(nchan));
  }
}

} // namespace

int data_size_for_subtype(const std::string& subtype) {
  if (subtype == "24BIT") return 3;
  // "bdf" and the BDF+ variants ("BDF+C", "BDF+D").
  if (to_lower(subtype.substr(0, 3)) == "bdf") return 3;
  return 2;
}

long long record_bytes(const Header& header) {
  long long total = 0;
  for (int n : header.channels.n_samps) total += static_cast<long long>(n);
  return total * static_cast<long long>(header.file.data_size);
}

long long infer_record_count(const Header& header, std::uintmax_t total_size) {
  const long long offset = header.file.data_offset;
  if (total_size < static_cast<std::uintmax_t>(offset)) {
    throw MalformedHeaderError("HeaderCodec: file size " + std::to_string(total_size) +
                               " is smaller than the header (" + std::to_string(offset) + " bytes)");
  }
  const long long bsize = record_bytes(header);
  if (bsize <= 0) {
    throw MalformedHeaderError("HeaderCodec: cannot infer the record count, records are empty");
  }
  const std::uintmax_t data_bytes = total_size - static_cast<std::uintmax_t>(offset);
  if (data_bytes % static_cast<std::uintmax_t>(bsize) != 0) {
    throw MalformedHeaderError("HeaderCodec: " + std::to_string(data_bytes) +
                               " data bytes is not a whole number of " + std::to_string(bsize) +
                               "-byte records (truncated file?)");
  }
  return static_cast<long long>(data_bytes / static_cast<std::uintmax_t>(bsize));
}

void check_record_count(const Header& header, std::uintmax_t total_size) {
  const long long offset = header.file.data_offset;
  if (total_size < static_cast<std::uintmax_t>(offset)) {
    throw MalformedHeaderError("HeaderCodec: file size " + std::to_string(total_size) +
                               " is smaller than the header (" + std::to_string(offset) + " bytes)");
  }
  const long long bsize = record_bytes(header);
  if (header.file.n_records <= 0 || bsize <= 0) return;

  // Compared by division so that a huge declared count cannot overflow.
  const std::uintmax_t available =
      (total_size - static_cast<std::uintmax_t>(offset)) / static_cast<std::uintmax_t>(bsize);
  if (static_cast<std::uintmax_t>(header.file.n_records) > available) {
    throw MalformedHeaderError("HeaderCodec: header declares " + std::to_string(header.file.n_records) +
                               " records of " + std::to_string(bsize) + " bytes but the file holds " +
                               std::to_string(available) + " (truncated file?)");
  }
}

std::string format_start_date(const FileHeader& file) {
  return two_digit_triplet(file.day, file.month, file.year % 100);
}

std::string format_start_time(const FileHeader& file) {
  return two_digit_triplet(file.hour, file.minute, file.second);
}

Header parse_header(std::istream& in, const HeaderParseOptions& opts) {
  Header h;
  FileHeader& fh = h.file;
  ChannelHeader& ch = h.channels;
  FieldReader r(in);

  fh.version = r.text(8, "version");
  fh.subject_id = r.text(80, "subject id");
  fh.recording_id = r.text(80, "recording id");
  parse_triplet(r.raw(8, "start date"), "start date", &fh.day, &fh.month, &fh.year);
  parse_triplet(r.raw(8, "start time"), "start time", &fh.hour, &fh.minute, &fh.second);

  const long long header_bytes = parse_long_field(r.raw(8, "header size"), "header size");
  fh.data_offset = header_bytes;

  fh.subtype = r.text(44, "reserved").substr(0, 5);
  if (fh.subtype.empty()) fh.subtype = file_extension_lower(opts.extension_hint);
  fh.data_size = data_size_for_subtype(fh.subtype);

  fh.n_records = parse_long_field(r.raw(8, "record count"), "record count");
  if (fh.n_records < kUnknownRecordCount) {
    throw MalformedHeaderError("HeaderCodec: invalid negative record count " +
                               std::to_string(fh.n_records) + " (only -1 allowed)");
  }

  fh.record_length = parse_double_field(r.raw(8, "record duration"), "record duration");
  if (fh.record_length == 0.0) {
    fh.record_length = 1.0;
    report(opts.sink, DiagnosticKind::kRecordLengthRepair,
           "Header information is incorrect for record length. Default record length set to 1.");
  } else if (fh.record_length < 0.0) {
    throw MalformedHeaderError("HeaderCodec: negative record duration " +
                               std::to_string(fh.record_length));
  }

  fh.nchan = parse_int_field(r.raw(4, "channel count"), "channel count");
  if (fh.nchan <= 0) {
    throw MalformedHeaderError("HeaderCodec: invalid channel count " + std::to_string(fh.nchan));
  }
  const size_t n = static_cast<size_t>(fh.nchan);
  if (header_bytes < kFileHeaderBytes) {
    throw MalformedHeaderError("HeaderCodec: declared header size " + std::to_string(header_bytes) +
                               " is smaller than the fixed header");
  }

  ch.labels.resize(n);
  ch.transducers.resize(n);
  ch.units.resize(n);
  ch.physical_min.resize(n);
  ch.physical_max.resize(n);
  ch.digital_min.resize(n);
  ch.digital_max.resize(n);
  ch.prefiltering.resize(n);
  ch.n_samps.resize(n);

  for (size_t i = 0; i < n; ++i) ch.labels[i] = r.text(16, "label");
  for (size_t i = 0; i < n; ++i) ch.transducers[i] = r.text(80, "transducer");
  for (size_t i = 0; i < n; ++i) ch.units[i] = r.text(8, "physical dimension");
  for (size_t i = 0; i < n; ++i) ch.physical_min[i] = parse_double_field(r.raw(8, "physical minimum"), "physical minimum");
  for (size_t i = 0; i < n; ++i) ch.physical_max[i] = parse_double_field(r.raw(8, "physical maximum"), "physical maximum");
  for (size_t i = 0; i < n; ++i) ch.digital_min[i] = parse_digital_field(r.raw(8, "digital minimum"), "digital minimum");
  for (size_t i = 0; i < n; ++i) ch.digital_max[i] = parse_digital_field(r.raw(8, "digital maximum"), "digital maximum");
  for (size_t i = 0; i < n; ++i) ch.prefiltering[i] = r.text(80, "prefiltering");
  for (size_t i = 0; i < n; ++i) {
    ch.n_samps[i] = parse_int_field(r.raw(8, "samples per record"), "samples per record");
    if (ch.n_samps[i] < 0) {
      throw MalformedHeaderError("HeaderCodec: negative samples per record for channel " +
                                 std::to_string(i));
    }
  }
  for (size_t i = 0; i < n; ++i) (void)r.raw(32, "channel reserved");

  if (r.consumed() != header_bytes) {
    throw MalformedHeaderError("HeaderCodec: header ends at byte " + std::to_string(r.consumed()) +
                               " but declares " + std::to_string(header_bytes) + " bytes");
  }

  resolve_filters(ch.prefiltering, &fh, opts.sink);

  if (opts.total_size) {
    if (fh.n_records == kUnknownRecordCount) {
      fh.n_records = infer_record_count(h, *opts.total_size);
    } else {
      check_record_count(h, *opts.total_size);
    }
  }

  return h;
}

std::string serialize_header(Header* header) {
  FileHeader& fh = header->file;
  ChannelHeader& ch = header->channels;

  if (fh.nchan <= 0) {
    throw RecordShapeError("HeaderCodec: nchan must be positive (got " + std::to_string(fh.nchan) + ")");
  }
  const size_t n = static_cast<size_t>(fh.nchan);

  require_channel_array(ch.physical_min, n, "physical_min");
  require_channel_array(ch.physical_max, n, "physical_max");
  require_channel_array(ch.digital_min, n, "digital_min");
  require_channel_array(ch.digital_max, n, "digital_max");
  require_channel_array(ch.n_samps, n, "n_samps");
  for (size_t i = 0; i < n; ++i) {
    if (ch.n_samps[i] < 0) {
      throw RecordShapeError("HeaderCodec: negative samples per record for channel " + std::to_string(i));
    }
  }

  fill_text_defaults(&ch.labels, n, /*index_labels=*/true);
  fill_text_defaults(&ch.transducers, n, /*index_labels=*/false);
  fill_text_defaults(&ch.units, n, /*index_labels=*/false);
  fill_text_defaults(&ch.prefiltering, n, /*index_labels=*/false);

  if (fh.subtype.empty()) fh.subtype = "edf";
  fh.data_size = data_size_for_subtype(fh.subtype);
  fh.data_offset = static_cast<long long>(kFileHeaderBytes) +
                   static_cast<long long>(kChannelHeaderBytes) * fh.nchan;
  fh.n_records = kUnknownRecordCount;

  // Plain EDF leaves the reserved field blank. A bare "bdf" subtype is stored
  // as "24BIT" so the sample width survives any file extension; other
  // subtypes ("EDF+C", "24BIT", ...) are recorded as given.
  const std::string low_subtype = to_lower(fh.subtype);
  std::string reserved = fh.subtype;
  if (low_subtype == "edf") {
    reserved.clear();
  } else if (low_subtype == "bdf") {
    reserved = "24BIT";
  }

  std::string out;
  out.reserve(static_cast<size_t>(fh.data_offset));

  write_field(&out, fh.version, 8);
  write_field(&out, fh.subject_id, 80);
  write_field(&out, fh.recording_id, 80);
  write_field(&out, format_start_date(fh), 8);
  write_field(&out, format_start_time(fh), 8);
  write_field(&out, std::to_string(fh.data_offset), 8);
  write_field(&out, reserved, 44);
  write_field(&out, std::to_string(kUnknownRecordCount), kRecordCountWidth);
  write_field(&out, format_number_field(fh.record_length, 8), 8);
  write_field(&out, std::to_string(fh.nchan), 4);

  for (size_t i = 0; i < n; ++i) write_field(&out, ch.labels[i], 16);
  for (size_t i = 0; i < n; ++i) write_field(&out, ch.transducers[i], 80);
  for (size_t i = 0; i < n; ++i) write_field(&out, ch.units[i], 8);
  for (size_t i = 0; i < n; ++i) write_field(&out, format_number_field(ch.physical_min[i], 8), 8);
  for (size_t i = 0; i < n; ++i) write_field(&out, format_number_field(ch.physical_max[i], 8), 8);
  for (size_t i = 0; i < n; ++i) write_field(&out, std::to_string(ch.digital_min[i]), 8);
  for (size_t i = 0; i < n; ++i) write_field(&out, std::to_string(ch.digital_max[i]), 8);
  for (size_t i = 0; i < n; ++i) write_field(&out, ch.prefiltering[i], 80);
  for (size_t i = 0; i < n; ++i) write_field(&out, std::to_string(ch.n_samps[i]), 8);
  for (size_t i = 0; i < n; ++i) write_field(&out, "", 32);

  if (static_cast<long long>(out.size()) != fh.data_offset) {
    throw std::logic_error("HeaderCodec: serialized header size mismatch");
  }
  return out;
}

} // namespace edfio
