#include "edfio/header_codec.hpp"
#include "edfio/record_stream.hpp"
#include "edfio/utils.hpp"
#include "edfio/version.hpp"

#include <cmath>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace edfio;

namespace {

struct SampleRange {
  int channel{0};
  long long begin{0};
  long long end{0};
};

struct Args {
  std::string input_path;
  bool json{false};
  bool channels{true};

  // Optional dumps.
  bool have_block{false};
  long long block{0};
  bool have_samples{false};
  SampleRange samples;
};

static void print_help() {
  std::cout
    << "edfio_info_cli\n\n"
    << "Print the header of an EDF/EDF+/BDF file: identification, start date/time,\n"
    << "record layout, and per-channel calibration, sampling rate and sample count.\n"
    << "Optionally dump one data record or a range of physical samples.\n\n"
    << "Usage:\n"
    << "  edfio_info_cli --input file.edf\n"
    << "  edfio_info_cli --input file.bdf --block 0\n"
    << "  edfio_info_cli --input file.edf --samples 1:0:255\n\n"
    << "Options:\n"
    << "  --input PATH             Input EDF/BDF\n"
    << "  --no-channels            Skip the per-channel table\n"
    << "  --block N                Print data record N (physical units, one line per channel)\n"
    << "  --samples CH:BEGIN:END   Print samples BEGIN..END (inclusive) of channel CH\n"
    << "  --json                   Output JSON (useful for scripts)\n"
    << "  --version                Print the version and exit\n"
    << "  -h, --help               Show this help\n";
}

static SampleRange parse_sample_range(const std::string& s) {
  const std::vector<std::string> parts = split(s, ':');
  if (parts.size() != 3) {
    throw std::runtime_error("--samples expects CH:BEGIN:END, got '" + s + "'");
  }
  SampleRange r;
  r.channel = to_int(parts[0]);
  r.begin = to_long_long(parts[1]);
  r.end = to_long_long(parts[2]);
  return r;
}

static Args parse_args(int argc, char** argv) {
  Args a;
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "-h" || arg == "--help") {
      print_help();
      std::exit(0);
    } else if (arg == "--version") {
      std::cout << "edfio " << version_string() << " (" << build_type_string() << ")\n";
      std::exit(0);
    } else if (arg == "--input" && i + 1 < argc) {
      a.input_path = argv[++i];
    } else if (arg == "--no-channels") {
      a.channels = false;
    } else if (arg == "--block" && i + 1 < argc) {
      a.have_block = true;
      a.block = to_long_long(argv[++i]);
    } else if (arg == "--samples" && i + 1 < argc) {
      a.have_samples = true;
      a.samples = parse_sample_range(argv[++i]);
    } else if (arg == "--json") {
      a.json = true;
    } else {
      throw std::runtime_error("Unknown or incomplete argument: " + arg);
    }
  }
  return a;
}

static std::string json_escape(const std::string& s) {
  std::ostringstream oss;
  for (char c : s) {
    switch (c) {
      case '\\': oss << "\\\\"; break;
      case '"': oss << "\\\""; break;
      case '\n': oss << "\\n"; break;
      case '\r': oss << "\\r"; break;
      case '\t': oss << "\\t"; break;
      default:
        if (static_cast<unsigned char>(c) < 0x20) {
          oss << "\\u" << std::hex << std::setw(4) << std::setfill('0')
              << static_cast<int>(static_cast<unsigned char>(c))
              << std::dec << std::setw(0) << std::setfill(' ');
        } else {
          oss << c;
        }
        break;
    }
  }
  return oss.str();
}

static std::string json_number(double x) {
  if (!std::isfinite(x)) return "null";
  std::ostringstream oss;
  oss << std::setprecision(17) << x;
  return oss.str();
}

static std::string json_number_array(const std::vector<double>& v) {
  std::ostringstream oss;
  oss << "[";
  for (size_t i = 0; i < v.size(); ++i) {
    if (i) oss << ", ";
    oss << json_number(v[i]);
  }
  oss << "]";
  return oss.str();
}

static std::string format_duration(double seconds) {
  if (!std::isfinite(seconds) || seconds < 0.0) return "n/a";
  const long long total = static_cast<long long>(seconds + 0.5); // nearest second
  const long long h = total / 3600;
  const long long m = (total % 3600) / 60;
  const long long s = total % 60;
  std::ostringstream oss;
  if (h > 0) oss << h << "h";
  if (m > 0 || h > 0) oss << m << "m";
  oss << s << "s";
  return oss.str();
}

static void print_text(RecordStream& rs, const Args& args) {
  const Header& h = rs.header();
  const FileHeader& fh = h.file;
  const ChannelHeader& ch = h.channels;
  const Calibration& cal = rs.calibration();
  const std::vector<double> fs = rs.signal_frequencies();
  const std::vector<long long> ns = rs.n_samples();

  std::cout << "File: " << args.input_path << "\n";
  std::cout << "Version: '" << fh.version << "'  Subtype: '" << fh.subtype << "' ("
            << fh.data_size * 8 << "-bit samples)\n";
  std::cout << "Subject: " << fh.subject_id << "\n";
  std::cout << "Recording: " << fh.recording_id << "\n";
  std::cout << "Start: " << format_start_date(fh) << " " << format_start_time(fh) << "\n";
  std::cout << "Header bytes: " << fh.data_offset << "\n";
  std::cout << "Records: " << fh.n_records << " x " << fh.record_length << " s ("
            << record_bytes(h) << " bytes each), duration "
            << format_duration(static_cast<double>(fh.n_records) * fh.record_length) << "\n";
  std::cout << "Filters: highpass " << fh.highpass << " Hz, lowpass ";
  if (fh.lowpass) {
    std::cout << *fh.lowpass << " Hz\n";
  } else {
    std::cout << "none\n";
  }
  std::cout << "Channels: " << fh.nchan << "\n";

  if (args.channels) {
    for (size_t c = 0; c < ch.size(); ++c) {
      std::cout << "  [" << c << "] " << ch.labels[c]
                << "  unit=" << ch.units[c]
                << "  fs=" << fs[c] << " Hz"
                << "  samples=" << ns[c]
                << "  phys=[" << ch.physical_min[c] << ", " << ch.physical_max[c] << "]"
                << "  dig=[" << ch.digital_min[c] << ", " << ch.digital_max[c] << "]"
                << "  scale=" << cal[c].scale << "  offset=" << cal[c].offset
                << (cal[c].fallback ? "  (calibration fallback)" : "") << "\n";
    }
  }

  if (args.have_block) {
    const Block block = rs.read_block(args.block);
    std::cout << "Record " << args.block << ":\n";
    for (size_t c = 0; c < block.size(); ++c) {
      std::cout << "  " << ch.labels[c] << ":";
      for (double v : block[c]) std::cout << " " << v;
      std::cout << "\n";
    }
  }

  if (args.have_samples) {
    const std::vector<double> x =
        rs.read_samples(args.samples.channel, args.samples.begin, args.samples.end);
    std::cout << "Samples " << args.samples.begin << ".." << args.samples.end << " of channel "
              << args.samples.channel << ":\n";
    for (double v : x) std::cout << v << "\n";
  }
}

static void print_json(RecordStream& rs, const Args& args) {
  const Header& h = rs.header();
  const FileHeader& fh = h.file;
  const ChannelHeader& ch = h.channels;
  const Calibration& cal = rs.calibration();
  const std::vector<double> fs = rs.signal_frequencies();
  const std::vector<long long> ns = rs.n_samples();

  std::ostringstream o;
  o << "{\n";
  o << "  \"file\": \"" << json_escape(args.input_path) << "\",\n";
  o << "  \"version\": \"" << json_escape(fh.version) << "\",\n";
  o << "  \"subtype\": \"" << json_escape(fh.subtype) << "\",\n";
  o << "  \"data_size\": " << fh.data_size << ",\n";
  o << "  \"subject_id\": \"" << json_escape(fh.subject_id) << "\",\n";
  o << "  \"recording_id\": \"" << json_escape(fh.recording_id) << "\",\n";
  o << "  \"start_date\": \"" << format_start_date(fh) << "\",\n";
  o << "  \"start_time\": \"" << format_start_time(fh) << "\",\n";
  o << "  \"data_offset\": " << fh.data_offset << ",\n";
  o << "  \"n_records\": " << fh.n_records << ",\n";
  o << "  \"record_length\": " << json_number(fh.record_length) << ",\n";
  o << "  \"highpass\": " << json_number(fh.highpass) << ",\n";
  o << "  \"lowpass\": " << (fh.lowpass ? json_number(*fh.lowpass) : std::string("null")) << ",\n";
  o << "  \"nchan\": " << fh.nchan;

  if (args.channels) {
    o << ",\n  \"channels\": [\n";
    for (size_t c = 0; c < ch.size(); ++c) {
      o << "    {\"label\": \"" << json_escape(ch.labels[c]) << "\""
        << ", \"transducer\": \"" << json_escape(ch.transducers[c]) << "\""
        << ", \"unit\": \"" << json_escape(ch.units[c]) << "\""
        << ", \"physical_min\": " << json_number(ch.physical_min[c])
        << ", \"physical_max\": " << json_number(ch.physical_max[c])
        << ", \"digital_min\": " << ch.digital_min[c]
        << ", \"digital_max\": " << ch.digital_max[c]
        << ", \"n_samps\": " << ch.n_samps[c]
        << ", \"fs_hz\": " << json_number(fs[c])
        << ", \"n_samples\": " << ns[c]
        << ", \"scale\": " << json_number(cal[c].scale)
        << ", \"offset\": " << json_number(cal[c].offset)
        << ", \"calibration_fallback\": " << (cal[c].fallback ? "true" : "false") << "}"
        << (c + 1 < ch.size() ? "," : "") << "\n";
    }
    o << "  ]";
  }

  if (args.have_block) {
    const Block block = rs.read_block(args.block);
    o << ",\n  \"block\": {\"index\": " << args.block << ", \"channels\": [";
    for (size_t c = 0; c < block.size(); ++c) {
      if (c) o << ", ";
      o << json_number_array(block[c]);
    }
    o << "]}";
  }

  if (args.have_samples) {
    const std::vector<double> x =
        rs.read_samples(args.samples.channel, args.samples.begin, args.samples.end);
    o << ",\n  \"samples\": {\"channel\": " << args.samples.channel
      << ", \"begin\": " << args.samples.begin << ", \"end\": " << args.samples.end
      << ", \"values\": " << json_number_array(x) << "}";
  }

  o << "\n}\n";
  std::cout << o.str();
}

} // namespace

int main(int argc, char** argv) {
  try {
    const Args args = parse_args(argc, argv);
    if (args.input_path.empty()) {
      print_help();
      return 1;
    }
    if (!file_exists(args.input_path)) {
      throw std::runtime_error("Input file not found: " + args.input_path);
    }

    RecordStream rs;
    rs.open(args.input_path);
    if (args.json) {
      print_json(rs, args);
    } else {
      print_text(rs, args);
    }
    return 0;
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 2;
  }
}
