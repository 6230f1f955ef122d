#include "edfio/diagnostics.hpp"
#include "edfio/errors.hpp"
#include "edfio/record_stream.hpp"
#include "edfio/record_writer.hpp"
#include "edfio/types.hpp"

#include "test_support.hpp"

#include <cmath>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

using namespace edfio;

namespace fs = std::filesystem;

static bool near(double a, double b, double eps) { return std::fabs(a - b) <= eps; }

static Header eeg_header() {
  Header h;
  h.file.record_length = 1.0;
  h.file.nchan = 2;
  h.channels.labels = {"Fp1", "Fp2"};
  h.channels.units = {"uV", "uV"};
  h.channels.physical_min = {-200.0, -200.0};
  h.channels.physical_max = {200.0, 200.0};
  h.channels.digital_min = {-2048, -2048};
  h.channels.digital_max = {2047, 2047};
  h.channels.n_samps = {4, 4};
  return h;
}

// Identity calibration; channel 1 stores half as many samples per record.
static Header counter_header(int digital_min, int digital_max) {
  Header h;
  h.file.record_length = 2.0;
  h.file.nchan = 2;
  h.channels.labels = {"A", "B"};
  h.channels.physical_min = {static_cast<double>(digital_min), static_cast<double>(digital_min)};
  h.channels.physical_max = {static_cast<double>(digital_max), static_cast<double>(digital_max)};
  h.channels.digital_min = {digital_min, digital_min};
  h.channels.digital_max = {digital_max, digital_max};
  h.channels.n_samps = {4, 2};
  return h;
}

// Three records: channel A counts 0..11, channel B counts 100..105.
static void write_counter_file(const fs::path& path, const Header& h) {
  RecordWriter w;
  w.open(path.string());
  w.write_header(h);
  for (int r = 0; r < 3; ++r) {
    Block b(2);
    for (int i = 0; i < 4; ++i) b[0].push_back(static_cast<double>(r * 4 + i));
    for (int i = 0; i < 2; ++i) b[1].push_back(static_cast<double>(100 + r * 2 + i));
    w.append_block(b);
  }
  w.close();
}

int main() {
  const fs::path dir = fs::temp_directory_path();
  const fs::path path = dir / "edfio_test_record_stream.edf";

  // Write one record, read it back within one quantization step.
  {
    const Block written = {{0.0, 100.0, -100.0, 200.0}, {-200.0, 0.0, 0.0, 200.0}};
    RecordWriter w;
    w.open(path.string());
    w.write_header(eeg_header());
    w.append_block(written);
    w.close();

    RecordStream rs;
    const Header& h = rs.open(path.string());
    assert(rs.is_open());
    assert(h.file.n_records == 1);
    assert(h.file.data_size == 2);
    assert(rs.n_signals() == 2);
    assert(rs.signal_labels() == std::vector<std::string>({"Fp1", "Fp2"}));

    const double step = 400.0 / 4095.0;
    const Block b = rs.read_block(0);
    assert(b.size() == 2);
    for (size_t c = 0; c < 2; ++c) {
      assert(b[c].size() == 4);
      for (size_t i = 0; i < 4; ++i) assert(near(b[c][i], written[c][i], step));
    }

    // Reads are idempotent.
    const Block again = rs.read_block(0);
    assert(again == b);

    TEST_THROWS((void)rs.read_block(1), OutOfRangeError);
    TEST_THROWS((void)rs.read_block(-1), OutOfRangeError);

    rs.close();
    assert(!rs.is_open());
    TEST_THROWS((void)rs.read_block(0), SessionClosedError);
    TEST_THROWS((void)rs.header(), SessionClosedError);
    TEST_THROWS((void)rs.n_signals(), SessionClosedError);
    TEST_THROWS((void)rs.open(path.string()), SessionClosedError);
  }

  // Sample ranges across record boundaries.
  {
    write_counter_file(path, counter_header(-32768, 32767));

    RecordStream rs;
    rs.open(path.string());
    assert(rs.header().file.n_records == 3);

    const std::vector<long long> ns = rs.n_samples();
    assert(ns.size() == 2 && ns[0] == 12 && ns[1] == 6);
    const std::vector<double> fs_hz = rs.signal_frequencies();
    assert(fs_hz[0] == 2.0 && fs_hz[1] == 1.0);

    const std::vector<double> a = rs.read_samples(0, 2, 9);
    assert(a.size() == 8);
    for (size_t i = 0; i < a.size(); ++i) assert(a[i] == static_cast<double>(2 + i));

    const std::vector<double> one = rs.read_samples(0, 7, 7);
    assert(one.size() == 1 && one[0] == 7.0);

    const std::vector<double> b = rs.read_samples(1, 1, 4);
    assert(b.size() == 4);
    assert(b[0] == 101.0 && b[3] == 104.0);

    const std::vector<double> sig = rs.read_signal(1);
    assert(sig.size() == 6);
    for (size_t i = 0; i < sig.size(); ++i) assert(sig[i] == static_cast<double>(100 + i));
    assert(rs.read_signal(0).size() == 12);

    TEST_THROWS((void)rs.read_samples(0, 5, 4), OutOfRangeError);
    TEST_THROWS((void)rs.read_samples(0, -1, 4), OutOfRangeError);
    TEST_THROWS((void)rs.read_samples(0, 0, 12), OutOfRangeError);
    TEST_THROWS((void)rs.read_samples(2, 0, 1), OutOfRangeError);
    TEST_THROWS((void)rs.read_samples(-1, 0, 1), OutOfRangeError);
    TEST_THROWS((void)rs.read_signal(2), OutOfRangeError);
  }

  // 24-bit samples in a .bdf file.
  {
    const fs::path bdf = dir / "edfio_test_record_stream.bdf";
    write_counter_file(bdf, counter_header(-8388608, 8388607));

    RecordStream counter;
    assert(counter.open(bdf.string()).file.data_size == 3);
    assert(counter.header().file.subtype == "24BIT");
    counter.close();

    Header h = counter_header(-8388608, 8388607);
    RecordWriter w;
    w.open(bdf.string());
    w.write_header(h);
    w.append_block({{1234567.0, -7654321.0, 8388607.0, -8388608.0}, {-1.0, 0.0}});
    w.close();
    assert(fs::file_size(bdf) == 768u + 6u * 3u);

    RecordStream rs;
    rs.open(bdf.string());
    const Block b = rs.read_block(0);
    assert(b[0][0] == 1234567.0);
    assert(b[0][1] == -7654321.0);
    assert(b[0][2] == 8388607.0);
    assert(b[0][3] == -8388608.0);
    assert(b[1][0] == -1.0 && b[1][1] == 0.0);
    rs.close();
    fs::remove(bdf);
  }

  // A 24-bit subtype set explicitly survives a file name without .bdf.
  {
    const fs::path odd = dir / "edfio_test_record_stream_24bit.edf";
    Header h = counter_header(-8388608, 8388607);
    h.file.nchan = 1;
    h.channels.labels = {"A"};
    h.channels.physical_min = {-8388608.0};
    h.channels.physical_max = {8388607.0};
    h.channels.digital_min = {-8388608};
    h.channels.digital_max = {8388607};
    h.channels.n_samps = {4};
    h.file.subtype = "bdf";

    RecordWriter w;
    w.open(odd.string());
    w.write_header(h);
    w.append_block({{1000000.0, -2.0, 3.0, 4.0}});
    w.close();

    RecordStream rs;
    const Header& back = rs.open(odd.string());
    assert(back.file.data_size == 3);
    assert(back.file.n_records == 1);
    const Block b = rs.read_block(0);
    assert(b.size() == 1 && b[0].size() == 4);
    assert(b[0][0] == 1000000.0);
    assert(b[0][1] == -2.0);
    assert(b[0][2] == 3.0);
    assert(b[0][3] == 4.0);
    rs.close();
    fs::remove(odd);
  }

  // A declared record count larger than the file is rejected at open().
  {
    RecordWriter w;
    w.open(path.string());
    w.write_header(eeg_header());
    w.append_block({{0.0, 0.0, 0.0, 0.0}, {0.0, 0.0, 0.0, 0.0}});
    w.append_block({{1.0, 1.0, 1.0, 1.0}, {1.0, 1.0, 1.0, 1.0}});
    w.close();

    // Drop half of the last record.
    fs::resize_file(path, 768u + 16u + 8u);
    RecordStream truncated;
    TEST_THROWS((void)truncated.open(path.string()), MalformedHeaderError);
    assert(!truncated.is_open());

    // Claim far more records than the file holds.
    fs::resize_file(path, 768u + 16u);
    {
      std::fstream f(path, std::ios::in | std::ios::out | std::ios::binary);
      f.seekp(236);
      f.write("99999999", 8);
    }
    RecordStream hostile;
    TEST_THROWS((void)hostile.open(path.string()), MalformedHeaderError);
  }

  // A file that was never finalized: the record count comes from the size.
  {
    {
      RecordWriter w;
      w.open(path.string());
      w.write_header(eeg_header());
      w.append_block({{0.0, 0.0, 0.0, 0.0}, {0.0, 0.0, 0.0, 0.0}});
      w.append_block({{1.0, 1.0, 1.0, 1.0}, {1.0, 1.0, 1.0, 1.0}});
    }
    RecordStream rs;
    assert(rs.open(path.string()).file.n_records == 2);
    assert(rs.read_block(1).size() == 2);
  }

  // Record length 0 is repaired to one second.
  {
    Header h = eeg_header();
    h.file.record_length = 0.0;
    RecordWriter w;
    w.open(path.string());
    w.write_header(h);
    w.append_block({{0.0, 0.0, 0.0, 0.0}, {0.0, 0.0, 0.0, 0.0}});
    w.close();

    std::vector<Diagnostic> diags;
    RecordStreamOptions opts;
    opts.sink = [&diags](const Diagnostic& d) { diags.push_back(d); };
    RecordStream rs(opts);
    rs.open(path.string());
    assert(rs.header().file.record_length == 1.0);
    const std::vector<double> fs_hz = rs.signal_frequencies();
    assert(fs_hz[0] == 4.0 && fs_hz[1] == 4.0);
    assert(diags.size() == 1);
    assert(diags[0].kind == DiagnosticKind::kRecordLengthRepair);
  }

  // A channel that stores no samples.
  {
    Header h = eeg_header();
    h.channels.n_samps = {4, 0};
    RecordWriter w;
    w.open(path.string());
    w.write_header(h);
    w.append_block({{1.0, 2.0, 3.0, 4.0}, {}});
    w.close();

    RecordStream rs;
    rs.open(path.string());
    assert(rs.read_signal(1).empty());
    assert(rs.read_signal(0).size() == 4);
    const Block b = rs.read_block(0);
    assert(b[1].empty());
    TEST_THROWS((void)rs.read_samples(1, 0, 0), OutOfRangeError);
  }

  // Missing file.
  {
    RecordStream rs;
    TEST_THROWS((void)rs.open((dir / "edfio_no_such_file.edf").string()), IOError);
    assert(!rs.is_open());
  }

  fs::remove(path);

  std::cout << "RecordStream tests passed.\n";
  return 0;
}
