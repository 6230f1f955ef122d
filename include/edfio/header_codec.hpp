#pragma once

#include "edfio/diagnostics.hpp"
#include "edfio/types.hpp"

#include <cstdint>
#include <istream>
#include <optional>
#include <string>

namespace edfio {

struct HeaderParseOptions {
  // Path (or bare file name) whose extension decides the subtype when the
  // 44-byte reserved field is blank, e.g. "rec.bdf" -> "bdf".
  std::string extension_hint;

  // Total size of the file in bytes. Resolves the "-1" record count of files
  // that were never finalized and bounds a declared count; if absent,
  // n_records is taken as stored.
  std::optional<std::uintmax_t> total_size;

  // Receives record-length repairs and prefiltering ambiguities.
  DiagnosticSink sink;
};

// Parse the global header plus nchan channel headers from the current position
// of `in`.
//
// Throws MalformedHeaderError if:
// - the stream ends before the declared header size
// - a mandatory numeric field is not a number
// - the date or time field holds fewer than 3 digit groups
// - the bytes consumed do not match the declared header size
// - an inferred record count is not a whole number of records
// - a declared record count needs more bytes than total_size provides
Header parse_header(std::istream& in, const HeaderParseOptions& opts = HeaderParseOptions{});

// Serialize a header into its on-disk bytes (256 + 256 * nchan).
//
// Missing optional fields are filled in place first (labels "0".."n-1", empty
// transducers/units/prefiltering, subtype "edf"), data_size and data_offset are
// derived, and the record count slot is written as the "-1" sentinel (the
// header's n_records is set to -1 to match).
//
// The reserved field is blank for subtype "edf" and "24BIT" for "bdf"; any
// other subtype is written as given.
//
// Text longer than its field is truncated from the right.
//
// Throws RecordShapeError if nchan <= 0 or a numeric channel array does not
// have nchan entries.
std::string serialize_header(Header* header);

// 3 for "24BIT" and for subtypes starting with "bdf" (case-insensitive,
// e.g. "bdf", "BDF+C"), 2 otherwise.
int data_size_for_subtype(const std::string& subtype);

// Bytes in one data record: sum(n_samps) * data_size.
long long record_bytes(const Header& header);

// (total_size - data_offset) / data_size / sum(n_samps).
//
// Throws MalformedHeaderError if the division is not exact or impossible.
long long infer_record_count(const Header& header, std::uintmax_t total_size);

// Checks that total_size holds the header and, when n_records > 0, the
// declared data records. Trailing bytes are allowed.
//
// Throws MalformedHeaderError otherwise.
void check_record_count(const Header& header, std::uintmax_t total_size);

// "dd.mm.yy" and "hh.mm.ss" as written to the header.
std::string format_start_date(const FileHeader& file);
std::string format_start_time(const FileHeader& file);

} // namespace edfio
