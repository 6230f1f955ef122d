#include "edfio/diagnostics.hpp"

#include <iostream>

namespace edfio {

const char* diagnostic_kind_name(DiagnosticKind kind) {
  switch (kind) {
    case DiagnosticKind::kRange: return "range";
    case DiagnosticKind::kHeaderAmbiguity: return "header-ambiguity";
    case DiagnosticKind::kRecordLengthRepair: return "record-length-repair";
  }
  return "unknown";
}

void default_diagnostic_sink(const Diagnostic& d) {
  std::cerr << "Warning: " << d.message << "\n";
}

void report(const DiagnosticSink& sink, DiagnosticKind kind, const std::string& message) {
  Diagnostic d;
  d.kind = kind;
  d.message = message;
  if (sink) {
    sink(d);
  } else {
    default_diagnostic_sink(d);
  }
}

} // namespace edfio
