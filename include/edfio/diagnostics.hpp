#pragma once

#include <functional>
#include <string>

namespace edfio {

// Non-fatal conditions reported while reading or writing.
enum class DiagnosticKind {
  // A physical value outside [physical_min, physical_max] was written.
  kRange = 0,
  // Channels disagree on their highpass/lowpass prefiltering.
  kHeaderAmbiguity,
  // A record length of 0 was replaced by 1 second.
  kRecordLengthRepair,
};

struct Diagnostic {
  DiagnosticKind kind{DiagnosticKind::kRange};
  std::string message;
};

// Receives diagnostics. An empty sink means "use default_diagnostic_sink()".
using DiagnosticSink = std::function<void(const Diagnostic&)>;

const char* diagnostic_kind_name(DiagnosticKind kind);

// Writes "Warning: <message>" to stderr.
void default_diagnostic_sink(const Diagnostic& d);

// Deliver a diagnostic to sink, or to the default sink if sink is empty.
void report(const DiagnosticSink& sink, DiagnosticKind kind, const std::string& message);

} // namespace edfio
