#pragma once

#include <string>

namespace edfio {

// Project version string as defined by CMake's project(VERSION ...).
//
// CMake defines EDFIO_VERSION_STRING for all targets that link against the
// edfio library.
#ifndef EDFIO_VERSION_STRING
  #define EDFIO_VERSION_STRING "0.0.0"
#endif

inline const char* version_cstr() {
  return EDFIO_VERSION_STRING;
}

inline std::string version_string() {
  return std::string(version_cstr());
}

inline std::string build_type_string() {
#ifdef NDEBUG
  return "Release";
#else
  return "Debug";
#endif
}

} // namespace edfio
