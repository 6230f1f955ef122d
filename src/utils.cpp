#include "edfio/utils.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <filesystem>
#include <iomanip>
#include <locale>
#include <sstream>
#include <stdexcept>

namespace edfio {

static inline bool is_space(char c) {
  return std::isspace(static_cast<unsigned char>(c)) != 0;
}

static inline bool is_digit(char c) {
  return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

std::string trim(const std::string& s) {
  size_t b = 0;
  while (b < s.size() && is_space(s[b])) ++b;
  size_t e = s.size();
  while (e > b && is_space(s[e - 1])) --e;
  return s.substr(b, e - b);
}

std::string to_lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

std::vector<std::string> split(const std::string& s, char delim) {
  std::vector<std::string> out;
  std::string cur;
  for (char c : s) {
    if (c == delim) {
      out.push_back(cur);
      cur.clear();
    } else {
      cur.push_back(c);
    }
  }
  out.push_back(cur);
  return out;
}

int to_int(const std::string& s) {
  try {
    const std::string t = trim(s);
    size_t idx = 0;
    int v = std::stoi(t, &idx, 10);
    if (idx == 0) throw std::invalid_argument("no digits");
    // Reject trailing garbage like "12abc" (trailing whitespace is already gone).
    if (idx != t.size()) throw std::invalid_argument("trailing characters");
    return v;
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to parse int from '" + s + "': " + e.what());
  }
}

long long to_long_long(const std::string& s) {
  try {
    const std::string t = trim(s);
    size_t idx = 0;
    long long v = std::stoll(t, &idx, 10);
    if (idx == 0) throw std::invalid_argument("no digits");
    if (idx != t.size()) throw std::invalid_argument("trailing characters");
    return v;
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to parse integer from '" + s + "': " + e.what());
  }
}

double to_double(const std::string& s) {
  try {
    const std::string t = trim(s);
    if (t.empty()) throw std::invalid_argument("empty");

    std::istringstream iss(t);
    iss.imbue(std::locale::classic());
    double v = 0.0;
    iss >> v;
    if (!iss) throw std::invalid_argument("invalid");
    iss >> std::ws;
    if (!iss.eof()) throw std::invalid_argument("trailing characters");
    return v;
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to parse double from '" + s + "': " + e.what());
  }
}

std::vector<int> extract_digit_groups(const std::string& s) {
  std::vector<int> out;
  size_t i = 0;
  while (i < s.size()) {
    if (!is_digit(s[i])) {
      ++i;
      continue;
    }
    size_t j = i;
    while (j < s.size() && is_digit(s[j])) ++j;
    out.push_back(to_int(s.substr(i, j - i)));
    i = j;
  }
  return out;
}

std::string pad_field(const std::string& s, size_t width) {
  std::string out = s;
  if (out.size() > width) out = out.substr(0, width);
  if (out.size() < width) out.append(width - out.size(), ' ');
  return out;
}

static std::string strip_fraction_zeros(std::string s) {
  if (s.find('.') != std::string::npos) {
    while (!s.empty() && s.back() == '0') s.pop_back();
    if (!s.empty() && s.back() == '.') s.pop_back();
  }
  return s;
}

std::string format_number_field(double v, size_t width) {
  for (int prec = 6; prec >= 0; --prec) {
    std::ostringstream oss;
    oss.imbue(std::locale::classic());
    oss.setf(std::ios::fixed);
    oss << std::setprecision(prec) << v;
    std::string s = strip_fraction_zeros(oss.str());
    if (s == "-0") s = "0";
    // A nonzero value must not be written as 0.
    if (s == "0" && v != 0.0) break;
    if (s.size() <= width) return s;
  }

  if (v != 0.0 && std::fabs(v) < 1.0) {
    for (int prec = 6; prec >= 0; --prec) {
      std::ostringstream oss;
      oss.imbue(std::locale::classic());
      oss.setf(std::ios::scientific);
      oss << std::setprecision(prec) << v;
      const std::string sci = oss.str();
      const size_t e = sci.find('e');
      const std::string s = strip_fraction_zeros(sci.substr(0, e)) + sci.substr(e);
      if (s.size() <= width) return s;
    }
  }

  std::string s = std::to_string(static_cast<long long>(std::llround(v)));
  if (s.size() > width) s = s.substr(0, width);
  return s;
}

std::string file_extension_lower(const std::string& path) {
  std::string ext = std::filesystem::u8path(path).extension().u8string();
  if (!ext.empty() && ext[0] == '.') ext.erase(ext.begin());
  return to_lower(ext);
}

bool file_exists(const std::string& path) {
  return std::filesystem::exists(std::filesystem::u8path(path));
}

} // namespace edfio
