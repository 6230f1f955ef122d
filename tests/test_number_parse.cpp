#include "edfio/utils.hpp"

#include "test_support.hpp"

#include <cmath>
#include <iostream>
#include <string>
#include <vector>

static bool nearly(double a, double b, double eps = 1e-12) {
  return std::fabs(a - b) <= eps;
}

int main() {
  using namespace edfio;

  // to_int() / to_long_long()
  assert(to_int("42") == 42);
  assert(to_int("  -10  ") == -10);
  assert(to_long_long("-1      ") == -1);
  assert(to_long_long("1234567890123") == 1234567890123LL);
  {
    bool threw = false;
    try {
      (void)to_int("12abc");
    } catch (const std::exception&) {
      threw = true;
    }
    assert(threw);
  }
  {
    bool threw = false;
    try {
      (void)to_long_long("        ");
    } catch (const std::exception&) {
      threw = true;
    }
    assert(threw);
  }

  // to_double()
  assert(nearly(to_double("1.25"), 1.25));
  assert(nearly(to_double("  -200    "), -200.0));
  assert(nearly(to_double("1e-3"), 0.001));
  {
    bool threw = false;
    try {
      (void)to_double("1.23abc");
    } catch (const std::exception&) {
      threw = true;
    }
    assert(threw);
  }

  // Date/time digit groups tolerate any separators.
  {
    const std::vector<int> g = extract_digit_groups("23.04.19");
    assert(g.size() == 3);
    assert(g[0] == 23 && g[1] == 4 && g[2] == 19);
  }
  {
    const std::vector<int> g = extract_digit_groups("7:5:9   ");
    assert(g.size() == 3);
    assert(g[0] == 7 && g[1] == 5 && g[2] == 9);
  }
  assert(extract_digit_groups("  .  .  ").empty());
  assert(extract_digit_groups("01.02").size() == 2);

  // Fixed-width fields: pad with spaces, truncate from the right.
  assert(pad_field("ab", 4) == "ab  ");
  assert(pad_field("abcdef", 4) == "abcd");
  assert(pad_field("", 3) == "   ");

  // Shortest decimal text that fits the field.
  assert(format_number_field(-200.0, 8) == "-200");
  assert(format_number_field(1.0, 8) == "1");
  assert(format_number_field(0.5, 8) == "0.5");
  assert(format_number_field(3.14159265, 8) == "3.141593");
  assert(format_number_field(-3.14159265, 8) == "-3.14159");
  assert(format_number_field(123456.789, 8) == "123456.8");
  assert(format_number_field(0.0, 8) == "0");
  assert(format_number_field(-0.0, 8) == "0");
  assert(format_number_field(0.000001, 8) == "0.000001");
  assert(format_number_field(-0.0000001, 8) == "-1e-07");
  assert(format_number_field(1e-7, 8) == "1e-07");
  assert(format_number_field(2.5e-9, 8) == "2.5e-09");
  assert(format_number_field(1.234567e-7, 8) == "1.23e-07");
  assert(to_double(format_number_field(1e-7, 8)) == 1e-7);
  assert(format_number_field(1234567890.0, 8).size() == 8);

  // Extensions
  assert(file_extension_lower("dir/rec.BDF") == "bdf");
  assert(file_extension_lower("rec.edf") == "edf");
  assert(file_extension_lower("noext").empty());

  {
    const std::vector<std::string> parts = split("1:0:255", ':');
    assert(parts.size() == 3);
    assert(parts[0] == "1" && parts[1] == "0" && parts[2] == "255");
  }

  std::cout << "Number parse tests passed.\n";
  return 0;
}
