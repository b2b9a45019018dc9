// Copyright The biods Developers.
//
// Reading numbers from CIF values. CIF numb can have a standard
// uncertainty in brackets, 1.23(8); mmCIF files do not use it, and here
// it is ignored.

#ifndef BIODS_NUMB_HPP_
#define BIODS_NUMB_HPP_

#include <string>
#include "atof.hpp"    // for fast_from_chars
#include "atox.hpp"    // for string_to_int
#include "cifdoc.hpp"  // for is_null, as_string
#include "math.hpp"    // for nan_value

namespace biods {
namespace cif {

inline double as_number(const std::string& s, double nan=nan_value()) {
  if (is_null(s) || s.empty())
    return nan;
  const char* start = s.c_str();
  const char* end = start + s.size();
  if (s[0] == '\'' || s[0] == '"') {
    ++start;
    --end;
  }
  double d = 0;
  auto result = fast_from_chars(start, end, d);
  if (result.ec != std::errc())
    return nan;
  if (result.ptr != end && *result.ptr != '(')
    return nan;
  return d;
}

inline int as_int(const std::string& str) {
  return string_to_int(as_string(str), true);
}

inline int as_int(const std::string& str, int null) {
  return is_null(str) ? null : as_int(str);
}

} // namespace cif
} // namespace biods
#endif
