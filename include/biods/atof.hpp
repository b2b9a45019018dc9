// Copyright The biods Developers.
//
// Functions that convert string to floating-point number ignoring locale.
// Wrappers around https://github.com/fastfloat/fast_float/

#ifndef BIODS_ATOF_HPP_
#define BIODS_ATOF_HPP_

#include <cstring>    // for strlen
#include <fast_float/fast_float.h>
#include "atox.hpp"   // for is_space

namespace biods {

using fast_float::from_chars_result;

inline from_chars_result fast_from_chars(const char* start, const char* end, double& d) {
  while (start < end && is_space(*start))
    ++start;
  if (start < end && *start == '+')
    ++start;
  return fast_float::from_chars(start, end, d);
}

inline from_chars_result fast_from_chars(const char* start, double& d) {
  return fast_from_chars(start, start + std::strlen(start), d);
}

} // namespace biods
#endif
