// Copyright The biods Developers.
//
// Locale-independent conversion of strings to integers,
// used for fixed-column PDB fields and CIF numbers.

#ifndef BIODS_ATOX_HPP_
#define BIODS_ATOX_HPP_

#include <stdexcept>  // for invalid_argument
#include <string>

namespace biods {

// std::isspace for the C locale
inline bool is_space(char c) {
  return c == ' ' || (c >= '\t' && c <= '\r');
}

// Parses an optionally signed decimal integer surrounded by optional
// whitespace. With length != 0 only the first length chars are read.
// If checked, anything else than the number throws std::invalid_argument.
// No checking for overflow.
inline int string_to_int(const char* p, bool checked, size_t length=0) {
  size_t end = length != 0 ? length : std::string::npos;
  auto more = [&](size_t i) { return i < end && p[i] != '\0'; };
  size_t i = 0;
  while (more(i) && is_space(p[i]))
    ++i;
  bool negative = more(i) && p[i] == '-';
  if (more(i) && (p[i] == '-' || p[i] == '+'))
    ++i;
  size_t digits_start = i;
  // accumulated as negative, to reach INT_MIN
  int n = 0;
  for (; more(i) && p[i] >= '0' && p[i] <= '9'; ++i)
    n = n * 10 - (p[i] - '0');
  bool has_digits = i != digits_start;
  if (checked) {
    while (more(i) && is_space(p[i]))
      ++i;
    if (!has_digits || more(i))
      throw std::invalid_argument("not an integer: " +
                                  (length != 0 ? std::string(p, length) : std::string(p)));
  }
  return negative ? n : -n;
}

inline int string_to_int(const std::string& str, bool checked) {
  return string_to_int(str.c_str(), checked);
}

} // namespace biods
#endif
