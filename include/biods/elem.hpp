// Copyright The biods Developers.
//
// Element symbols. Elements are kept as strings (e.g. "C", "SE"),
// uppercase as in PDB files and the CCD.

#ifndef BIODS_ELEM_HPP_
#define BIODS_ELEM_HPP_

#include <string>
#include "util.hpp"  // for to_upper, trim_str

namespace biods {

inline std::string normalize_element(const std::string& symbol) {
  return to_upper(trim_str(symbol));
}

inline bool is_hydrogen(const std::string& element) {
  return element.size() == 1 && (element[0] == 'H' || element[0] == 'D' ||
                                 element[0] == 'h' || element[0] == 'd');
}

// Guesses the element from a PDB-style atom name when the element column
// is empty. In padded names (" CA ") the element is right-aligned in the
// first two characters; otherwise the first letter is taken.
inline std::string element_from_atom_name(const std::string& padded_name) {
  if (padded_name.size() >= 2 && padded_name[0] != ' ' &&
      padded_name[0] >= 'A' && padded_name[0] <= 'Z' &&
      padded_name[1] >= 'A' && padded_name[1] <= 'Z' && padded_name.size() == 4)
    return padded_name.substr(0, 2);
  for (char c : padded_name)
    if (c >= 'A' && c <= 'Z')
      return std::string(1, c);
  return "X";
}

} // namespace biods
#endif
