// Copyright The biods Developers.
//
// Reading and writing ATOM/HETATM records of the PDB format.

#ifndef BIODS_PDB_HPP_
#define BIODS_PDB_HPP_

#include <ostream>
#include <string>
#include "atomarray.hpp"  // for AtomArray
#include "input.hpp"      // for AnyStream
#include "mmcif.hpp"      // for AtomSiteReadOptions

namespace biods {

/// Compares the first 4 characters of s and the record name, ignoring case.
/// "END" matches "END ", "END\n" and "END\r".
inline bool is_record_type(const char* s, const char* record) {
  for (int i = 0; i != 4; ++i) {
    char c = record[i];
    if (c == '\0')
      return s[i] == ' ' || s[i] == '\n' || s[i] == '\r' || s[i] == '\0';
    if ((s[i] & ~0x20) != (c & ~0x20))
      return false;
  }
  return true;
}

/// Options from AtomSiteReadOptions that apply: model, keep_hydrogens.
/// As in mmCIF, only the first altloc of each atom is read.
BIODS_DLL AtomArray read_pdb_from_stream(AnyStream& line_reader,
                                         const std::string& source,
                                         const AtomSiteReadOptions& options);
BIODS_DLL AtomArray read_pdb_file(const std::string& path,
                                  const AtomSiteReadOptions& options=AtomSiteReadOptions());
BIODS_DLL AtomArray read_pdb_string(const std::string& str,
                                    const AtomSiteReadOptions& options=AtomSiteReadOptions());

/// Writes ATOM/HETATM, TER and END records. Atoms with NaN coordinates
/// are skipped. Chain ids longer than 2 characters are an error.
BIODS_DLL void write_pdb(const AtomArray& atoms, std::ostream& os);
BIODS_DLL std::string make_pdb_string(const AtomArray& atoms);

} // namespace biods
#endif
