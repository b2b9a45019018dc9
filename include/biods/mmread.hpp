// Copyright The biods Developers.
//
// Read atoms from any supported coordinate file:
// PDB, mmCIF or BinaryCIF, possibly gzipped.

#ifndef BIODS_MMREAD_HPP_
#define BIODS_MMREAD_HPP_

#include <string>
#include "atomarray.hpp"  // for AtomArray
#include "mmcif.hpp"      // for AtomSiteReadOptions

namespace biods {

enum class CoorFormat { Unknown, Pdb, Mmcif, Bcif };

/// The extension is checked after removing .gz.
BIODS_DLL CoorFormat coor_format_from_ext(const std::string& path);

BIODS_DLL AtomArray read_atoms_from_file(const std::string& path,
                                         const AtomSiteReadOptions& options=AtomSiteReadOptions(),
                                         CoorFormat format=CoorFormat::Unknown);

} // namespace biods
#endif
