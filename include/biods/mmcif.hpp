// Copyright The biods Developers.
//
// Reading and writing the _atom_site category of mmCIF (text or
// decoded from BinaryCIF) to/from AtomArray.

#ifndef BIODS_MMCIF_HPP_
#define BIODS_MMCIF_HPP_

#include <string>
#include "atomarray.hpp"  // for AtomArray
#include "cifdoc.hpp"     // for Block, Document

namespace biods {

struct AtomSiteReadOptions {
  /// pdbx_PDB_model_num to read; 0 means the first model in the file
  int model = 0;
  /// auth_asym_id, auth_seq_id, auth_comp_id and auth_atom_id rather than
  /// label_*; missing author fields fall back to the label fields
  bool use_author_fields = true;
  /// if false, H and D atoms are skipped
  bool keep_hydrogens = true;
};

/// Only the first alternative location of each atom is read.
BIODS_DLL AtomArray read_atom_site(cif::Block& block,
                                   const AtomSiteReadOptions& options=AtomSiteReadOptions());

/// Reads atoms from the first block of the document that has _atom_site.
BIODS_DLL AtomArray make_atom_array(cif::Document& doc,
                                    const AtomSiteReadOptions& options=AtomSiteReadOptions());

/// Replaces _atom_site in the block. Atoms with NaN coordinates are
/// written with ? in place of coordinates.
BIODS_DLL void write_atom_site(const AtomArray& atoms, cif::Block& block);

BIODS_DLL cif::Document make_mmcif_document(const AtomArray& atoms,
                                            const std::string& name);

} // namespace biods
#endif
