// Copyright The biods Developers.
//
// ResidueDictionary - the set of residues (and their standard heavy
// atoms, in a fixed order) that a standardised biomolecule may contain.
// Presets for protein, DNA and RNA, dictionaries built from the CCD
// residue dictionary file, and JSON (de)serialization.

#ifndef BIODS_RESDICT_HPP_
#define BIODS_RESDICT_HPP_

#include <string>
#include <utility>  // for pair
#include <vector>
#include "fail.hpp"  // for BIODS_DLL

namespace biods {

/// Residue renamed during standardisation, e.g. MSE -> MET with SE -> SD.
struct ResidueConversion {
  std::string residue;
  std::string to_residue;
  std::vector<std::pair<std::string, std::string>> atom_swaps;
};

struct BIODS_DLL ResidueDictionary {
  /// value of get_expected_relative_atom_indices() for unexpected atoms
  static constexpr int UNEXPECTED = -100;

  std::vector<std::string> residue_names;        // three-letter codes
  std::string residue_types;                     // one-letter codes
  std::vector<std::string> atom_types;           // all atom names
  std::vector<std::vector<std::string>> residue_atoms;
  std::vector<std::vector<std::string>> residue_elements;
  std::vector<std::string> backbone_atoms;
  std::string unknown_residue_name;              // empty if none
  std::vector<ResidueConversion> conversions;
  /// Atom expected only at the end of a chain (OXT in proteins).
  /// It gets an extra slot after the last residue of each chain.
  std::string terminal_atom;
  /// If set, terminal_atom is removed from the input instead.
  bool drop_terminal_atom = false;
  /// Atoms that are removed silently when they are not standard atoms
  /// of the residue (e.g. OP3 when the leaving atoms are not kept).
  std::vector<std::string> leaving_atoms;

  // derived tables, filled by setup()
  std::vector<int> residue_sizes;
  int max_residue_size = 0;
  /// residue_names.size() x max_residue_size, padded with ""
  std::vector<std::string> standard_atoms_by_residue;
  /// residue_names.size() x atom_types.size(), UNEXPECTED if absent
  std::vector<int> relative_atom_indices;

  /// Checks consistency and computes the derived tables. Atom names
  /// missing from atom_types are appended to it.
  void setup();

  size_t size() const { return residue_names.size(); }

  int find_residue(const std::string& res_name) const;
  /// Unknown names are mapped to unknown_residue_name (fails if it is empty).
  int resname_to_index(const std::string& res_name) const;
  std::vector<int> resname_to_index(const std::vector<std::string>& res_names) const;
  std::string decode_restype_index(const std::vector<int>& restype_index) const;

  /// -1 if atom_name is not in atom_types
  int atomtype_index(const std::string& atom_name) const;
  std::vector<int> atomtype_index(const std::vector<std::string>& atom_names) const;
  bool is_backbone(const std::string& atom_name) const;
  bool is_leaving(const std::string& atom_name) const;
  int terminal_atomtype() const {
    return terminal_atom.empty() ? -1 : atomtype_index(terminal_atom);
  }

  /// Number of atom slots per residue of a single chain. The last residue
  /// gets an extra slot if terminal_atom is used.
  std::vector<int> get_residue_sizes(const std::vector<int>& restype_index) const;

  int expected_relative_atom_index(int restype, int atomtype) const {
    if (atomtype < 0)
      return UNEXPECTED;
    return relative_atom_indices[(size_t)restype * atom_types.size() + atomtype];
  }
  std::vector<int> get_expected_relative_atom_indices(const std::vector<int>& restype_index,
                                                      const std::vector<int>& atomtype_index) const;

  /// Name of the atom in slot relative_atom_index. The slot after
  /// the standard atoms is the terminal atom.
  const std::string& atom_name(int restype, int relative_atom_index) const;
  std::string atom_element(int restype, int relative_atom_index) const;
  std::vector<std::string> get_atom_names(const std::vector<int>& restype_index,
                                          const std::vector<int>& relative_atom_index) const;

  /// presets: "protein", "dna" or "rna"
  static ResidueDictionary from_preset(const std::string& name, bool keep_oxt=false);
  /// Builds a dictionary from ccd_residue_dictionary.json. Leaving atoms
  /// (e.g. OXT, OP3) are left out of the standard atoms unless keep_leaving.
  static ResidueDictionary from_ccd_json(const std::string& path,
                                         const std::vector<std::string>& residue_names,
                                         bool keep_leaving=false,
                                         const std::string& unknown_residue_name="");

  std::string to_json() const;
  static ResidueDictionary from_json(const std::string& json,
                                     const std::string& source="json");
};

/// no residue has more than 14 standard atoms
BIODS_DLL bool is_atom14_compatible(const ResidueDictionary& dict);
/// all standard atoms belong to the 37 atom types
BIODS_DLL bool is_atom37_compatible(const ResidueDictionary& dict);

/// The 20 standard amino acids and UNK in the atom14 order,
/// with the 37 atom types of the atom37 representation.
struct BIODS_DLL ProteinDictionary : ResidueDictionary {
  explicit ProteinDictionary(bool drop_oxt=false);

  bool drop_oxt() const { return drop_terminal_atom; }
  bool atom14_compatible() const { return is_atom14_compatible(*this); }
  bool atom37_compatible() const { return is_atom37_compatible(*this); }
};

BIODS_DLL std::vector<std::string> atom37_types();

} // namespace biods
#endif
