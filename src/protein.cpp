// Copyright The biods Developers.

#include <biods/protein.hpp>

namespace biods {

std::vector<Vec3> beta_carbon_coords(const Biomolecule& mol) {
  std::vector<Vec3> coords(mol.num_residues(), Vec3::nan());
  for (int r = 0; r != mol.num_residues(); ++r) {
    std::pair<int, int> range = mol.residue_range(r);
    const char* name = mol.atoms.res_name[range.first] == "GLY" ? "CA" : "CB";
    for (int i = range.first; i != range.second; ++i)
      if (mol.atoms.atom_name[i] == name) {
        coords[r] = mol.atoms.coord[i];
        break;
      }
  }
  return coords;
}

Array2D<Vec3> protein_backbone_coords(const Biomolecule& mol,
                                      const std::vector<std::string>& atom_names) {
  std::vector<std::string> other_names;
  for (const std::string& name : atom_names) {
    if (name == "CB")
      continue;
    if (!mol.residue_dictionary.is_backbone(name))
      fail("Invalid entries in atom names: ", join_str(atom_names, ' '));
    other_names.push_back(name);
  }
  Array2D<Vec3> others = mol.Biomolecule::backbone_coords(other_names);
  if (other_names.size() == atom_names.size())
    return others;
  std::vector<Vec3> cb = beta_carbon_coords(mol);
  Array2D<Vec3> coords(mol.num_residues(), (int) atom_names.size());
  for (int r = 0; r != coords.rows; ++r) {
    int k = 0;
    for (int j = 0; j != coords.cols; ++j)
      coords(r, j) = atom_names[j] == "CB" ? cb[r] : others(r, k++);
  }
  return coords;
}

Array2D<Vec3> atom14_coords(const Biomolecule& mol) {
  const ResidueDictionary& dict = mol.residue_dictionary;
  if (!is_atom14_compatible(dict) || !is_atom37_compatible(dict))
    fail("Atom14 representation assumes use of standard amino acid dictionary");
  Array2D<Vec3> coords(mol.num_residues(), 14, Vec3::nan());
  for (int r = 0; r != mol.num_residues(); ++r) {
    std::pair<int, int> range = mol.residue_range(r);
    for (int i = range.first; i != range.second; ++i) {
      int rel = dict.expected_relative_atom_index(mol.atoms.restype_index[i],
                                                  mol.atoms.atomtype_index[i]);
      // the terminal OXT has no atom14 slot
      if (rel >= 0 && rel < 14)
        coords(r, rel) = mol.atoms.coord[i];
    }
  }
  return coords;
}

Array2D<Vec3> atom37_coords(const Biomolecule& mol) {
  if (!is_atom37_compatible(mol.residue_dictionary))
    fail("Atom37 representation assumes use of standard amino acid dictionary");
  std::vector<std::string> types = atom37_types();
  Array2D<Vec3> coords(mol.num_residues(), (int) types.size(), Vec3::nan());
  for (int r = 0; r != mol.num_residues(); ++r) {
    std::pair<int, int> range = mol.residue_range(r);
    for (int i = range.first; i != range.second; ++i) {
      int idx = index_in_vector(mol.atoms.atom_name[i], types);
      if (idx >= 0)
        coords(r, idx) = mol.atoms.coord[i];
    }
  }
  return coords;
}

ProteinChain::ProteinChain(const AtomArray& input, const ResidueDictionary& dict,
                           const BiomoleculeOptions& options, const Logger& logger)
  : BiomoleculeChain(input, dict, options, logger) {}

ProteinComplex ProteinChain::to_complex() const {
  return ProteinComplex(std::vector<BiomoleculeChain>(1, *this));
}

ProteinComplex ProteinComplex::from_atoms(const AtomArray& input,
                                          const ResidueDictionary& dict,
                                          const BiomoleculeOptions& options,
                                          const Logger& logger) {
  return ProteinComplex(BiomoleculeComplex::from_atoms(input, dict, options, logger));
}

} // namespace biods
