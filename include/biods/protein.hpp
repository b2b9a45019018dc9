// Copyright The biods Developers.
//
// Protein chains and complexes: Biomolecule standardised with
// ProteinDictionary, plus protein-specific representations
// (CB coordinates, atom14 and atom37).

#ifndef BIODS_PROTEIN_HPP_
#define BIODS_PROTEIN_HPP_

#include "biomolecule.hpp"

namespace biods {

/// CB coordinates of each residue, CA for glycine
BIODS_DLL std::vector<Vec3> beta_carbon_coords(const Biomolecule& mol);
/// like Biomolecule::backbone_coords, but "CB" is also accepted
BIODS_DLL Array2D<Vec3> protein_backbone_coords(const Biomolecule& mol,
                                                const std::vector<std::string>& atom_names);
/// residues x 14, NaN where there is no atom
BIODS_DLL Array2D<Vec3> atom14_coords(const Biomolecule& mol);
/// residues x 37, NaN where there is no atom
BIODS_DLL Array2D<Vec3> atom37_coords(const Biomolecule& mol);

struct ProteinComplex;

struct BIODS_DLL ProteinChain : BiomoleculeChain {
  ProteinChain() = default;
  explicit ProteinChain(const AtomArray& input,
                        const ResidueDictionary& dict=ProteinDictionary(),
                        const BiomoleculeOptions& options=BiomoleculeOptions(),
                        const Logger& logger=Logger());
  explicit ProteinChain(Biomolecule&& mol) : BiomoleculeChain(std::move(mol)) {}

  using Biomolecule::backbone_coords;
  Array2D<Vec3> backbone_coords(const std::vector<std::string>& atom_names) const override {
    return protein_backbone_coords(*this, atom_names);
  }
  std::vector<Vec3> beta_carbon_coords() const { return biods::beta_carbon_coords(*this); }
  Array2D<Vec3> atom14_coords() const { return biods::atom14_coords(*this); }
  Array2D<Vec3> atom37_coords() const { return biods::atom37_coords(*this); }
  Array2D<std::int8_t> contacts(const std::string& atom_name="CA",
                                double threshold=8.0) const {
    return Biomolecule::contacts(atom_name, threshold);
  }
  ProteinComplex to_complex() const;
};

struct BIODS_DLL ProteinComplex : BiomoleculeComplex {
  ProteinComplex() = default;
  explicit ProteinComplex(std::vector<BiomoleculeChain> chains)
    : BiomoleculeComplex(std::move(chains)) {}
  explicit ProteinComplex(BiomoleculeComplex&& complex)
    : BiomoleculeComplex(std::move(complex)) {}

  /// chains in alphabetical order, each standardised separately
  static ProteinComplex from_atoms(const AtomArray& input,
                                   const ResidueDictionary& dict=ProteinDictionary(),
                                   const BiomoleculeOptions& options=BiomoleculeOptions(),
                                   const Logger& logger=Logger());

  ProteinChain get_chain(const std::string& chain_id) const {
    return ProteinChain(Biomolecule(BiomoleculeComplex::get_chain(chain_id)));
  }
  ProteinComplex interface(const std::vector<std::string>& atom_names,
                           std::pair<std::string, std::string> chain_pair,
                           double threshold=10.0) const {
    return ProteinComplex(BiomoleculeComplex::interface(atom_names, chain_pair, threshold));
  }

  using Biomolecule::backbone_coords;
  Array2D<Vec3> backbone_coords(const std::vector<std::string>& atom_names) const override {
    return protein_backbone_coords(*this, atom_names);
  }
  std::vector<Vec3> beta_carbon_coords() const { return biods::beta_carbon_coords(*this); }
  Array2D<Vec3> atom14_coords() const { return biods::atom14_coords(*this); }
  Array2D<Vec3> atom37_coords() const { return biods::atom37_coords(*this); }
  Array2D<std::int8_t> contacts(const std::string& atom_name="CA",
                                double threshold=8.0) const {
    return Biomolecule::contacts(atom_name, threshold);
  }
};

} // namespace biods
#endif
