// Copyright The biods Developers.
//
// Biomolecule - a chain (or chains) of residues standardised against
// a ResidueDictionary: one slot for each expected heavy atom, in the
// dictionary order, with NaN coordinates and mask=false for missing atoms.
// BiomoleculeChain and BiomoleculeComplex.

#ifndef BIODS_BIOMOLECULE_HPP_
#define BIODS_BIOMOLECULE_HPP_

#include <cstdint>  // for int8_t
#include <string>
#include <utility>  // for pair
#include <vector>
#include "array2d.hpp"    // for Array2D
#include "atomarray.hpp"  // for AtomArray
#include "logger.hpp"     // for Logger
#include "mmcif.hpp"      // for AtomSiteReadOptions
#include "resdict.hpp"    // for ResidueDictionary

namespace biods {

struct BiomoleculeOptions {
  /// keep only the backbone atoms
  bool backbone_only = false;
  /// fail on residues that are not in the dictionary instead of dropping them
  bool raise_error_on_unexpected = false;
};

/// How NaN distances are filled in.
struct NanFill {
  enum Kind { None, Value, RowMax };
  Kind kind = None;
  double value = 0.;

  static NanFill none() { return NanFill(); }
  static NanFill with_value(double v) { NanFill f; f.kind = Value; f.value = v; return f; }
  /// the largest non-NaN distance in the same row
  static NanFill row_max() { NanFill f; f.kind = RowMax; return f; }
};

/// How distances between residues with several atoms are reduced.
enum class DistanceReduce { Min, Max };

/// Renames residues and atoms according to dictionary conversions.
BIODS_DLL void convert_residues(AtomArray& atoms, const ResidueDictionary& dict);
/// Drops atoms of residues that are not in the dictionary.
BIODS_DLL AtomArray filter_atoms(const AtomArray& atoms, const ResidueDictionary& dict,
                                 bool raise_error_on_unexpected);
/// Returns standardised atoms. Residues are grouped into chains by runs
/// of consecutive atoms with the same chain_id.
BIODS_DLL AtomArray standardise_atoms(const AtomArray& atoms,
                                      const ResidueDictionary& dict,
                                      bool backbone_only, const Logger& logger);

struct BIODS_DLL Biomolecule {
  AtomArray atoms;
  ResidueDictionary residue_dictionary;
  bool backbone_only = false;

  Biomolecule() = default;
  Biomolecule(const Biomolecule&) = default;
  Biomolecule(Biomolecule&&) = default;
  Biomolecule& operator=(const Biomolecule&) = default;
  Biomolecule& operator=(Biomolecule&&) = default;
  virtual ~Biomolecule() = default;
  /// Runs convert_residues(), filter_atoms() and standardise_atoms().
  Biomolecule(const AtomArray& input, const ResidueDictionary& dict,
              const BiomoleculeOptions& options=BiomoleculeOptions(),
              const Logger& logger=Logger());

  /// Wraps atoms that are already standardised with dict.
  static Biomolecule from_standardised(AtomArray atoms, const ResidueDictionary& dict,
                                       bool backbone_only=false);
  static Biomolecule from_file(const std::string& path, const ResidueDictionary& dict,
                               const BiomoleculeOptions& options=BiomoleculeOptions(),
                               const AtomSiteReadOptions& read_options=AtomSiteReadOptions(),
                               const Logger& logger=Logger());

  const std::vector<int>& residue_starts() const { return residue_starts_; }
  int num_residues() const { return (int) residue_starts_.size(); }
  /// number of residues (not atoms)
  size_t size() const { return residue_starts_.size(); }
  /// restype index of each residue
  std::vector<int> restype_index() const;
  std::string sequence() const;
  std::vector<bool> nan_mask() const { return atoms.nan_mask(); }
  std::vector<bool> backbone_mask() const;
  /// [begin, end) atom range of residue n
  std::pair<int, int> residue_range(int n) const;

  /// residues x atom_names; all atom_names must be backbone atoms
  virtual Array2D<Vec3> backbone_coords(const std::vector<std::string>& atom_names) const;
  Array2D<Vec3> backbone_coords() const {
    return backbone_coords(residue_dictionary.backbone_atoms);
  }
  /// Distances between residues selected by residue_mask_from (rows) and
  /// residue_mask_to (columns). Empty masks select all residues.
  /// With several atom names, the minimum (or maximum) of the distances
  /// between all atom pairs is taken, ignoring NaN coordinates.
  Array2D<double> distances(const std::vector<std::string>& atom_names,
                            const std::vector<bool>& residue_mask_from=std::vector<bool>(),
                            const std::vector<bool>& residue_mask_to=std::vector<bool>(),
                            NanFill nan_fill=NanFill(),
                            DistanceReduce reduce=DistanceReduce::Min) const;
  /// 1 where distance < threshold; NaN distances are filled with the row max
  Array2D<std::int8_t> contacts(const std::string& atom_name, double threshold) const;
  /// |i - j| for residue indices
  Array2D<int> residue_separations() const;

  /// atoms of the listed residues
  AtomArray take_residues(const std::vector<int>& residue_indices) const;
  Biomolecule backbone() const;
  /// residues [begin, end)
  Biomolecule slice_residues(int begin, int end) const;

  void to_pdb(const std::string& path) const;
  std::string to_pdb_string() const;
  void to_mmcif(const std::string& path, const std::string& name="biods") const;

protected:
  std::vector<int> residue_starts_;
  /// recomputes residue_starts_ from res_index
  void index_residues();
  Array2D<Vec3> select_atom_coords(const std::vector<std::string>& atom_names) const;
};

struct BIODS_DLL BiomoleculeChain : Biomolecule {
  BiomoleculeChain() = default;
  BiomoleculeChain(const AtomArray& input, const ResidueDictionary& dict,
                   const BiomoleculeOptions& options=BiomoleculeOptions(),
                   const Logger& logger=Logger());
  explicit BiomoleculeChain(Biomolecule&& mol);

  const std::string& chain_id() const;
};

struct BIODS_DLL BiomoleculeComplex : Biomolecule {
  BiomoleculeComplex() = default;
  /// chains are sorted by chain id
  explicit BiomoleculeComplex(std::vector<BiomoleculeChain> chains);

  /// Splits atoms by chain_id and standardises each chain.
  static BiomoleculeComplex from_atoms(const AtomArray& input, const ResidueDictionary& dict,
                                       const BiomoleculeOptions& options=BiomoleculeOptions(),
                                       const Logger& logger=Logger());

  const std::vector<std::string>& chain_ids() const { return chain_ids_; }
  const std::vector<BiomoleculeChain>& chains() const { return chains_; }
  const BiomoleculeChain& get_chain(const std::string& chain_id) const;

  /// Distances between residues of two chains (rows: first chain).
  /// chain_pair can be omitted (empty strings) if there are exactly 2 chains.
  Array2D<double> interface_distances(const std::vector<std::string>& atom_names,
                                      std::pair<std::string, std::string> chain_pair,
                                      NanFill nan_fill=NanFill()) const;
  /// Complex made of the residues of both chains that have a partner
  /// in the other chain closer than threshold.
  BiomoleculeComplex interface(const std::vector<std::string>& atom_names,
                               std::pair<std::string, std::string> chain_pair,
                               double threshold=10.0) const;

protected:
  std::vector<std::string> chain_ids_;
  std::vector<BiomoleculeChain> chains_;
  std::pair<std::string, std::string>
    resolve_chain_pair(std::pair<std::string, std::string> chain_pair) const;
  std::vector<bool> chain_residue_mask(const std::string& chain_id) const;
};

} // namespace biods
#endif
