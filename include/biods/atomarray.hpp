// Copyright The biods Developers.
//
// AtomArray - a flat, column-oriented list of atoms, as used for
// building ML datasets. Each per-atom property is a separate vector.

#ifndef BIODS_ATOMARRAY_HPP_
#define BIODS_ATOMARRAY_HPP_

#include <string>
#include <unordered_map>
#include <vector>
#include "fail.hpp"   // for BIODS_DLL
#include "math.hpp"   // for Vec3

namespace biods {

/// A single atom, used to add atoms to AtomArray and to read them back.
struct AtomRecord {
  Vec3 pos = Vec3::nan();
  std::string chain_id;
  int res_id = 0;
  char ins_code = ' ';   // ' ' = no insertion code
  std::string res_name;
  std::string atom_name;
  std::string element;
  bool hetero = false;
  std::string label_asym_id;
  std::string label_entity_id;
  float occupancy = 1.0f;
  float b_factor = 0.0f;
  int charge = 0;
  int atom_id = 0;
  bool mask = true;
};

struct BIODS_DLL AtomArray {
  std::vector<Vec3> coord;
  std::vector<std::string> chain_id;
  std::vector<int> res_id;
  std::vector<char> ins_code;
  std::vector<std::string> res_name;
  std::vector<std::string> atom_name;
  std::vector<std::string> element;
  std::vector<bool> hetero;
  std::vector<std::string> label_asym_id;
  std::vector<std::string> label_entity_id;
  std::vector<float> occupancy;
  std::vector<float> b_factor;
  std::vector<int> charge;
  std::vector<int> atom_id;
  // set during standardisation, -1 when unknown
  std::vector<int> restype_index;
  std::vector<int> atomtype_index;
  std::vector<int> res_index;
  /// true if the atom was observed (false for atoms filled in as NaN)
  std::vector<bool> mask;

  size_t size() const { return coord.size(); }
  bool empty() const { return coord.empty(); }
  void reserve(size_t n);
  void add_atom(const AtomRecord& rec);
  AtomRecord atom(size_t i) const;

  /// throws if columns have different lengths
  void check_lengths() const;

  AtomArray select(const std::vector<bool>& keep) const;
  AtomArray take(const std::vector<int>& indices) const;
  void append(const AtomArray& other);

  bool same_residue(size_t i, size_t j) const {
    return chain_id[i] == chain_id[j] && res_id[i] == res_id[j] &&
           ins_code[i] == ins_code[j] && res_name[i] == res_name[j];
  }
  /// Indices of the first atom of each residue. A new residue begins
  /// when chain_id, res_id, ins_code or res_name changes.
  std::vector<int> residue_starts() const;
  std::vector<bool> residue_starts_mask() const;
  /// residue index of each atom (0-based, consecutive)
  std::vector<int> atom_residue_indices() const;
  /// chain ids in order of first appearance
  std::vector<std::string> chain_ids() const;
  /// true for atoms with NaN coordinates
  std::vector<bool> nan_mask() const;
};

/// Selects alternative conformations while reading: atoms without altloc
/// are kept and in each residue (chain, res_id, ins_code) only atoms with
/// the altloc that comes first in this residue. Residue names are not
/// compared, so with microheterogeneity only the first residue is kept.
class BIODS_DLL FirstAltlocFilter {
public:
  bool keep(const AtomRecord& rec, const std::string& altloc);
private:
  std::unordered_map<std::string, std::string> first_altloc_;
};

BIODS_DLL AtomArray concatenate(const std::vector<AtomArray>& arrays);

} // namespace biods
#endif
