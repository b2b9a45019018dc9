// Copyright The biods Developers.

#include <biods/atomarray.hpp>
#include <biods/util.hpp>  // for in_vector, cat

namespace biods {

void AtomArray::reserve(size_t n) {
  coord.reserve(n);
  chain_id.reserve(n);
  res_id.reserve(n);
  ins_code.reserve(n);
  res_name.reserve(n);
  atom_name.reserve(n);
  element.reserve(n);
  hetero.reserve(n);
  label_asym_id.reserve(n);
  label_entity_id.reserve(n);
  occupancy.reserve(n);
  b_factor.reserve(n);
  charge.reserve(n);
  atom_id.reserve(n);
  restype_index.reserve(n);
  atomtype_index.reserve(n);
  res_index.reserve(n);
  mask.reserve(n);
}

void AtomArray::add_atom(const AtomRecord& rec) {
  coord.push_back(rec.pos);
  chain_id.push_back(rec.chain_id);
  res_id.push_back(rec.res_id);
  ins_code.push_back(rec.ins_code);
  res_name.push_back(rec.res_name);
  atom_name.push_back(rec.atom_name);
  element.push_back(rec.element);
  hetero.push_back(rec.hetero);
  label_asym_id.push_back(rec.label_asym_id);
  label_entity_id.push_back(rec.label_entity_id);
  occupancy.push_back(rec.occupancy);
  b_factor.push_back(rec.b_factor);
  charge.push_back(rec.charge);
  atom_id.push_back(rec.atom_id);
  restype_index.push_back(-1);
  atomtype_index.push_back(-1);
  res_index.push_back(-1);
  mask.push_back(rec.mask);
}

AtomRecord AtomArray::atom(size_t i) const {
  if (i >= size())
    throw std::out_of_range(cat("atom index ", i, " out of range, size ", size()));
  AtomRecord rec;
  rec.pos = coord[i];
  rec.chain_id = chain_id[i];
  rec.res_id = res_id[i];
  rec.ins_code = ins_code[i];
  rec.res_name = res_name[i];
  rec.atom_name = atom_name[i];
  rec.element = element[i];
  rec.hetero = hetero[i];
  rec.label_asym_id = label_asym_id[i];
  rec.label_entity_id = label_entity_id[i];
  rec.occupancy = occupancy[i];
  rec.b_factor = b_factor[i];
  rec.charge = charge[i];
  rec.atom_id = atom_id[i];
  rec.mask = mask[i];
  return rec;
}

void AtomArray::check_lengths() const {
  size_t n = size();
  if (chain_id.size() != n || res_id.size() != n || ins_code.size() != n ||
      res_name.size() != n || atom_name.size() != n || element.size() != n ||
      hetero.size() != n || label_asym_id.size() != n ||
      label_entity_id.size() != n || occupancy.size() != n ||
      b_factor.size() != n || charge.size() != n || atom_id.size() != n ||
      restype_index.size() != n || atomtype_index.size() != n ||
      res_index.size() != n || mask.size() != n)
    fail("AtomArray: columns have different lengths");
}

namespace {

template<typename T>
std::vector<T> take_column(const std::vector<T>& v, const std::vector<int>& indices) {
  std::vector<T> out;
  out.reserve(indices.size());
  for (int idx : indices)
    out.push_back(v[idx]);
  return out;
}

template<typename T>
void extend(std::vector<T>& dst, const std::vector<T>& src) {
  dst.insert(dst.end(), src.begin(), src.end());
}

} // anonymous namespace

AtomArray AtomArray::take(const std::vector<int>& indices) const {
  for (int idx : indices)
    if (idx < 0 || (size_t) idx >= size())
      throw std::out_of_range(cat("atom index ", idx, " out of range, size ", size()));
  AtomArray r;
  r.coord = take_column(coord, indices);
  r.chain_id = take_column(chain_id, indices);
  r.res_id = take_column(res_id, indices);
  r.ins_code = take_column(ins_code, indices);
  r.res_name = take_column(res_name, indices);
  r.atom_name = take_column(atom_name, indices);
  r.element = take_column(element, indices);
  r.hetero = take_column(hetero, indices);
  r.label_asym_id = take_column(label_asym_id, indices);
  r.label_entity_id = take_column(label_entity_id, indices);
  r.occupancy = take_column(occupancy, indices);
  r.b_factor = take_column(b_factor, indices);
  r.charge = take_column(charge, indices);
  r.atom_id = take_column(atom_id, indices);
  r.restype_index = take_column(restype_index, indices);
  r.atomtype_index = take_column(atomtype_index, indices);
  r.res_index = take_column(res_index, indices);
  r.mask = take_column(mask, indices);
  return r;
}

AtomArray AtomArray::select(const std::vector<bool>& keep) const {
  if (keep.size() != size())
    fail(cat("select(): mask length ", keep.size(), " != ", size(), " atoms"));
  std::vector<int> indices;
  for (size_t i = 0; i != keep.size(); ++i)
    if (keep[i])
      indices.push_back((int) i);
  return take(indices);
}

void AtomArray::append(const AtomArray& o) {
  extend(coord, o.coord);
  extend(chain_id, o.chain_id);
  extend(res_id, o.res_id);
  extend(ins_code, o.ins_code);
  extend(res_name, o.res_name);
  extend(atom_name, o.atom_name);
  extend(element, o.element);
  extend(hetero, o.hetero);
  extend(label_asym_id, o.label_asym_id);
  extend(label_entity_id, o.label_entity_id);
  extend(occupancy, o.occupancy);
  extend(b_factor, o.b_factor);
  extend(charge, o.charge);
  extend(atom_id, o.atom_id);
  extend(restype_index, o.restype_index);
  extend(atomtype_index, o.atomtype_index);
  extend(res_index, o.res_index);
  extend(mask, o.mask);
}

std::vector<int> AtomArray::residue_starts() const {
  std::vector<int> starts;
  for (size_t i = 0; i != size(); ++i)
    if (i == 0 || !same_residue(i - 1, i))
      starts.push_back((int) i);
  return starts;
}

std::vector<bool> AtomArray::residue_starts_mask() const {
  std::vector<bool> m(size(), false);
  for (size_t i = 0; i != size(); ++i)
    m[i] = i == 0 || !same_residue(i - 1, i);
  return m;
}

std::vector<int> AtomArray::atom_residue_indices() const {
  std::vector<int> out(size());
  int n = -1;
  for (size_t i = 0; i != size(); ++i) {
    if (i == 0 || !same_residue(i - 1, i))
      ++n;
    out[i] = n;
  }
  return out;
}

std::vector<std::string> AtomArray::chain_ids() const {
  std::vector<std::string> ids;
  for (size_t i = 0; i != size(); ++i)
    if ((i == 0 || chain_id[i] != chain_id[i-1]) && !in_vector(chain_id[i], ids))
      ids.push_back(chain_id[i]);
  return ids;
}

std::vector<bool> AtomArray::nan_mask() const {
  std::vector<bool> m(size());
  for (size_t i = 0; i != size(); ++i)
    m[i] = coord[i].has_nan();
  return m;
}

AtomArray concatenate(const std::vector<AtomArray>& arrays) {
  AtomArray r;
  size_t n = 0;
  for (const AtomArray& a : arrays)
    n += a.size();
  r.reserve(n);
  for (const AtomArray& a : arrays)
    r.append(a);
  return r;
}

bool FirstAltlocFilter::keep(const AtomRecord& rec, const std::string& altloc) {
  if (altloc.empty())
    return true;
  std::string key = cat(rec.chain_id, '\t', rec.res_id, '\t', rec.ins_code);
  auto it = first_altloc_.emplace(key, altloc).first;
  return it->second == altloc;
}

} // namespace biods
