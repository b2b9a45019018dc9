// Copyright The biods Developers.

#include <biods/biomolecule.hpp>
#include <algorithm>          // for sort
#include <cmath>              // for isnan
#include <cstdlib>            // for abs
#include <iostream>           // for cout
#include <biods/elem.hpp>     // for is_hydrogen
#include <biods/fstream.hpp>  // for Ofstream
#include <biods/mmread.hpp>   // for read_atoms_from_file
#include <biods/pdb.hpp>      // for write_pdb, make_pdb_string
#include <biods/to_cif.hpp>   // for write_cif_to_stream

namespace biods {

void convert_residues(AtomArray& atoms, const ResidueDictionary& dict) {
  for (const ResidueConversion& conv : dict.conversions)
    for (size_t i = 0; i != atoms.size(); ++i) {
      if (atoms.res_name[i] != conv.residue)
        continue;
      for (const auto& swap : conv.atom_swaps)
        if (atoms.atom_name[i] == swap.first) {
          atoms.atom_name[i] = swap.second;
          break;
        }
      atoms.res_name[i] = conv.to_residue;
    }
}

AtomArray filter_atoms(const AtomArray& atoms, const ResidueDictionary& dict,
                       bool raise_error_on_unexpected) {
  std::vector<bool> expected(atoms.size());
  std::vector<std::string> unexpected;
  for (size_t i = 0; i != atoms.size(); ++i) {
    expected[i] = dict.find_residue(atoms.res_name[i]) >= 0;
    if (!expected[i] && !in_vector(atoms.res_name[i], unexpected))
      unexpected.push_back(atoms.res_name[i]);
  }
  if (raise_error_on_unexpected && !unexpected.empty())
    fail("Found unexpected residues: ", join_str(unexpected, ' '), " in atom array");
  return atoms.select(expected);
}

AtomArray standardise_atoms(const AtomArray& input, const ResidueDictionary& dict,
                            bool backbone_only, const Logger& logger) {
  if (dict.residue_sizes.size() != dict.size())
    fail("ResidueDictionary is not set up");
  std::vector<bool> keep(input.size());
  for (size_t i = 0; i != input.size(); ++i)
    keep[i] = !is_hydrogen(input.element[i]) &&
              !(dict.drop_terminal_atom && !dict.terminal_atom.empty() &&
                input.atom_name[i] == dict.terminal_atom);
  AtomArray atoms = input.select(keep);

  std::vector<int> starts = atoms.residue_starts();
  size_t n_res = starts.size();
  starts.push_back((int) atoms.size());
  std::vector<int> restypes(n_res);
  for (size_t r = 0; r != n_res; ++r)
    restypes[r] = dict.resname_to_index(atoms.res_name[starts[r]]);

  AtomArray out;
  std::vector<bool> placed;
  std::vector<std::string> unexpected;
  int terminal = dict.terminal_atomtype();
  int res_counter = 0;
  for (size_t r = 0; r < n_res; ) {
    // a run of residues with the same chain_id
    size_t r_end = r + 1;
    while (r_end < n_res && atoms.chain_id[starts[r_end]] == atoms.chain_id[starts[r]])
      ++r_end;
    std::vector<int> sizes = dict.get_residue_sizes(
        std::vector<int>(restypes.begin() + r, restypes.begin() + r_end));
    for (size_t k = r; k != r_end; ++k, ++res_counter) {
      int restype = restypes[k];
      int size = sizes[k - r];
      int first = starts[k];
      const std::string& res_name = dict.residue_names[restype];
      size_t base = out.size();
      for (int j = 0; j != size; ++j) {
        AtomRecord rec;
        rec.chain_id = atoms.chain_id[first];
        rec.res_id = atoms.res_id[first];
        rec.ins_code = atoms.ins_code[first];
        rec.res_name = res_name;
        rec.atom_name = dict.atom_name(restype, j);
        rec.element = dict.atom_element(restype, j);
        rec.hetero = atoms.hetero[first];
        rec.label_asym_id = atoms.label_asym_id[first];
        rec.label_entity_id = atoms.label_entity_id[first];
        rec.occupancy = 0.f;
        rec.mask = false;
        out.add_atom(rec);
        out.restype_index.back() = restype;
        out.atomtype_index.back() = dict.atomtype_index(rec.atom_name);
        out.res_index.back() = res_counter;
        placed.push_back(false);
      }
      for (int i = first; i != starts[k + 1]; ++i) {
        const std::string& name = atoms.atom_name[i];
        int atomtype = dict.atomtype_index(name);
        int rel = dict.expected_relative_atom_index(restype, atomtype);
        if (rel == ResidueDictionary::UNEXPECTED) {
          if (atomtype == terminal && terminal >= 0) {
            if (size == dict.residue_sizes[restype]) {
              logger.note("dropped ", name, " from residue ", res_name, ' ',
                          atoms.res_id[i], " that does not end chain ", atoms.chain_id[i]);
              continue;
            }
            rel = dict.residue_sizes[restype];
          } else if (res_name == dict.unknown_residue_name || dict.is_leaving(name)) {
            logger.debug("dropped ", res_name, ' ', atoms.res_id[i], ' ', name);
            continue;
          } else {
            unexpected.push_back(cat(res_name, ' ', atoms.res_id[i], ' ', name));
            continue;
          }
        }
        size_t slot = base + rel;
        if (placed[slot]) {
          logger.debug("duplicated atom ", res_name, ' ', atoms.res_id[i], ' ', name);
          continue;
        }
        placed[slot] = true;
        out.coord[slot] = atoms.coord[i];
        out.occupancy[slot] = atoms.occupancy[i];
        out.b_factor[slot] = atoms.b_factor[i];
        out.charge[slot] = atoms.charge[i];
        out.atom_id[slot] = atoms.atom_id[i];
        out.mask[slot] = atoms.mask[i];
      }
    }
    r = r_end;
  }
  if (!unexpected.empty())
    fail("At least one unexpected atom detected in a residue: ",
         join_str(unexpected, '\n'), ".\nHETATMs are not supported.");

  std::vector<std::string> missing;
  for (size_t i = 0; i != out.size(); ++i)
    if (!placed[i])
      missing.push_back(cat(out.res_name[i], ' ', out.res_id[i], ' ', out.atom_name[i]));
  if (!missing.empty())
    logger.debug("Filled in ", missing.size(), " missing atoms:\n", join_str(missing, '\n'));

  if (backbone_only) {
    std::vector<bool> backbone(out.size());
    for (size_t i = 0; i != out.size(); ++i)
      backbone[i] = dict.is_backbone(out.atom_name[i]);
    out = out.select(backbone);
  }
  return out;
}

Biomolecule::Biomolecule(const AtomArray& input, const ResidueDictionary& dict,
                         const BiomoleculeOptions& options, const Logger& logger)
  : residue_dictionary(dict), backbone_only(options.backbone_only) {
  AtomArray converted = input;
  convert_residues(converted, dict);
  AtomArray filtered = filter_atoms(converted, dict, options.raise_error_on_unexpected);
  atoms = standardise_atoms(filtered, dict, options.backbone_only, logger);
  index_residues();
}

Biomolecule Biomolecule::from_standardised(AtomArray atoms, const ResidueDictionary& dict,
                                           bool backbone_only) {
  Biomolecule mol;
  mol.atoms = std::move(atoms);
  mol.atoms.check_lengths();
  mol.residue_dictionary = dict;
  mol.backbone_only = backbone_only;
  for (size_t i = 0; i != mol.atoms.size(); ++i) {
    if (mol.atoms.restype_index[i] < 0)
      mol.atoms.restype_index[i] = dict.resname_to_index(mol.atoms.res_name[i]);
    if (mol.atoms.atomtype_index[i] < 0)
      mol.atoms.atomtype_index[i] = dict.atomtype_index(mol.atoms.atom_name[i]);
  }
  mol.index_residues();
  return mol;
}

Biomolecule Biomolecule::from_file(const std::string& path, const ResidueDictionary& dict,
                                   const BiomoleculeOptions& options,
                                   const AtomSiteReadOptions& read_options,
                                   const Logger& logger) {
  return Biomolecule(read_atoms_from_file(path, read_options), dict, options, logger);
}

void Biomolecule::index_residues() {
  bool indexed = true;
  for (int idx : atoms.res_index)
    if (idx < 0) {
      indexed = false;
      break;
    }
  if (!indexed) {
    residue_starts_ = atoms.residue_starts();
    return;
  }
  residue_starts_.clear();
  for (size_t i = 0; i != atoms.size(); ++i)
    if (i == 0 || atoms.res_index[i] != atoms.res_index[i-1])
      residue_starts_.push_back((int) i);
}

std::vector<int> Biomolecule::restype_index() const {
  std::vector<int> v;
  v.reserve(residue_starts_.size());
  for (int start : residue_starts_)
    v.push_back(atoms.restype_index[start]);
  return v;
}

std::string Biomolecule::sequence() const {
  return residue_dictionary.decode_restype_index(restype_index());
}

std::vector<bool> Biomolecule::backbone_mask() const {
  std::vector<bool> m(atoms.size());
  for (size_t i = 0; i != atoms.size(); ++i)
    m[i] = residue_dictionary.is_backbone(atoms.atom_name[i]);
  return m;
}

std::pair<int, int> Biomolecule::residue_range(int n) const {
  if (n < 0 || n >= num_residues())
    throw std::out_of_range(cat("residue index ", n, " out of range, size ",
                                num_residues()));
  int end = n + 1 < num_residues() ? residue_starts_[n + 1] : (int) atoms.size();
  return {residue_starts_[n], end};
}

Array2D<Vec3> Biomolecule::select_atom_coords(const std::vector<std::string>& atom_names) const {
  Array2D<Vec3> coords(num_residues(), (int) atom_names.size(), Vec3::nan());
  for (int r = 0; r != num_residues(); ++r) {
    std::pair<int, int> range = residue_range(r);
    for (int i = range.first; i != range.second; ++i) {
      int idx = index_in_vector(atoms.atom_name[i], atom_names);
      if (idx >= 0)
        coords(r, idx) = atoms.coord[i];
    }
  }
  return coords;
}

Array2D<Vec3> Biomolecule::backbone_coords(const std::vector<std::string>& atom_names) const {
  for (const std::string& name : atom_names)
    if (!residue_dictionary.is_backbone(name))
      fail("Invalid entries in atom names: ", join_str(atom_names, ' '));
  return select_atom_coords(atom_names);
}

Array2D<double> Biomolecule::distances(const std::vector<std::string>& atom_names,
                                       const std::vector<bool>& residue_mask_from,
                                       const std::vector<bool>& residue_mask_to,
                                       NanFill nan_fill, DistanceReduce reduce) const {
  size_t n = size();
  if ((!residue_mask_from.empty() && residue_mask_from.size() != n) ||
      (!residue_mask_to.empty() && residue_mask_to.size() != n))
    fail("distances(): residue mask length differs from the number of residues");
  std::vector<int> from, to;
  for (size_t i = 0; i != n; ++i) {
    if (residue_mask_from.empty() || residue_mask_from[i])
      from.push_back((int) i);
    if (residue_mask_to.empty() || residue_mask_to[i])
      to.push_back((int) i);
  }
  Array2D<Vec3> coords = backbone_coords(atom_names);
  Array2D<double> dist((int) from.size(), (int) to.size(), nan_value());
  for (int i = 0; i != dist.rows; ++i)
    for (int j = 0; j != dist.cols; ++j) {
      double& d = dist(i, j);
      for (int a = 0; a != coords.cols; ++a)
        for (int b = 0; b != coords.cols; ++b) {
          double x = coords(from[i], a).dist(coords(to[j], b));
          if (std::isnan(x))
            continue;
          if (std::isnan(d) || (reduce == DistanceReduce::Min ? x < d : x > d))
            d = x;
        }
    }
  if (nan_fill.kind == NanFill::Value) {
    for (double& d : dist.data)
      if (std::isnan(d))
        d = nan_fill.value;
  } else if (nan_fill.kind == NanFill::RowMax) {
    for (int i = 0; i != dist.rows; ++i) {
      double row_max = nan_value();
      for (int j = 0; j != dist.cols; ++j)
        if (std::isnan(row_max) || dist(i, j) > row_max)
          row_max = dist(i, j);
      for (int j = 0; j != dist.cols; ++j)
        if (std::isnan(dist(i, j)))
          dist(i, j) = row_max;
    }
  }
  return dist;
}

Array2D<std::int8_t> Biomolecule::contacts(const std::string& atom_name,
                                           double threshold) const {
  Array2D<double> dist = distances({atom_name}, {}, {}, NanFill::row_max());
  Array2D<std::int8_t> result(dist.rows, dist.cols, 0);
  for (size_t i = 0; i != dist.data.size(); ++i)
    result.data[i] = dist.data[i] < threshold;
  return result;
}

Array2D<int> Biomolecule::residue_separations() const {
  int n = num_residues();
  Array2D<int> sep(n, n);
  for (int i = 0; i != n; ++i)
    for (int j = 0; j != n; ++j)
      sep(i, j) = std::abs(i - j);
  return sep;
}

AtomArray Biomolecule::take_residues(const std::vector<int>& residue_indices) const {
  std::vector<int> indices;
  for (int r : residue_indices) {
    std::pair<int, int> range = residue_range(r);
    for (int i = range.first; i != range.second; ++i)
      indices.push_back(i);
  }
  return atoms.take(indices);
}

Biomolecule Biomolecule::backbone() const {
  return from_standardised(atoms.select(backbone_mask()), residue_dictionary, true);
}

Biomolecule Biomolecule::slice_residues(int begin, int end) const {
  if (begin < 0 || end < begin || end > num_residues())
    throw std::out_of_range(cat("bad residue range ", begin, '-', end,
                                " for ", num_residues(), " residues"));
  std::vector<int> residues;
  for (int r = begin; r != end; ++r)
    residues.push_back(r);
  return from_standardised(take_residues(residues), residue_dictionary, backbone_only);
}

void Biomolecule::to_pdb(const std::string& path) const {
  Ofstream os(path, &std::cout);
  write_pdb(atoms, os.ref());
}

std::string Biomolecule::to_pdb_string() const {
  return make_pdb_string(atoms);
}

void Biomolecule::to_mmcif(const std::string& path, const std::string& name) const {
  cif::Document doc = make_mmcif_document(atoms, name);
  Ofstream os(path, &std::cout);
  write_cif_to_stream(os.ref(), doc);
}

namespace {

const AtomArray& single_chain(const AtomArray& atoms) {
  std::vector<std::string> ids = atoms.chain_ids();
  if (ids.size() > 1)
    fail("Expected single chain, found chain ids ", join_str(ids, ' '));
  return atoms;
}

} // anonymous namespace

BiomoleculeChain::BiomoleculeChain(const AtomArray& input, const ResidueDictionary& dict,
                                   const BiomoleculeOptions& options, const Logger& logger)
  : Biomolecule(single_chain(input), dict, options, logger) {}

BiomoleculeChain::BiomoleculeChain(Biomolecule&& mol) : Biomolecule(std::move(mol)) {
  single_chain(atoms);
}

const std::string& BiomoleculeChain::chain_id() const {
  if (atoms.empty())
    fail("chain_id(): the chain has no atoms");
  return atoms.chain_id[0];
}

BiomoleculeComplex::BiomoleculeComplex(std::vector<BiomoleculeChain> chains)
  : chains_(std::move(chains)) {
  std::sort(chains_.begin(), chains_.end(),
            [](const BiomoleculeChain& a, const BiomoleculeChain& b) {
              return a.chain_id() < b.chain_id();
            });
  int offset = 0;
  for (const BiomoleculeChain& chain : chains_) {
    if (in_vector(chain.chain_id(), chain_ids_))
      fail("Complex with duplicated chain ", chain.chain_id());
    chain_ids_.push_back(chain.chain_id());
    AtomArray copy = chain.atoms;
    for (int& idx : copy.res_index)
      idx = idx < 0 ? idx : idx + offset;
    atoms.append(copy);
    offset += chain.num_residues();
  }
  if (!chains_.empty()) {
    residue_dictionary = chains_[0].residue_dictionary;
    backbone_only = chains_[0].backbone_only;
  }
  index_residues();
}

BiomoleculeComplex BiomoleculeComplex::from_atoms(const AtomArray& input,
                                                  const ResidueDictionary& dict,
                                                  const BiomoleculeOptions& options,
                                                  const Logger& logger) {
  std::vector<std::string> ids = input.chain_ids();
  std::sort(ids.begin(), ids.end());
  std::vector<BiomoleculeChain> chains;
  for (const std::string& id : ids) {
    std::vector<bool> in_chain(input.size());
    for (size_t i = 0; i != input.size(); ++i)
      in_chain[i] = input.chain_id[i] == id;
    chains.emplace_back(input.select(in_chain), dict, options, logger);
    if (chains.back().atoms.empty()) {
      logger.note("chain ", id, " has no residues from the dictionary");
      chains.pop_back();
    }
  }
  return BiomoleculeComplex(std::move(chains));
}

const BiomoleculeChain& BiomoleculeComplex::get_chain(const std::string& chain_id) const {
  int idx = index_in_vector(chain_id, chain_ids_);
  if (idx < 0)
    fail("No chain ", chain_id, " in the complex");
  return chains_[idx];
}

std::pair<std::string, std::string>
BiomoleculeComplex::resolve_chain_pair(std::pair<std::string, std::string> chain_pair) const {
  if (chain_pair.first.empty() && chain_pair.second.empty()) {
    if (chain_ids_.size() != 2)
      fail("chain_pair must be specified for non-binary complexes");
    return {chain_ids_[0], chain_ids_[1]};
  }
  get_chain(chain_pair.first);
  get_chain(chain_pair.second);
  return chain_pair;
}

std::vector<bool> BiomoleculeComplex::chain_residue_mask(const std::string& chain_id) const {
  std::vector<bool> m(size());
  for (size_t r = 0; r != size(); ++r)
    m[r] = atoms.chain_id[residue_starts_[r]] == chain_id;
  return m;
}

Array2D<double>
BiomoleculeComplex::interface_distances(const std::vector<std::string>& atom_names,
                                        std::pair<std::string, std::string> chain_pair,
                                        NanFill nan_fill) const {
  chain_pair = resolve_chain_pair(chain_pair);
  return distances(atom_names, chain_residue_mask(chain_pair.first),
                   chain_residue_mask(chain_pair.second), nan_fill);
}

BiomoleculeComplex
BiomoleculeComplex::interface(const std::vector<std::string>& atom_names,
                              std::pair<std::string, std::string> chain_pair,
                              double threshold) const {
  chain_pair = resolve_chain_pair(chain_pair);
  std::vector<bool> mask_a = chain_residue_mask(chain_pair.first);
  std::vector<bool> mask_b = chain_residue_mask(chain_pair.second);
  Array2D<double> dist = distances(atom_names, mask_a, mask_b);
  std::vector<int> residues_a, residues_b;
  for (size_t r = 0; r != size(); ++r) {
    if (mask_a[r])
      residues_a.push_back((int) r);
    if (mask_b[r])
      residues_b.push_back((int) r);
  }
  std::vector<int> keep_a, keep_b;
  for (int i = 0; i != dist.rows; ++i)
    for (int j = 0; j != dist.cols; ++j)
      if (dist(i, j) < threshold) {
        keep_a.push_back(residues_a[i]);
        break;
      }
  for (int j = 0; j != dist.cols; ++j)
    for (int i = 0; i != dist.rows; ++i)
      if (dist(i, j) < threshold) {
        keep_b.push_back(residues_b[j]);
        break;
      }
  std::vector<BiomoleculeChain> chains;
  for (const std::vector<int>* keep : {&keep_a, &keep_b})
    if (!keep->empty())
      chains.emplace_back(from_standardised(take_residues(*keep),
                                            residue_dictionary, backbone_only));
  return BiomoleculeComplex(std::move(chains));
}

} // namespace biods
