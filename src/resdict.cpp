// Copyright The biods Developers.

#include <biods/resdict.hpp>
#include <algorithm>  // for max
#include <map>
#include <nlohmann/json.hpp>
#include <biods/ccd.hpp>    // for read_ccd_dictionary
#include <biods/elem.hpp>   // for element_from_atom_name
#include <biods/util.hpp>   // for index_in_vector, in_vector, to_upper

namespace biods {

constexpr int ResidueDictionary::UNEXPECTED;

namespace {

struct ResidueAtoms {
  const char* name;
  char code;
  const char* atoms;  // space-separated
};

// standard heavy atoms in the CCD order, which is also the atom14 order
const ResidueAtoms amino_acids[] = {
  {"ALA", 'A', "N CA C O CB"},
  {"ARG", 'R', "N CA C O CB CG CD NE CZ NH1 NH2"},
  {"ASN", 'N', "N CA C O CB CG OD1 ND2"},
  {"ASP", 'D', "N CA C O CB CG OD1 OD2"},
  {"CYS", 'C', "N CA C O CB SG"},
  {"GLN", 'Q', "N CA C O CB CG CD OE1 NE2"},
  {"GLU", 'E', "N CA C O CB CG CD OE1 OE2"},
  {"GLY", 'G', "N CA C O"},
  {"HIS", 'H', "N CA C O CB CG ND1 CD2 CE1 NE2"},
  {"ILE", 'I', "N CA C O CB CG1 CG2 CD1"},
  {"LEU", 'L', "N CA C O CB CG CD1 CD2"},
  {"LYS", 'K', "N CA C O CB CG CD CE NZ"},
  {"MET", 'M', "N CA C O CB CG SD CE"},
  {"PHE", 'F', "N CA C O CB CG CD1 CD2 CE1 CE2 CZ"},
  {"PRO", 'P', "N CA C O CB CG CD"},
  {"SER", 'S', "N CA C O CB OG"},
  {"THR", 'T', "N CA C O CB OG1 CG2"},
  {"TRP", 'W', "N CA C O CB CG CD1 CD2 NE1 CE2 CE3 CZ2 CZ3 CH2"},
  {"TYR", 'Y', "N CA C O CB CG CD1 CD2 CE1 CE2 CZ OH"},
  {"VAL", 'V', "N CA C O CB CG1 CG2"},
  {"UNK", 'X', "N CA C O"},
};

const char* const atom37 =
  "N CA C CB O CG CG1 CG2 OG OG1 SG CD CD1 CD2 ND1 ND2 OD1 OD2 SD CE CE1 CE2 "
  "CE3 NE NE1 NE2 OE1 OE2 CH2 NH1 NH2 OH CZ CZ2 CZ3 NZ OXT";

// OP3 (the 5' leaving atom) comes first, as in the CCD
const ResidueAtoms deoxynucleotides[] = {
  {"DA", 'A', "OP3 P OP1 OP2 O5' C5' C4' O4' C3' O3' C2' C1' "
              "N9 C8 N7 C5 C6 N6 N1 C2 N3 C4"},
  {"DC", 'C', "OP3 P OP1 OP2 O5' C5' C4' O4' C3' O3' C2' C1' "
              "N1 C2 O2 N3 C4 N4 C5 C6"},
  {"DG", 'G', "OP3 P OP1 OP2 O5' C5' C4' O4' C3' O3' C2' C1' "
              "N9 C8 N7 C5 C6 O6 N1 C2 N2 N3 C4"},
  {"DT", 'T', "OP3 P OP1 OP2 O5' C5' C4' O4' C3' O3' C2' C1' "
              "N1 C2 O2 N3 C4 O4 C5 C7 C6"},
  {"DN", 'N', "OP3 P OP1 OP2 O5' C5' C4' O4' C3' O3' C2' C1'"},
};

const ResidueAtoms ribonucleotides[] = {
  {"A", 'A', "OP3 P OP1 OP2 O5' C5' C4' O4' C3' O3' C2' O2' C1' "
             "N9 C8 N7 C5 C6 N6 N1 C2 N3 C4"},
  {"C", 'C', "OP3 P OP1 OP2 O5' C5' C4' O4' C3' O3' C2' O2' C1' "
             "N1 C2 O2 N3 C4 N4 C5 C6"},
  {"G", 'G', "OP3 P OP1 OP2 O5' C5' C4' O4' C3' O3' C2' O2' C1' "
             "N9 C8 N7 C5 C6 O6 N1 C2 N2 N3 C4"},
  {"U", 'U', "OP3 P OP1 OP2 O5' C5' C4' O4' C3' O3' C2' O2' C1' "
             "N1 C2 O2 N3 C4 O4 C5 C6"},
  {"N", 'N', "OP3 P OP1 OP2 O5' C5' C4' O4' C3' O3' C2' O2' C1'"},
};

const char* const nucleic_backbone = "P O5' C5' C4' C3' O3'";

template<size_t N>
void add_residues(ResidueDictionary& dict, const ResidueAtoms (&table)[N],
                  const std::string& leaving) {
  for (const ResidueAtoms& res : table) {
    dict.residue_names.emplace_back(res.name);
    dict.residue_types += res.code;
    std::vector<std::string> atoms;
    std::vector<std::string> elements;
    for (const std::string& atom : split_str_multi(res.atoms, " "))
      if (atom != leaving) {
        atoms.push_back(atom);
        elements.push_back(element_from_atom_name(atom));
      }
    dict.residue_atoms.push_back(std::move(atoms));
    dict.residue_elements.push_back(std::move(elements));
  }
}

bool all_types_contain(const std::vector<CcdDictionaryEntry>& entries, const char* word) {
  for (const CcdDictionaryEntry& e : entries)
    if (to_upper(e.type).find(word) == std::string::npos)
      return false;
  return !entries.empty();
}

} // anonymous namespace

void ResidueDictionary::setup() {
  size_t n = residue_names.size();
  if (residue_types.size() != n)
    fail("residue_types has ", residue_types.size(), " codes for ", n, " residues");
  if (residue_atoms.size() != n)
    fail("residue_atoms given for ", residue_atoms.size(), " of ", n, " residues");
  if (residue_elements.empty())
    for (const std::vector<std::string>& atoms : residue_atoms) {
      residue_elements.emplace_back();
      for (const std::string& atom : atoms)
        residue_elements.back().push_back(element_from_atom_name(atom));
    }
  if (residue_elements.size() != n)
    fail("residue_elements given for ", residue_elements.size(), " of ", n, " residues");
  if (!unknown_residue_name.empty() && find_residue(unknown_residue_name) < 0)
    fail("unknown residue ", unknown_residue_name, " is not in the dictionary");

  residue_sizes.clear();
  max_residue_size = 0;
  for (size_t i = 0; i != n; ++i) {
    const std::vector<std::string>& atoms = residue_atoms[i];
    if (residue_elements[i].size() != atoms.size())
      fail("residue ", residue_names[i], ": atoms and elements differ in length");
    for (const std::string& atom : atoms)
      if (!in_vector(atom, atom_types))
        atom_types.push_back(atom);
    residue_sizes.push_back((int) atoms.size());
    max_residue_size = std::max(max_residue_size, (int) atoms.size());
  }
  if (!terminal_atom.empty() && !in_vector(terminal_atom, atom_types))
    atom_types.push_back(terminal_atom);

  standard_atoms_by_residue.assign(n * max_residue_size, std::string());
  relative_atom_indices.assign(n * atom_types.size(), UNEXPECTED);
  for (size_t i = 0; i != n; ++i)
    for (size_t j = 0; j != residue_atoms[i].size(); ++j) {
      const std::string& atom = residue_atoms[i][j];
      standard_atoms_by_residue[i * max_residue_size + j] = atom;
      int& rel = relative_atom_indices[i * atom_types.size() + atomtype_index(atom)];
      if (rel != UNEXPECTED)
        fail("residue ", residue_names[i], ": duplicated atom ", atom);
      rel = (int) j;
    }
}

int ResidueDictionary::find_residue(const std::string& res_name) const {
  return index_in_vector(res_name, residue_names);
}

int ResidueDictionary::resname_to_index(const std::string& res_name) const {
  int idx = find_residue(res_name);
  if (idx < 0) {
    if (unknown_residue_name.empty())
      fail("Residue ", res_name, " not in the dictionary, which has no unknown residue");
    idx = find_residue(unknown_residue_name);
  }
  return idx;
}

std::vector<int>
ResidueDictionary::resname_to_index(const std::vector<std::string>& res_names) const {
  std::vector<int> indices;
  indices.reserve(res_names.size());
  for (const std::string& name : res_names)
    indices.push_back(resname_to_index(name));
  return indices;
}

std::string ResidueDictionary::decode_restype_index(const std::vector<int>& restype_index) const {
  std::string seq;
  seq.reserve(restype_index.size());
  for (int idx : restype_index)
    seq += residue_types.at(idx);
  return seq;
}

int ResidueDictionary::atomtype_index(const std::string& atom_name) const {
  return index_in_vector(atom_name, atom_types);
}

std::vector<int>
ResidueDictionary::atomtype_index(const std::vector<std::string>& atom_names) const {
  std::vector<int> indices;
  indices.reserve(atom_names.size());
  for (const std::string& name : atom_names)
    indices.push_back(atomtype_index(name));
  return indices;
}

bool ResidueDictionary::is_backbone(const std::string& atom_name) const {
  return in_vector(atom_name, backbone_atoms);
}

bool ResidueDictionary::is_leaving(const std::string& atom_name) const {
  return in_vector(atom_name, leaving_atoms);
}

std::vector<int>
ResidueDictionary::get_residue_sizes(const std::vector<int>& restype_index) const {
  std::vector<int> sizes;
  sizes.reserve(restype_index.size());
  for (int idx : restype_index)
    sizes.push_back(residue_sizes.at(idx));
  if (!sizes.empty() && !terminal_atom.empty() && !drop_terminal_atom)
    sizes.back() += 1;
  return sizes;
}

std::vector<int>
ResidueDictionary::get_expected_relative_atom_indices(const std::vector<int>& restype_index,
                                                      const std::vector<int>& atomtype_index) const {
  if (restype_index.size() != atomtype_index.size())
    fail("get_expected_relative_atom_indices: arrays differ in length");
  int terminal = terminal_atomtype();
  std::vector<int> indices(restype_index.size());
  for (size_t i = 0; i != indices.size(); ++i) {
    int rel = expected_relative_atom_index(restype_index[i], atomtype_index[i]);
    if (rel == UNEXPECTED && atomtype_index[i] == terminal && terminal >= 0)
      rel = residue_sizes[restype_index[i]];
    indices[i] = rel;
  }
  return indices;
}

const std::string& ResidueDictionary::atom_name(int restype, int relative_atom_index) const {
  int size = residue_sizes.at(restype);
  if (relative_atom_index >= 0 && relative_atom_index < size)
    return standard_atoms_by_residue[(size_t)restype * max_residue_size + relative_atom_index];
  if (relative_atom_index == size && !terminal_atom.empty())
    return terminal_atom;
  throw std::out_of_range("no atom " + std::to_string(relative_atom_index) +
                          " in residue " + residue_names[restype]);
}

std::string ResidueDictionary::atom_element(int restype, int relative_atom_index) const {
  if (relative_atom_index >= 0 && relative_atom_index < residue_sizes.at(restype))
    return residue_elements[restype][relative_atom_index];
  return element_from_atom_name(atom_name(restype, relative_atom_index));
}

std::vector<std::string>
ResidueDictionary::get_atom_names(const std::vector<int>& restype_index,
                                  const std::vector<int>& relative_atom_index) const {
  if (restype_index.size() != relative_atom_index.size())
    fail("get_atom_names: arrays differ in length");
  std::vector<std::string> names;
  names.reserve(restype_index.size());
  for (size_t i = 0; i != restype_index.size(); ++i)
    names.push_back(atom_name(restype_index[i], relative_atom_index[i]));
  return names;
}

ResidueDictionary ResidueDictionary::from_preset(const std::string& name, bool keep_oxt) {
  if (name == "protein") {
    ProteinDictionary protein(!keep_oxt);
    return protein;
  }
  ResidueDictionary dict;
  std::string leaving = keep_oxt ? "" : "OP3";
  if (name == "dna") {
    add_residues(dict, deoxynucleotides, leaving);
    dict.unknown_residue_name = "DN";
  } else if (name == "rna") {
    add_residues(dict, ribonucleotides, leaving);
    dict.unknown_residue_name = "N";
  } else {
    fail("Unknown residue dictionary preset: ", name);
  }
  dict.backbone_atoms = split_str_multi(nucleic_backbone, " ");
  if (!leaving.empty())
    dict.leaving_atoms.push_back(leaving);
  dict.setup();
  return dict;
}

ResidueDictionary
ResidueDictionary::from_ccd_json(const std::string& path,
                                 const std::vector<std::string>& residue_names,
                                 bool keep_leaving,
                                 const std::string& unknown_residue_name) {
  std::vector<CcdDictionaryEntry> all = read_ccd_dictionary(path);
  std::map<std::string, const CcdDictionaryEntry*> by_id;
  for (const CcdDictionaryEntry& e : all)
    by_id.emplace(e.id, &e);
  std::vector<CcdDictionaryEntry> entries;
  ResidueDictionary dict;
  for (const std::string& name : residue_names) {
    auto it = by_id.find(name);
    if (it == by_id.end())
      fail("Residue ", name, " not found in ", path);
    const CcdDictionaryEntry& e = *it->second;
    entries.push_back(e);
    dict.residue_names.push_back(e.id);
    dict.residue_types += e.one_letter_code.size() == 1 ? e.one_letter_code[0] : 'X';
    std::vector<std::string> atoms;
    std::vector<std::string> elements;
    for (size_t i = 0; i != e.atoms.size(); ++i) {
      if (!keep_leaving && in_vector(e.atoms[i], e.leaving_atoms)) {
        if (!in_vector(e.atoms[i], dict.leaving_atoms))
          dict.leaving_atoms.push_back(e.atoms[i]);
        continue;
      }
      atoms.push_back(e.atoms[i]);
      elements.push_back(e.elements[i]);
    }
    dict.residue_atoms.push_back(std::move(atoms));
    dict.residue_elements.push_back(std::move(elements));
  }
  if (all_types_contain(entries, "PEPTIDE"))
    dict.backbone_atoms = {"N", "CA", "C", "O"};
  else if (all_types_contain(entries, "DNA") || all_types_contain(entries, "RNA"))
    dict.backbone_atoms = split_str_multi(nucleic_backbone, " ");
  dict.unknown_residue_name = unknown_residue_name;
  dict.setup();
  return dict;
}

std::string ResidueDictionary::to_json() const {
  nlohmann::json j;
  j["residue_names"] = residue_names;
  j["residue_types"] = residue_types;
  j["atom_types"] = atom_types;
  j["residue_atoms"] = residue_atoms;
  j["residue_elements"] = residue_elements;
  j["backbone_atoms"] = backbone_atoms;
  j["unknown_residue_name"] = unknown_residue_name;
  nlohmann::json conv = nlohmann::json::array();
  for (const ResidueConversion& c : conversions)
    conv.push_back({{"residue", c.residue},
                    {"to_residue", c.to_residue},
                    {"atom_swaps", c.atom_swaps}});
  j["conversions"] = conv;
  j["terminal_atom"] = terminal_atom;
  j["drop_terminal_atom"] = drop_terminal_atom;
  j["leaving_atoms"] = leaving_atoms;
  return j.dump(1);
}

ResidueDictionary ResidueDictionary::from_json(const std::string& json,
                                               const std::string& source) {
  ResidueDictionary dict;
  try {
    nlohmann::json j = nlohmann::json::parse(json);
    dict.residue_names = j.at("residue_names").get<std::vector<std::string>>();
    dict.residue_types = j.at("residue_types").get<std::string>();
    dict.atom_types = j.value("atom_types", std::vector<std::string>());
    dict.residue_atoms = j.at("residue_atoms").get<std::vector<std::vector<std::string>>>();
    dict.residue_elements =
      j.value("residue_elements", std::vector<std::vector<std::string>>());
    dict.backbone_atoms = j.value("backbone_atoms", std::vector<std::string>());
    dict.unknown_residue_name = j.value("unknown_residue_name", std::string());
    if (j.count("conversions"))
      for (const nlohmann::json& c : j["conversions"]) {
        ResidueConversion conv;
        conv.residue = c.at("residue").get<std::string>();
        conv.to_residue = c.at("to_residue").get<std::string>();
        conv.atom_swaps =
          c.value("atom_swaps", std::vector<std::pair<std::string, std::string>>());
        dict.conversions.push_back(conv);
      }
    dict.terminal_atom = j.value("terminal_atom", std::string());
    dict.drop_terminal_atom = j.value("drop_terminal_atom", false);
    dict.leaving_atoms = j.value("leaving_atoms", std::vector<std::string>());
  } catch (nlohmann::json::exception& e) {
    fail(source, ": ", e.what());
  }
  dict.setup();
  return dict;
}

std::vector<std::string> atom37_types() {
  return split_str_multi(atom37, " ");
}

ProteinDictionary::ProteinDictionary(bool drop_oxt) {
  add_residues(*this, amino_acids, "");
  atom_types = atom37_types();
  backbone_atoms = {"N", "CA", "C", "O"};
  unknown_residue_name = "UNK";
  conversions.push_back({"MSE", "MET", {{"SE", "SD"}}});
  conversions.push_back({"SEC", "CYS", {{"SE", "SG"}}});
  terminal_atom = "OXT";
  drop_terminal_atom = drop_oxt;
  setup();
}

bool is_atom14_compatible(const ResidueDictionary& dict) {
  for (int size : dict.residue_sizes)
    if (size > 14)
      return false;
  return true;
}

bool is_atom37_compatible(const ResidueDictionary& dict) {
  std::vector<std::string> types = atom37_types();
  for (const std::vector<std::string>& atoms : dict.residue_atoms)
    for (const std::string& atom : atoms)
      if (!in_vector(atom, types))
        return false;
  return true;
}

} // namespace biods
