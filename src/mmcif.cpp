// Copyright The biods Developers.

#include <biods/mmcif.hpp>
#include <biods/elem.hpp>     // for normalize_element, is_hydrogen
#include <biods/numb.hpp>     // for as_number, as_int
#include <biods/sprintf.hpp>  // for to_str_fixed

namespace biods {

namespace {

// the other column is used when the preferred one is absent or null;
// returns nullptr if both columns are absent
const std::string* field_or(const cif::Table::Row& row, int preferred, int other) {
  if (row.has2(preferred) || !row.has(other))
    return row.ptr_at(preferred);
  return &row[other];
}

std::string string_or_qmark(const std::string& s) {
  return s.empty() ? "?" : cif::quote(s);
}

} // anonymous namespace

AtomArray read_atom_site(cif::Block& block, const AtomSiteReadOptions& options) {
  enum { kX=0, kY, kZ, kSymbol, kLabelAtomId, kLabelCompId, kLabelAsymId,
         kGroup, kId, kAltId, kLabelEntityId, kLabelSeqId, kInsCode, kOcc,
         kBiso, kCharge, kAuthSeqId, kAuthCompId, kAuthAsymId, kAuthAtomId,
         kModelNum };
  cif::Table table = block.find("_atom_site.",
                                {"Cartn_x",
                                 "Cartn_y",
                                 "Cartn_z",
                                 "?type_symbol",
                                 "label_atom_id",
                                 "label_comp_id",
                                 "label_asym_id",
                                 "?group_PDB",
                                 "?id",
                                 "?label_alt_id",
                                 "?label_entity_id",
                                 "?label_seq_id",
                                 "?pdbx_PDB_ins_code",
                                 "?occupancy",
                                 "?B_iso_or_equiv",
                                 "?pdbx_formal_charge",
                                 "?auth_seq_id",
                                 "?auth_comp_id",
                                 "?auth_asym_id",
                                 "?auth_atom_id",
                                 "?pdbx_PDB_model_num"});
  if (!table.ok())
    fail("_atom_site not found (or incomplete) in block ", block.name);

  // with author fields first come auth_*, with label fields first label_*
  auto pick = [&](const cif::Table::Row& row, int label, int auth) {
    return options.use_author_fields ? field_or(row, auth, label)
                                     : field_or(row, label, auth);
  };

  AtomArray atoms;
  atoms.reserve(table.length());
  std::string model_num;
  if (options.model != 0)
    model_num = std::to_string(options.model);
  bool has_model_num = table.has_column(kModelNum);
  bool has_altloc = table.has_column(kAltId);
  FirstAltlocFilter altloc_filter;
  for (auto row : table) {
    if (has_model_num) {
      std::string num = row.str(kModelNum);
      if (model_num.empty())
        model_num = num;
      else if (num != model_num)
        continue;
    }
    AtomRecord rec;
    rec.element = row.has2(kSymbol) ? normalize_element(row.str(kSymbol))
                                    : std::string();
    rec.atom_name = cif::as_string(pick(row, kLabelAtomId, kAuthAtomId));
    if (rec.element.empty())
      rec.element = element_from_atom_name(rec.atom_name);
    if (!options.keep_hydrogens && is_hydrogen(rec.element))
      continue;
    rec.pos.x = cif::as_number(row[kX]);
    rec.pos.y = cif::as_number(row[kY]);
    rec.pos.z = cif::as_number(row[kZ]);
    rec.res_name = cif::as_string(pick(row, kLabelCompId, kAuthCompId));
    rec.chain_id = cif::as_string(pick(row, kLabelAsymId, kAuthAsymId));
    if (const std::string* seq_id = pick(row, kLabelSeqId, kAuthSeqId))
      rec.res_id = cif::as_int(*seq_id, 0);
    if (row.has(kInsCode))
      rec.ins_code = cif::as_char(row[kInsCode], ' ');
    rec.hetero = row.has(kGroup) && row.str(kGroup) == "HETATM";
    rec.label_asym_id = row.str(kLabelAsymId);
    if (row.has2(kLabelEntityId))
      rec.label_entity_id = row.str(kLabelEntityId);
    if (row.has2(kId))
      rec.atom_id = cif::as_int(row[kId]);
    if (row.has(kOcc))
      rec.occupancy = (float) cif::as_number(row[kOcc], 1.0);
    if (row.has(kBiso))
      rec.b_factor = (float) cif::as_number(row[kBiso], 0.0);
    if (row.has(kCharge))
      rec.charge = cif::as_int(row[kCharge], 0);
    if (has_altloc && row.has2(kAltId) &&
        !altloc_filter.keep(rec, row.str(kAltId)))
      continue;
    atoms.add_atom(rec);
  }
  if (options.model != 0 && atoms.empty() && table.length() != 0)
    fail("model ", options.model, " not found in block ", block.name);
  return atoms;
}

AtomArray make_atom_array(cif::Document& doc, const AtomSiteReadOptions& options) {
  for (cif::Block& block : doc.blocks)
    if (block.find_loop_item("_atom_site.Cartn_x") ||
        block.find_pair_item("_atom_site.Cartn_x"))
      return read_atom_site(block, options);
  fail("No _atom_site category in ", doc.source);
}

void write_atom_site(const AtomArray& atoms, cif::Block& block) {
  atoms.check_lengths();
  cif::Loop& atom_loop = block.init_mmcif_loop("_atom_site.", {
      "group_PDB",
      "id",
      "type_symbol",
      "label_atom_id",
      "label_alt_id",
      "label_comp_id",
      "label_asym_id",
      "label_entity_id",
      "label_seq_id",
      "pdbx_PDB_ins_code",
      "Cartn_x",
      "Cartn_y",
      "Cartn_z",
      "occupancy",
      "B_iso_or_equiv",
      "pdbx_formal_charge",
      "auth_seq_id",
      "auth_comp_id",
      "auth_asym_id",
      "auth_atom_id",
      "pdbx_PDB_model_num"});
  std::vector<std::string>& vv = atom_loop.values;
  vv.reserve(atoms.size() * atom_loop.tags.size());
  int serial = 0;
  for (size_t i = 0; i != atoms.size(); ++i) {
    ++serial;
    const Vec3& pos = atoms.coord[i];
    bool missing = pos.has_nan();
    std::string seq_id = std::to_string(atoms.res_id[i]);
    std::string atom_name = cif::quote(atoms.atom_name[i]);
    std::string res_name = cif::quote(atoms.res_name[i]);
    std::string chain = cif::quote(atoms.chain_id[i]);
    vv.emplace_back(atoms.hetero[i] ? "HETATM" : "ATOM");
    vv.emplace_back(std::to_string(atoms.atom_id[i] != 0 ? atoms.atom_id[i] : serial));
    vv.emplace_back(string_or_qmark(atoms.element[i]));
    vv.emplace_back(atom_name);
    vv.emplace_back(".");
    vv.emplace_back(res_name);
    vv.emplace_back(atoms.label_asym_id[i].empty() ? chain
                                                   : cif::quote(atoms.label_asym_id[i]));
    vv.emplace_back(string_or_qmark(atoms.label_entity_id[i]));
    vv.emplace_back(atoms.hetero[i] ? "." : seq_id);
    vv.emplace_back(atoms.ins_code[i] == ' ' ? "?" : std::string(1, atoms.ins_code[i]));
    vv.emplace_back(missing ? "?" : to_str_fixed(pos.x, 3));
    vv.emplace_back(missing ? "?" : to_str_fixed(pos.y, 3));
    vv.emplace_back(missing ? "?" : to_str_fixed(pos.z, 3));
    vv.emplace_back(to_str_fixed(atoms.occupancy[i], 2));
    vv.emplace_back(to_str_fixed(atoms.b_factor[i], 2));
    vv.emplace_back(atoms.charge[i] == 0 ? "?" : std::to_string(atoms.charge[i]));
    vv.emplace_back(seq_id);
    vv.emplace_back(res_name);
    vv.emplace_back(chain);
    vv.emplace_back(atom_name);
    vv.emplace_back("1");
  }
}

cif::Document make_mmcif_document(const AtomArray& atoms, const std::string& name) {
  cif::Document doc;
  std::string block_name = name.empty() ? "biods" : name;
  cif::Block& block = doc.add_new_block(block_name);
  block.set_pair("_entry.id", cif::quote(block_name));
  write_atom_site(atoms, block);
  return doc;
}

} // namespace biods
