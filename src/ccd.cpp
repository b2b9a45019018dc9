// Copyright The biods Developers.

#include <biods/ccd.hpp>
#include <nlohmann/json.hpp>
#include <biods/bcif.hpp>      // for write_bcif_file
#include <biods/elem.hpp>      // for is_hydrogen, normalize_element
#include <biods/fileutil.hpp>  // for file_mtime, make_directories, path_join
#include <biods/fstream.hpp>   // for Ofstream
#include <biods/gz.hpp>        // for MaybeGzipped
#include <biods/numb.hpp>      // for as_number, as_int
#include <biods/read_cif.hpp>  // for read_cif_or_bcif_gz, read_into_buffer_gz

namespace biods {

const char* const CCD_BCIF_NAME = "components.bcif";
const char* const CCD_COUNTS_NAME = "cc-counts.tdd";
const char* const CCD_DICTIONARY_NAME = "ccd_residue_dictionary.json";

std::vector<const CcdAtom*> CcdComponent::heavy_atoms() const {
  std::vector<const CcdAtom*> heavy;
  for (const CcdAtom& a : atoms)
    if (!is_hydrogen(a.element))
      heavy.push_back(&a);
  return heavy;
}

CcdComponent make_ccd_component(cif::Block& block) {
  CcdComponent cc;
  cc.id = block.name;
  cif::Table comp = block.find("_chem_comp.",
                               {"id", "?name", "?type", "?one_letter_code",
                                "?mon_nstd_parent_comp_id"});
  if (comp.length() != 0) {
    auto row = comp[0];
    cc.id = row.str(0);
    if (row.has2(1))
      cc.name = row.str(1);
    if (row.has2(2))
      cc.type = row.str(2);
    if (row.has2(3))
      cc.one_letter_code = row.str(3);
    if (row.has2(4))
      cc.parent = row.str(4);
  }
  for (auto row : block.find("_chem_comp_atom.",
                             {"atom_id", "type_symbol", "?charge",
                              "?pdbx_leaving_atom_flag",
                              "?pdbx_model_Cartn_x_ideal",
                              "?pdbx_model_Cartn_y_ideal",
                              "?pdbx_model_Cartn_z_ideal"})) {
    CcdAtom atom;
    atom.id = row.str(0);
    atom.element = normalize_element(row.str(1));
    if (row.has2(2))
      atom.charge = cif::as_int(row[2], 0);
    atom.leaving = row.has2(3) && (row[3][0] | 0x20) == 'y';
    if (row.has(4) && row.has(5) && row.has(6))
      atom.ideal = Vec3(cif::as_number(row[4]), cif::as_number(row[5]),
                        cif::as_number(row[6]));
    cc.atoms.push_back(atom);
  }
  for (auto row : block.find("_chem_comp_bond.",
                             {"atom_id_1", "atom_id_2", "?value_order"}))
    cc.bonds.push_back({row.str(0), row.str(1),
                        row.has2(2) ? to_upper(row.str(2)) : std::string()});
  return cc;
}

std::vector<CcdComponent> read_ccd_components(cif::Document& doc) {
  std::vector<CcdComponent> components;
  components.reserve(doc.blocks.size());
  for (cif::Block& block : doc.blocks)
    components.push_back(make_ccd_component(block));
  return components;
}

std::map<std::string, int> read_usage_counts(const std::string& path) {
  std::map<std::string, int> counts;
  MaybeGzipped input(path);
  std::unique_ptr<AnyStream> stream = input.create_stream();
  char line[256];
  while (stream->copy_line(line, sizeof(line)) != 0) {
    std::vector<std::string> fields = split_str_multi(line, " \t\r\n");
    if (fields.size() < 2)
      continue;
    int count;
    try {
      count = string_to_int(fields[1], true);
    } catch (std::invalid_argument&) {
      continue;  // header
    }
    counts[fields[0]] = count;
  }
  return counts;
}

CcdDictionaryEntry make_dictionary_entry(const CcdComponent& cc, int count) {
  CcdDictionaryEntry entry;
  entry.id = cc.id;
  entry.name = cc.name;
  entry.one_letter_code = cc.one_letter_code;
  entry.type = cc.type;
  entry.parent = cc.parent;
  for (const CcdAtom* atom : cc.heavy_atoms()) {
    entry.atoms.push_back(atom->id);
    entry.elements.push_back(atom->element);
    if (atom->leaving)
      entry.leaving_atoms.push_back(atom->id);
  }
  entry.count = count;
  return entry;
}

std::string ccd_dictionary_to_json(const std::vector<CcdDictionaryEntry>& entries) {
  nlohmann::json components = nlohmann::json::array();
  for (const CcdDictionaryEntry& e : entries) {
    nlohmann::json j;
    j["id"] = e.id;
    j["name"] = e.name;
    j["one_letter_code"] = e.one_letter_code;
    j["type"] = e.type;
    j["parent"] = e.parent;
    j["atoms"] = e.atoms;
    j["elements"] = e.elements;
    j["leaving_atoms"] = e.leaving_atoms;
    j["count"] = e.count;
    components.push_back(std::move(j));
  }
  nlohmann::json root;
  root["version"] = 1;
  root["components"] = std::move(components);
  return root.dump(1);
}

std::vector<CcdDictionaryEntry> ccd_dictionary_from_json(const std::string& json,
                                                         const std::string& source) {
  std::vector<CcdDictionaryEntry> entries;
  try {
    nlohmann::json root = nlohmann::json::parse(json);
    for (const nlohmann::json& j : root.at("components")) {
      CcdDictionaryEntry e;
      e.id = j.at("id").get<std::string>();
      e.name = j.value("name", std::string());
      e.one_letter_code = j.value("one_letter_code", std::string());
      e.type = j.value("type", std::string());
      e.parent = j.value("parent", std::string());
      e.atoms = j.at("atoms").get<std::vector<std::string>>();
      e.elements = j.at("elements").get<std::vector<std::string>>();
      e.leaving_atoms = j.value("leaving_atoms", std::vector<std::string>());
      e.count = j.value("count", 0);
      if (e.elements.size() != e.atoms.size())
        fail(source, ": ", e.id, ": atoms and elements differ in length");
      entries.push_back(std::move(e));
    }
  } catch (nlohmann::json::exception& e) {
    fail(source, ": ", e.what());
  }
  return entries;
}

std::vector<CcdDictionaryEntry> read_ccd_dictionary(const std::string& path) {
  CharArray buf = read_into_buffer_gz(path);
  return ccd_dictionary_from_json(std::string(buf.data(), buf.size()), path);
}

bool is_outdated(const std::string& output, const std::vector<std::string>& inputs) {
  long long out_time = file_mtime(output);
  if (out_time < 0)
    return true;
  for (const std::string& input : inputs) {
    long long t = file_mtime(input);
    if (t < 0)
      fail("File not found: " + input);
    // equal times cannot be ordered
    if (t >= out_time)
      return true;
  }
  return false;
}

int build_ccd_artifacts(const std::string& ccd_path, const std::string& counts_path,
                        const std::string& out_dir, const CcdBuildOptions& options,
                        const Logger& logger) {
  make_directories(out_dir);
  std::string bcif_out = path_join(out_dir, CCD_BCIF_NAME);
  std::string counts_out = path_join(out_dir, CCD_COUNTS_NAME);
  std::string json_out = path_join(out_dir, CCD_DICTIONARY_NAME);
  bool need_bcif = options.force || is_outdated(bcif_out, {ccd_path});
  bool need_counts = options.force || is_outdated(counts_out, {counts_path});
  bool need_json = options.force || is_outdated(json_out, {ccd_path, counts_path});
  int written = 0;
  if (need_counts) {
    CharArray buf = read_into_buffer_gz(counts_path);
    write_buffer_to_file(counts_out, buf.data(), buf.size());
    logger.mesg("Written ", counts_out);
    ++written;
  }
  if (!need_bcif && !need_json) {
    if (written == 0)
      logger.mesg("CCD files in ", out_dir, " are up to date.");
    return written;
  }

  logger.mesg("Reading ", ccd_path, " ...");
  cif::Document doc = read_cif_or_bcif_gz(ccd_path);
  logger.mesg("Read ", doc.blocks.size(), " components.");
  if (need_bcif) {
    write_bcif_file(doc, bcif_out);
    logger.mesg("Written ", bcif_out);
    ++written;
  }
  if (need_json) {
    std::map<std::string, int> counts = read_usage_counts(counts_path);
    std::vector<CcdDictionaryEntry> entries;
    for (cif::Block& block : doc.blocks) {
      CcdComponent cc = make_ccd_component(block);
      auto it = counts.find(cc.id);
      int count = it != counts.end() ? it->second : 0;
      if (count < options.min_count) {
        logger.debug("skipping ", cc.id, " used ", count, " times");
        continue;
      }
      if (cc.heavy_atoms().empty()) {
        logger.note("skipping ", cc.id, ": no heavy atoms");
        continue;
      }
      entries.push_back(make_dictionary_entry(cc, count));
    }
    Ofstream os(json_out);
    os.ref() << ccd_dictionary_to_json(entries) << '\n';
    if (!os.ref())
      sys_fail("Failed to write " + json_out);
    logger.mesg("Written ", json_out, " with ", entries.size(), " components.");
    ++written;
  }
  return written;
}

} // namespace biods
