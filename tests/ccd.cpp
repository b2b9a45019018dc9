#include <doctest/doctest.h>

#include <cstdio>   // for remove
#include <fstream>
#include <biods/ccd.hpp>
#include <biods/cif.hpp>
#include <biods/fileutil.hpp>  // for path_join
#include <biods/resdict.hpp>

namespace cif = biods::cif;

static const char* components_cif =
  "data_ALA\n"
  "_chem_comp.id ALA\n"
  "_chem_comp.name ALANINE\n"
  "_chem_comp.type 'L-PEPTIDE LINKING'\n"
  "_chem_comp.one_letter_code A\n"
  "_chem_comp.mon_nstd_parent_comp_id ?\n"
  "loop_\n"
  "_chem_comp_atom.comp_id\n"
  "_chem_comp_atom.atom_id\n"
  "_chem_comp_atom.type_symbol\n"
  "_chem_comp_atom.charge\n"
  "_chem_comp_atom.pdbx_leaving_atom_flag\n"
  "_chem_comp_atom.pdbx_model_Cartn_x_ideal\n"
  "_chem_comp_atom.pdbx_model_Cartn_y_ideal\n"
  "_chem_comp_atom.pdbx_model_Cartn_z_ideal\n"
  "ALA N   N 0 N -0.966 0.493 1.500\n"
  "ALA CA  C 0 N 0.257 0.418 0.692\n"
  "ALA C   C 0 N -0.094 0.017 -0.716\n"
  "ALA O   O 0 N -1.056 -0.682 -0.923\n"
  "ALA CB  C 0 N 1.204 -0.620 1.296\n"
  "ALA OXT O 0 Y 0.661 0.439 -1.742\n"
  "ALA H   H 0 N -1.383 -0.425 1.482\n"
  "loop_\n"
  "_chem_comp_bond.comp_id\n"
  "_chem_comp_bond.atom_id_1\n"
  "_chem_comp_bond.atom_id_2\n"
  "_chem_comp_bond.value_order\n"
  "ALA N CA sing\n"
  "ALA C O doub\n"
  "data_MSE\n"
  "_chem_comp.id MSE\n"
  "_chem_comp.type 'L-peptide linking'\n"
  "_chem_comp.one_letter_code M\n"
  "_chem_comp.mon_nstd_parent_comp_id MET\n"
  "loop_\n"
  "_chem_comp_atom.comp_id\n"
  "_chem_comp_atom.atom_id\n"
  "_chem_comp_atom.type_symbol\n"
  "_chem_comp_atom.pdbx_leaving_atom_flag\n"
  "MSE N N N\nMSE CA C N\nMSE C C N\nMSE O O N\nMSE CB C N\n"
  "MSE CG C N\nMSE SE Se N\nMSE CE C N\nMSE OXT O Y\n"
  "data_D8U\n"
  "_chem_comp.id D8U\n"
  "_chem_comp.type NON-POLYMER\n"
  "loop_\n"
  "_chem_comp_atom.comp_id\n"
  "_chem_comp_atom.atom_id\n"
  "_chem_comp_atom.type_symbol\n"
  "D8U D D\n";

static void write_text(const std::string& path, const std::string& text) {
  std::ofstream os(path.c_str());
  os << text;
}

TEST_CASE("make_ccd_component") {
  cif::Document doc = cif::read_string(components_cif);
  std::vector<biods::CcdComponent> ccs = biods::read_ccd_components(doc);
  REQUIRE_EQ(ccs.size(), 3);
  const biods::CcdComponent& ala = ccs[0];
  CHECK_EQ(ala.id, "ALA");
  CHECK_EQ(ala.name, "ALANINE");
  CHECK_EQ(ala.type, "L-PEPTIDE LINKING");
  CHECK_EQ(ala.one_letter_code, "A");
  CHECK(ala.parent.empty());
  CHECK_EQ(ala.atoms.size(), 7);
  CHECK_EQ(ala.heavy_atoms().size(), 6);
  const biods::CcdAtom* oxt = ala.find_atom("OXT");
  REQUIRE(oxt != nullptr);
  CHECK(oxt->leaving);
  CHECK_EQ(oxt->ideal.z, doctest::Approx(-1.742));
  CHECK(ala.find_atom("CG") == nullptr);
  REQUIRE_EQ(ala.bonds.size(), 2);
  CHECK_EQ(ala.bonds[1].order, "DOUB");

  const biods::CcdComponent& mse = ccs[1];
  CHECK_EQ(mse.parent, "MET");
  CHECK_EQ(mse.find_atom("SE")->element, "SE");
  CHECK(mse.find_atom("CA")->ideal.has_nan());

  CHECK(ccs[2].heavy_atoms().empty());
}

TEST_CASE("CCD dictionary JSON") {
  cif::Document doc = cif::read_string(components_cif);
  biods::CcdComponent ala = biods::make_ccd_component(doc.blocks[0]);
  biods::CcdDictionaryEntry entry = biods::make_dictionary_entry(ala, 1234);
  CHECK_EQ(entry.atoms, (std::vector<std::string>{"N", "CA", "C", "O", "CB", "OXT"}));
  CHECK_EQ(entry.elements[4], "C");
  CHECK_EQ(entry.leaving_atoms, std::vector<std::string>{"OXT"});
  CHECK_EQ(entry.count, 1234);

  std::string json = biods::ccd_dictionary_to_json({entry});
  std::vector<biods::CcdDictionaryEntry> back = biods::ccd_dictionary_from_json(json, "t");
  REQUIRE_EQ(back.size(), 1);
  CHECK_EQ(back[0].id, "ALA");
  CHECK_EQ(back[0].type, "L-PEPTIDE LINKING");
  CHECK_EQ(back[0].atoms, entry.atoms);
  CHECK_EQ(back[0].leaving_atoms, entry.leaving_atoms);
  CHECK_EQ(back[0].count, 1234);

  CHECK_THROWS_AS(biods::ccd_dictionary_from_json("[", "t"), std::runtime_error);
  CHECK_THROWS_AS(biods::ccd_dictionary_from_json(R"({"components": [{"id": "X"}]})", "t"),
                  std::runtime_error);
  CHECK_THROWS_AS(biods::ccd_dictionary_from_json(
      R"({"components": [{"id": "X", "atoms": ["C1"], "elements": []}]})", "t"),
      std::runtime_error);
}

TEST_CASE("build_ccd_artifacts") {
  const std::string dir = "biods_test_ccd";
  const std::string ccd_path = "biods_test_components.cif";
  const std::string counts_path = "biods_test_cc-counts.tdd";
  write_text(ccd_path, components_cif);
  write_text(counts_path, "comp_id count\nALA 9000\nMSE 40\nD8U 3\n");

  std::map<std::string, int> counts = biods::read_usage_counts(counts_path);
  CHECK_EQ(counts.size(), 3);
  CHECK_EQ(counts["MSE"], 40);

  biods::Logger logger;
  biods::CcdBuildOptions options;
  options.min_count = 10;
  CHECK_EQ(biods::build_ccd_artifacts(ccd_path, counts_path, dir, options, logger), 3);
  // outputs are up to date now
  CHECK_EQ(biods::build_ccd_artifacts(ccd_path, counts_path, dir, options, logger), 0);
  // a change made right after the build is noticed
  write_text(counts_path, "comp_id count\nALA 9000\nMSE 40\nD8U 3\n");
  CHECK(biods::is_outdated(biods::path_join(dir, biods::CCD_COUNTS_NAME), {counts_path}));
  CHECK_EQ(biods::build_ccd_artifacts(ccd_path, counts_path, dir, options, logger), 2);
  CHECK(!biods::is_outdated(biods::path_join(dir, biods::CCD_DICTIONARY_NAME),
                            {ccd_path, counts_path}));
  CHECK_THROWS(biods::is_outdated(biods::path_join(dir, biods::CCD_DICTIONARY_NAME),
                                  {"biods_test_no_such_file"}));

  std::string json_path = biods::path_join(dir, biods::CCD_DICTIONARY_NAME);
  std::vector<biods::CcdDictionaryEntry> entries = biods::read_ccd_dictionary(json_path);
  REQUIRE_EQ(entries.size(), 2);
  CHECK_EQ(entries[1].id, "MSE");

  biods::ResidueDictionary dict =
    biods::ResidueDictionary::from_ccd_json(json_path, {"ALA", "MSE"});
  CHECK_EQ(dict.residue_types, "AM");
  CHECK_EQ(dict.residue_sizes, (std::vector<int>{5, 8}));
  CHECK_EQ(dict.leaving_atoms, std::vector<std::string>{"OXT"});
  CHECK_EQ(dict.backbone_atoms, (std::vector<std::string>{"N", "CA", "C", "O"}));
  CHECK_EQ(dict.residue_elements[1][6], "SE");
  biods::ResidueDictionary with_oxt =
    biods::ResidueDictionary::from_ccd_json(json_path, {"ALA"}, true);
  CHECK_EQ(with_oxt.residue_sizes[0], 6);
  CHECK_THROWS(biods::ResidueDictionary::from_ccd_json(json_path, {"D8U"}));

  for (const char* name : {biods::CCD_BCIF_NAME, biods::CCD_COUNTS_NAME,
                           biods::CCD_DICTIONARY_NAME})
    std::remove(biods::path_join(dir, name).c_str());
  std::remove(dir.c_str());
  std::remove(ccd_path.c_str());
  std::remove(counts_path.c_str());
}
