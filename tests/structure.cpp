#include <doctest/doctest.h>

#include <cmath>  // for isnan
#include <stdexcept>  // for invalid_argument
#include <biods/cif.hpp>
#include <biods/mmcif.hpp>
#include <biods/mmread.hpp>
#include <biods/pdb.hpp>

namespace cif = biods::cif;

static const char* atom_site_cif =
  "data_test\n"
  "loop_\n"
  "_atom_site.group_PDB\n"
  "_atom_site.id\n"
  "_atom_site.type_symbol\n"
  "_atom_site.label_atom_id\n"
  "_atom_site.label_alt_id\n"
  "_atom_site.label_comp_id\n"
  "_atom_site.label_asym_id\n"
  "_atom_site.label_entity_id\n"
  "_atom_site.label_seq_id\n"
  "_atom_site.Cartn_x\n"
  "_atom_site.Cartn_y\n"
  "_atom_site.Cartn_z\n"
  "_atom_site.occupancy\n"
  "_atom_site.B_iso_or_equiv\n"
  "_atom_site.auth_seq_id\n"
  "_atom_site.auth_asym_id\n"
  "_atom_site.pdbx_PDB_model_num\n"
  "ATOM 1 N N  . ALA A 1 1 1.0 2.0 3.0 1.00 10.0 5 X 1\n"
  "ATOM 2 C CA A ALA A 1 1 2.0 2.0 3.0 0.60 11.0 5 X 1\n"
  "ATOM 3 C CA B ALA A 1 1 2.1 2.1 3.1 0.40 11.0 5 X 1\n"
  "HETATM 4 O O . HOH B 2 . 9.0 9.0 9.0 1.00 20.0 101 X 1\n"
  "ATOM 5 N N  . ALA A 1 1 1.5 2.5 3.5 1.00 10.0 5 X 2\n";

TEST_CASE("read_atom_site") {
  cif::Document doc = cif::read_string(atom_site_cif);
  biods::AtomArray atoms = biods::make_atom_array(doc);
  atoms.check_lengths();
  // model 1 only, the second altloc of CA is skipped
  REQUIRE_EQ(atoms.size(), 3);
  CHECK_EQ(atoms.chain_id[0], "X");
  CHECK_EQ(atoms.res_id[0], 5);
  CHECK_EQ(atoms.label_asym_id[0], "A");
  CHECK_EQ(atoms.atom_name[1], "CA");
  CHECK_EQ(atoms.occupancy[1], doctest::Approx(0.6));
  CHECK_EQ(atoms.coord[1].x, doctest::Approx(2.0));
  CHECK(atoms.hetero[2]);
  CHECK_EQ(atoms.res_id[2], 101);
  CHECK_EQ(atoms.element[2], "O");
  CHECK(atoms.mask[2]);

  biods::AtomSiteReadOptions options;
  options.use_author_fields = false;
  biods::AtomArray label = biods::make_atom_array(doc, options);
  CHECK_EQ(label.chain_id[0], "A");
  CHECK_EQ(label.res_id[0], 1);
  CHECK_EQ(label.chain_id[2], "B");
  // null label_seq_id of water falls back to auth_seq_id
  CHECK_EQ(label.res_id[2], 101);

  options.model = 2;
  biods::AtomArray model2 = biods::make_atom_array(doc, options);
  REQUIRE_EQ(model2.size(), 1);
  CHECK_EQ(model2.coord[0].z, doctest::Approx(3.5));
  options.model = 3;
  CHECK_THROWS(biods::make_atom_array(doc, options));

  cif::Document empty = cif::read_string("data_e _entry.id e");
  CHECK_THROWS(biods::make_atom_array(empty));
}

TEST_CASE("read_atom_site keeps the first altloc of a residue") {
  // microheterogeneity: SER and THR share residue 5
  cif::Document doc = cif::read_string(
      "data_micro\n"
      "loop_\n"
      "_atom_site.group_PDB\n"
      "_atom_site.id\n"
      "_atom_site.type_symbol\n"
      "_atom_site.label_atom_id\n"
      "_atom_site.label_alt_id\n"
      "_atom_site.label_comp_id\n"
      "_atom_site.label_asym_id\n"
      "_atom_site.label_seq_id\n"
      "_atom_site.Cartn_x\n"
      "_atom_site.Cartn_y\n"
      "_atom_site.Cartn_z\n"
      "ATOM 1 N N  A SER A 5 1.0 0.0 0.0\n"
      "ATOM 2 C CA A SER A 5 2.0 0.0 0.0\n"
      "ATOM 3 N N  B THR A 5 1.1 0.0 0.0\n"
      "ATOM 4 C CA B THR A 5 2.1 0.0 0.0\n"
      "ATOM 5 C CB B THR A 5 3.1 0.0 0.0\n"
      "ATOM 6 N N  . GLY A 6 4.0 0.0 0.0\n"
      "ATOM 7 C CA B GLY A 6 5.0 0.0 0.0\n"
      "ATOM 8 C CA A GLY A 6 5.5 0.0 0.0\n");
  biods::AtomArray atoms = biods::make_atom_array(doc);
  REQUIRE_EQ(atoms.size(), 4);
  CHECK_EQ(atoms.res_name, (std::vector<std::string>{"SER", "SER", "GLY", "GLY"}));
  CHECK_EQ(atoms.coord[1].x, doctest::Approx(2.0));
  // in residue 6 altloc B comes first
  CHECK_EQ(atoms.coord[3].x, doctest::Approx(5.0));
  CHECK_EQ(atoms.residue_starts(), (std::vector<int>{0, 2}));
}

TEST_CASE("read_atom_site with a non-numeric id") {
  cif::Document doc = cif::read_string(
      "data_bad\n"
      "loop_\n"
      "_atom_site.id\n"
      "_atom_site.label_atom_id\n"
      "_atom_site.label_comp_id\n"
      "_atom_site.label_asym_id\n"
      "_atom_site.Cartn_x\n"
      "_atom_site.Cartn_y\n"
      "_atom_site.Cartn_z\n"
      "x1 CA GLY A 1.0 2.0 3.0\n");
  CHECK_THROWS_AS(biods::make_atom_array(doc), std::invalid_argument);
}

TEST_CASE("write_atom_site") {
  biods::AtomArray atoms;
  biods::AtomRecord rec;
  rec.chain_id = "A";
  rec.res_id = 1;
  rec.res_name = "ALA";
  rec.atom_name = "N";
  rec.element = "N";
  rec.pos = biods::Vec3(1.5, -2, 3);
  atoms.add_atom(rec);
  rec.atom_name = "CB";
  rec.element = "C";
  rec.pos = biods::Vec3::nan();
  rec.mask = false;
  rec.occupancy = 0.f;
  atoms.add_atom(rec);
  rec.res_name = "HOH";
  rec.atom_name = "O";
  rec.element = "O";
  rec.hetero = true;
  rec.res_id = 2;
  rec.pos = biods::Vec3(0, 0, 0);
  atoms.add_atom(rec);

  cif::Document doc = biods::make_mmcif_document(atoms, "out");
  cif::Block& block = doc.sole_block();
  CHECK_EQ(block.name, "out");
  cif::Column x = block.find_loop("_atom_site.Cartn_x");
  REQUIRE_EQ(x.length(), 3);
  CHECK_EQ(x[0], "1.500");
  CHECK_EQ(x[1], "?");
  CHECK_EQ(block.find_loop("_atom_site.label_seq_id")[2], ".");
  CHECK_EQ(block.find_loop("_atom_site.group_PDB")[2], "HETATM");

  biods::AtomArray back = biods::make_atom_array(doc);
  REQUIRE_EQ(back.size(), 3);
  CHECK(std::isnan(back.coord[1].y));
  CHECK_EQ(back.atom_name[1], "CB");
  CHECK_EQ(back.res_id[2], 2);
  CHECK(back.hetero[2]);
}

TEST_CASE("read_pdb_string") {
  std::string pdb =
    "HEADER    TEST\n"
    "ATOM      1  N   ALA A   1      11.104   6.134  -6.504  1.00  0.00           N  \n"
    "ATOM      2  CA AALA A   1      11.639   6.071  -5.147  0.50  0.00           C  \n"
    "ATOM      3  CA BALA A   1      11.700   6.100  -5.100  0.50  0.00           C  \n"
    "TER       4      ALA A   1\n"
    "HETATM    5 ZN    ZN B 101       1.000   2.000   3.000  0.50 10.00          ZN2+\n"
    "END\n"
    "ATOM      6  N   GLY A   2       0.000   0.000   0.000  1.00  0.00           N  \n";
  biods::AtomArray atoms = biods::read_pdb_string(pdb);
  REQUIRE_EQ(atoms.size(), 3);
  CHECK_EQ(atoms.atom_id[0], 1);
  CHECK_EQ(atoms.atom_name[0], "N");
  CHECK_EQ(atoms.res_name[0], "ALA");
  CHECK_EQ(atoms.chain_id[0], "A");
  CHECK_EQ(atoms.res_id[0], 1);
  CHECK_EQ(atoms.ins_code[0], ' ');
  CHECK_EQ(atoms.coord[0].x, doctest::Approx(11.104));
  CHECK_EQ(atoms.coord[0].z, doctest::Approx(-6.504));
  CHECK_EQ(atoms.element[0], "N");
  CHECK_EQ(atoms.coord[1].x, doctest::Approx(11.639));
  CHECK(atoms.hetero[2]);
  CHECK_EQ(atoms.res_name[2], "ZN");
  CHECK_EQ(atoms.element[2], "ZN");
  CHECK_EQ(atoms.charge[2], 2);
  CHECK_EQ(atoms.b_factor[2], doctest::Approx(10.0));

  CHECK_THROWS(biods::read_pdb_string("data_x\n_a 1\n"));
  CHECK_THROWS(biods::read_pdb_string("ATOM      1  N   ALA A   1\n"));
}

TEST_CASE("read_pdb_string with models") {
  std::string pdb =
    "MODEL        1\n"
    "ATOM      1  N   ALA A   1       1.000   1.000   1.000  1.00  0.00           N  \n"
    "ENDMDL\n"
    "MODEL        2\n"
    "ATOM      1  N   ALA A   1       2.000   2.000   2.000  1.00  0.00           N  \n"
    "ENDMDL\n";
  biods::AtomArray first = biods::read_pdb_string(pdb);
  REQUIRE_EQ(first.size(), 1);
  CHECK_EQ(first.coord[0].x, doctest::Approx(1.0));
  biods::AtomSiteReadOptions options;
  options.model = 2;
  biods::AtomArray second = biods::read_pdb_string(pdb, options);
  REQUIRE_EQ(second.size(), 1);
  CHECK_EQ(second.coord[0].x, doctest::Approx(2.0));
  options.model = 5;
  CHECK_THROWS(biods::read_pdb_string(pdb, options));
}

TEST_CASE("read_pdb_string keeps the first altloc of a residue") {
  std::string pdb =
    "ATOM      1  N  ASER A   5      11.104   6.134  -6.504  0.60  0.00           N  \n"
    "ATOM      2  CA ASER A   5      11.639   6.071  -5.147  0.60  0.00           C  \n"
    "ATOM      3  N  BTHR A   5      11.200   6.100  -6.500  0.40  0.00           N  \n"
    "ATOM      4  CA BTHR A   5      11.700   6.100  -5.100  0.40  0.00           C  \n"
    "ATOM      5  N   GLY A   6      13.000   6.000  -4.000  1.00  0.00           N  \n";
  biods::AtomArray atoms = biods::read_pdb_string(pdb);
  REQUIRE_EQ(atoms.size(), 3);
  CHECK_EQ(atoms.res_name, (std::vector<std::string>{"SER", "SER", "GLY"}));
  CHECK_EQ(atoms.atom_id, (std::vector<int>{1, 2, 5}));
}

TEST_CASE("write_pdb") {
  biods::AtomArray atoms;
  biods::AtomRecord rec;
  rec.chain_id = "A";
  rec.res_id = 7;
  rec.res_name = "GLY";
  rec.atom_name = "CA";
  rec.element = "C";
  rec.pos = biods::Vec3(-1.25, 2.5, 100.125);
  rec.b_factor = 15.5f;
  atoms.add_atom(rec);
  rec.atom_name = "O";
  rec.element = "O";
  rec.pos = biods::Vec3::nan();
  atoms.add_atom(rec);
  rec.chain_id = "BB";
  rec.atom_name = "N";
  rec.element = "N";
  rec.pos = biods::Vec3(0, 0, -0.0001);
  atoms.add_atom(rec);

  std::string pdb = biods::make_pdb_string(atoms);
  CHECK(pdb.find("ATOM      1  CA  GLY A   7      -1.250   2.500 100.125") == 0);
  CHECK(pdb.find("TER       2      GLY A   7") != std::string::npos);
  CHECK(pdb.find("-0.000") == std::string::npos);
  biods::AtomArray back = biods::read_pdb_string(pdb);
  // the atom with NaN coordinates is not written
  REQUIRE_EQ(back.size(), 2);
  CHECK_EQ(back.chain_id[1], "BB");
  CHECK_EQ(back.atom_name[1], "N");
  CHECK_EQ(back.b_factor[0], doctest::Approx(15.5));
  CHECK_EQ(back.coord[0].z, doctest::Approx(100.125));

  atoms.chain_id[0] = "AAA";
  CHECK_THROWS(biods::make_pdb_string(atoms));
}

TEST_CASE("coor_format_from_ext") {
  CHECK(biods::coor_format_from_ext("1abc.pdb.gz") == biods::CoorFormat::Pdb);
  CHECK(biods::coor_format_from_ext("pdb1abc.ent") == biods::CoorFormat::Pdb);
  CHECK(biods::coor_format_from_ext("1ABC.CIF") == biods::CoorFormat::Mmcif);
  CHECK(biods::coor_format_from_ext("1abc.bcif") == biods::CoorFormat::Bcif);
  CHECK(biods::coor_format_from_ext("1abc.txt") == biods::CoorFormat::Unknown);
  CHECK_THROWS(biods::read_atoms_from_file("1abc.txt"));
}

TEST_CASE("AtomArray") {
  biods::AtomArray atoms;
  biods::AtomRecord rec;
  const char* chains[] = {"B", "B", "B", "A", "B"};
  int res_ids[] = {1, 1, 2, 1, 3};
  for (int i = 0; i != 5; ++i) {
    rec.chain_id = chains[i];
    rec.res_id = res_ids[i];
    rec.res_name = "GLY";
    rec.atom_name = i == 1 ? "CA" : "N";
    rec.pos = biods::Vec3(i, 0, 0);
    atoms.add_atom(rec);
  }
  CHECK_EQ(atoms.residue_starts(), std::vector<int>{0, 2, 3, 4});
  CHECK_EQ(atoms.atom_residue_indices(), std::vector<int>{0, 0, 1, 2, 3});
  CHECK_EQ(atoms.chain_ids(), std::vector<std::string>{"B", "A"});
  biods::AtomArray sel = atoms.select({true, false, false, true, false});
  REQUIRE_EQ(sel.size(), 2);
  CHECK_EQ(sel.chain_id[1], "A");
  CHECK_THROWS(atoms.select({true}));
  CHECK_THROWS_AS(atoms.take({5}), std::out_of_range);
  biods::AtomArray both = biods::concatenate({sel, sel});
  CHECK_EQ(both.size(), 4);
  CHECK_EQ(both.atom(2).chain_id, "B");
  atoms.coord[4] = biods::Vec3::nan();
  CHECK_EQ(atoms.nan_mask(), std::vector<bool>{false, false, false, false, true});
}
