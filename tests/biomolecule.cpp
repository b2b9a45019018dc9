#include <doctest/doctest.h>

#include <cmath>  // for isnan
#include <biods/elem.hpp>     // for element_from_atom_name
#include <biods/protein.hpp>
#include <biods/util.hpp>     // for index_in_vector

namespace {

struct AtomsBuilder {
  biods::AtomArray atoms;
  AtomsBuilder& add(const char* chain, int res_id, const char* res_name,
                    const char* atom_name, biods::Vec3 pos) {
    biods::AtomRecord rec;
    rec.chain_id = chain;
    rec.res_id = res_id;
    rec.res_name = res_name;
    rec.atom_name = atom_name;
    rec.element = biods::element_from_atom_name(atom_name);
    rec.pos = pos;
    atoms.add_atom(rec);
    return *this;
  }
  // all backbone atoms of a residue, shifted along x
  AtomsBuilder& residue(const char* chain, int res_id, const char* res_name, double x) {
    add(chain, res_id, res_name, "N", biods::Vec3(x - 1, 1, 0));
    add(chain, res_id, res_name, "CA", biods::Vec3(x, 0, 0));
    add(chain, res_id, res_name, "C", biods::Vec3(x + 1, 1, 0));
    return add(chain, res_id, res_name, "O", biods::Vec3(x + 1, 2, 0));
  }
};

struct MessageCollector {
  std::vector<std::string> messages;
  biods::Logger logger() {
    biods::Logger logger;
    logger.callback = [this](const std::string& s) { messages.push_back(s); };
    logger.threshold = 8;
    return logger;
  }
  bool contains(const std::string& text) const {
    for (const std::string& m : messages)
      if (m.find(text) != std::string::npos)
        return true;
    return false;
  }
};

template<typename F>
std::string error_message(F func) {
  try {
    func();
  } catch (std::runtime_error& e) {
    return e.what();
  }
  return "";
}

} // anonymous namespace

TEST_CASE("standardisation fills in missing atoms") {
  AtomsBuilder b;
  b.residue("A", 1, "ALA", 0.0);
  b.add("A", 1, "ALA", "H", biods::Vec3(0, 0, 1));  // hydrogens are dropped
  b.residue("A", 2, "GLY", 3.8);
  b.add("A", 2, "GLY", "OXT", biods::Vec3(5, 3, 0));
  biods::ProteinDictionary dict;
  biods::ProteinChain chain(b.atoms, dict);
  chain.atoms.check_lengths();
  // ALA: N CA C O CB, GLY: N CA C O OXT
  REQUIRE_EQ(chain.atoms.size(), 10);
  CHECK_EQ(chain.num_residues(), 2);
  CHECK_EQ(chain.sequence(), "AG");
  CHECK_EQ(chain.chain_id(), "A");
  CHECK_EQ(chain.atoms.atom_name[4], "CB");
  CHECK(!chain.atoms.mask[4]);
  CHECK(std::isnan(chain.atoms.coord[4].x));
  CHECK_EQ(chain.atoms.occupancy[4], 0.f);
  CHECK_EQ(chain.atoms.element[4], "C");
  CHECK_EQ(chain.atoms.atom_name[9], "OXT");
  CHECK(chain.atoms.mask[9]);
  CHECK_EQ(chain.atoms.coord[9].x, doctest::Approx(5.0));
  CHECK_EQ(chain.atoms.restype_index[4], 0);
  CHECK_EQ(chain.atoms.atomtype_index[4], 3);
  CHECK_EQ(chain.atoms.res_index[9], 1);
  CHECK_EQ(chain.residue_starts(), std::vector<int>{0, 5});

  // without OXT the last residue has no extra slot
  biods::ProteinChain no_oxt(b.atoms, biods::ProteinDictionary(true));
  CHECK_EQ(no_oxt.atoms.size(), 9);

  // standardising standardised atoms changes nothing
  biods::ProteinChain again(chain.atoms, dict);
  CHECK_EQ(again.atoms.atom_name, chain.atoms.atom_name);
  CHECK_EQ(again.atoms.mask, chain.atoms.mask);
}

TEST_CASE("standardisation of unusual atoms and residues") {
  biods::ProteinDictionary dict;
  MessageCollector collector;
  biods::Logger logger = collector.logger();

  SUBCASE("OXT inside the chain") {
    AtomsBuilder b;
    b.residue("A", 1, "GLY", 0.0).add("A", 1, "GLY", "OXT", biods::Vec3(1, 3, 0));
    b.residue("A", 2, "GLY", 3.8);
    biods::ProteinChain chain(b.atoms, dict, biods::BiomoleculeOptions(), logger);
    CHECK_EQ(chain.atoms.size(), 9);
    CHECK(collector.contains("dropped OXT"));
  }
  SUBCASE("unknown residue") {
    AtomsBuilder b;
    b.residue("A", 1, "GLY", 0.0);
    b.add("A", 2, "HOH", "O", biods::Vec3(9, 9, 9));
    biods::ProteinChain chain(b.atoms, dict);
    CHECK_EQ(chain.sequence(), "G");
    biods::BiomoleculeOptions strict;
    strict.raise_error_on_unexpected = true;
    std::string msg = error_message([&] { biods::ProteinChain(b.atoms, dict, strict); });
    CHECK(msg.find("HOH") != std::string::npos);
  }
  SUBCASE("unexpected atom") {
    AtomsBuilder b;
    b.residue("A", 1, "GLY", 0.0).add("A", 1, "GLY", "CB", biods::Vec3(0, -1, 0));
    std::string msg = error_message([&] { biods::ProteinChain(b.atoms, dict); });
    CHECK(msg.find("unexpected atom") != std::string::npos);
  }
  SUBCASE("extra atoms of UNK are dropped") {
    AtomsBuilder b;
    b.residue("A", 1, "UNK", 0.0).add("A", 1, "UNK", "CB", biods::Vec3(0, -1, 0));
    biods::ProteinChain chain(b.atoms, dict);
    CHECK_EQ(chain.sequence(), "X");
    CHECK_EQ(chain.atoms.size(), 5);  // N CA C O OXT
  }
  SUBCASE("selenomethionine") {
    AtomsBuilder b;
    b.residue("A", 1, "MSE", 0.0).add("A", 1, "MSE", "SE", biods::Vec3(0, -2, 0));
    biods::ProteinChain chain(b.atoms, dict);
    CHECK_EQ(chain.sequence(), "M");
    CHECK_EQ(chain.atoms.res_name[0], "MET");
    int sd = biods::index_in_vector(std::string("SD"), chain.atoms.atom_name);
    REQUIRE(sd >= 0);
    CHECK(chain.atoms.mask[sd]);
    CHECK_EQ(chain.atoms.coord[sd].y, doctest::Approx(-2.0));
  }
  SUBCASE("backbone only") {
    AtomsBuilder b;
    b.residue("A", 1, "ALA", 0.0);
    biods::BiomoleculeOptions options;
    options.backbone_only = true;
    biods::ProteinChain chain(b.atoms, dict, options);
    CHECK_EQ(chain.atoms.size(), 4);
    CHECK(chain.backbone_only);
  }
  SUBCASE("more than one chain") {
    AtomsBuilder b;
    b.residue("A", 1, "GLY", 0.0).residue("B", 1, "GLY", 5.0);
    CHECK_THROWS(biods::ProteinChain(b.atoms, dict));
  }
}

TEST_CASE("protein representations") {
  AtomsBuilder b;
  b.residue("A", 1, "GLY", 0.0);
  b.residue("A", 2, "ALA", 3.8).add("A", 2, "ALA", "CB", biods::Vec3(3.8, -1.5, 0));
  biods::ProteinChain chain(b.atoms);
  std::vector<biods::Vec3> cb = chain.beta_carbon_coords();
  REQUIRE_EQ(cb.size(), 2);
  CHECK_EQ(cb[0].x, doctest::Approx(0.0));   // CA of glycine
  CHECK_EQ(cb[1].y, doctest::Approx(-1.5));

  biods::Array2D<biods::Vec3> a14 = chain.atom14_coords();
  CHECK_EQ(a14.rows, 2);
  CHECK_EQ(a14.cols, 14);
  CHECK_EQ(a14(1, 4).y, doctest::Approx(-1.5));
  CHECK(a14(0, 4).has_nan());
  biods::Array2D<biods::Vec3> a37 = chain.atom37_coords();
  CHECK_EQ(a37.cols, 37);
  CHECK_EQ(a37(1, 3).y, doctest::Approx(-1.5));
  CHECK(a37(1, 36).has_nan());  // OXT of the last residue was filled in
  CHECK(a37(0, 3).has_nan());

  biods::Array2D<biods::Vec3> bb = chain.backbone_coords({"CA", "CB"});
  CHECK_EQ(bb.cols, 2);
  CHECK_EQ(bb(0, 1).x, doctest::Approx(0.0));
  CHECK_THROWS(chain.backbone_coords({"CG"}));
  CHECK_THROWS(chain.Biomolecule::backbone_coords({"CB"}));

  biods::Biomolecule backbone = chain.backbone();
  CHECK_EQ(backbone.atoms.size(), 8);
  CHECK_EQ(backbone.num_residues(), 2);
  biods::Biomolecule second = chain.slice_residues(1, 2);
  CHECK_EQ(second.sequence(), "A");
  CHECK_THROWS_AS(chain.slice_residues(1, 3), std::out_of_range);
}

TEST_CASE("distances and contacts") {
  AtomsBuilder b;
  b.add("A", 1, "GLY", "CA", biods::Vec3(0, 0, 0));
  b.add("A", 2, "GLY", "CA", biods::Vec3(3, 0, 0));
  b.add("A", 3, "GLY", "CA", biods::Vec3(10, 0, 0));
  b.add("A", 4, "GLY", "N", biods::Vec3(20, 0, 0));
  biods::ProteinChain chain(b.atoms);
  CHECK_EQ(chain.num_residues(), 4);

  biods::Array2D<double> d = chain.distances({"CA"});
  CHECK_EQ(d.rows, 4);
  CHECK_EQ(d(0, 1), doctest::Approx(3.0));
  CHECK_EQ(d(1, 2), doctest::Approx(7.0));
  CHECK_EQ(d(0, 0), doctest::Approx(0.0));
  CHECK(std::isnan(d(0, 3)));
  CHECK(std::isnan(d(3, 3)));

  d = chain.distances({"CA"}, {}, {}, biods::NanFill::row_max());
  CHECK_EQ(d(0, 3), doctest::Approx(10.0));
  CHECK(std::isnan(d(3, 0)));  // the whole row is NaN
  d = chain.distances({"CA"}, {}, {}, biods::NanFill::with_value(99.));
  CHECK_EQ(d(3, 0), doctest::Approx(99.0));

  // N of residue 4 makes the min over N and CA finite
  d = chain.distances({"N", "CA"});
  CHECK_EQ(d(2, 3), doctest::Approx(10.0));
  d = chain.distances({"N", "CA"}, {}, {}, biods::NanFill(), biods::DistanceReduce::Max);
  CHECK_EQ(d(0, 2), doctest::Approx(10.0));

  d = chain.distances({"CA"}, {true, false, false, false}, {false, true, true, false});
  CHECK_EQ(d.rows, 1);
  CHECK_EQ(d.cols, 2);
  CHECK_EQ(d(0, 1), doctest::Approx(10.0));
  CHECK_THROWS(chain.distances({"CA"}, {true}));

  biods::Array2D<std::int8_t> c = chain.contacts("CA", 8.0);
  CHECK_EQ(c(0, 1), 1);
  CHECK_EQ(c(0, 2), 0);
  CHECK_EQ(c(1, 2), 1);
  CHECK_EQ(c(0, 3), 0);

  biods::Array2D<int> sep = chain.residue_separations();
  CHECK_EQ(sep(0, 3), 3);
  CHECK_EQ(sep(2, 1), 1);
}

TEST_CASE("BiomoleculeComplex") {
  AtomsBuilder b;
  b.add("B", 1, "GLY", "CA", biods::Vec3(5, 0, 0));
  b.add("B", 2, "GLY", "CA", biods::Vec3(50, 0, 0));
  b.add("A", 1, "GLY", "CA", biods::Vec3(0, 0, 0));
  b.add("A", 2, "ALA", "CA", biods::Vec3(20, 0, 0));
  b.add("W", 1, "HOH", "O", biods::Vec3(0, 9, 0));
  MessageCollector collector;
  biods::ProteinComplex complex = biods::ProteinComplex::from_atoms(
      b.atoms, biods::ProteinDictionary(), biods::BiomoleculeOptions(), collector.logger());
  CHECK(collector.contains("chain W"));
  CHECK_EQ(complex.chain_ids(), std::vector<std::string>{"A", "B"});
  CHECK_EQ(complex.num_residues(), 4);
  CHECK_EQ(complex.sequence(), "GAGG");
  CHECK_EQ(complex.get_chain("B").sequence(), "GG");
  CHECK_THROWS(complex.get_chain("C"));
  CHECK_EQ(complex.atoms.res_index.back(), 3);

  biods::Array2D<double> d = complex.interface_distances({"CA"}, {"", ""});
  REQUIRE_EQ(d.rows, 2);
  REQUIRE_EQ(d.cols, 2);
  CHECK_EQ(d(0, 0), doctest::Approx(5.0));
  CHECK_EQ(d(0, 1), doctest::Approx(50.0));
  CHECK_EQ(d(1, 0), doctest::Approx(15.0));
  CHECK_EQ(d(1, 1), doctest::Approx(30.0));
  d = complex.interface_distances({"CA"}, {"B", "A"});
  CHECK_EQ(d(1, 0), doctest::Approx(50.0));
  CHECK_THROWS(complex.interface_distances({"CA"}, {"A", "C"}));

  biods::ProteinComplex iface = complex.interface({"CA"}, {"A", "B"}, 10.0);
  CHECK_EQ(iface.chain_ids(), std::vector<std::string>{"A", "B"});
  CHECK_EQ(iface.num_residues(), 2);
  CHECK_EQ(iface.sequence(), "GG");
  CHECK_EQ(iface.get_chain("A").atoms.res_id[0], 1);
  CHECK_EQ(complex.interface({"CA"}, {"A", "B"}, 1.0).num_residues(), 0);

  biods::ProteinChain single = complex.get_chain("A");
  biods::ProteinComplex one = single.to_complex();
  CHECK_EQ(one.chain_ids(), std::vector<std::string>{"A"});
  CHECK_THROWS(one.interface_distances({"CA"}, {"", ""}));
}

TEST_CASE("Biomolecule output") {
  AtomsBuilder b;
  b.residue("A", 1, "ALA", 0.0);
  biods::ProteinChain chain(b.atoms);
  std::string pdb = chain.to_pdb_string();
  // CB and OXT have no coordinates and are not written
  CHECK(pdb.find(" CB ") == std::string::npos);
  CHECK(pdb.find(" CA  ALA A   1") != std::string::npos);
}
