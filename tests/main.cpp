#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <climits>  // for INT_MIN, INT_MAX
#include <cmath>    // for isnan
#include <stdexcept>
#include <string>
#include <vector>
#include <biods/array2d.hpp>
#include <biods/atox.hpp>
#include <biods/elem.hpp>
#include <biods/logger.hpp>
#include <biods/math.hpp>
#include <biods/sprintf.hpp>
#include <biods/util.hpp>

TEST_CASE("Transform::combine") {
  biods::Transform a;
  a.mat = biods::Mat33(0, -1, 0, 1, 0, 0, 0, 0, 1);  // 90 deg around z
  a.vec = biods::Vec3(1, 0, 0);
  biods::Transform b;
  b.vec = biods::Vec3(0, 0, 5);
  biods::Vec3 v(2, 3, 4);
  biods::Vec3 expected = a.apply(b.apply(v));
  biods::Vec3 combined = a.combine(b).apply(v);
  CHECK(combined.approx(expected, 1e-12));
  CHECK(combined.approx(biods::Vec3(-2, 2, 9), 1e-12));
  CHECK(biods::Transform().is_identity());
}

TEST_CASE("Vec3::nan") {
  biods::Vec3 v = biods::Vec3::nan();
  CHECK(v.has_nan());
  CHECK(std::isnan(v.dist(biods::Vec3())));
  CHECK_THROWS_AS(v.at(3), std::out_of_range);
}

TEST_CASE("string_to_int") {
  CHECK_EQ(biods::string_to_int("-12", true), -12);
  CHECK_EQ(biods::string_to_int(" 7 ", true), 7);
  CHECK_EQ(biods::string_to_int(std::to_string(INT_MAX), true), INT_MAX);
  CHECK_EQ(biods::string_to_int(std::to_string(INT_MIN), true), INT_MIN);
  CHECK_THROWS_AS(biods::string_to_int("12a", true), std::invalid_argument);
  CHECK_THROWS_AS(biods::string_to_int("", true), std::invalid_argument);
}

TEST_CASE("split_str and join_str") {
  std::vector<std::string> v = biods::split_str_multi("  N CA\tC  O ");
  CHECK_EQ(v.size(), 4);
  CHECK_EQ(v[1], "CA");
  CHECK_EQ(biods::join_str(v, ','), "N,CA,C,O");
  CHECK(biods::giends_with("1abc.CIF.gz", ".cif"));
  CHECK(!biods::giends_with("1abc.bcif", ".cif"));
}

TEST_CASE("element_from_atom_name") {
  CHECK_EQ(biods::element_from_atom_name("CA"), "C");
  CHECK_EQ(biods::element_from_atom_name("OP3"), "O");
  CHECK_EQ(biods::element_from_atom_name("C5'"), "C");
  CHECK(biods::is_hydrogen("D"));
  CHECK(!biods::is_hydrogen("HG"));
  CHECK_EQ(biods::normalize_element(" se"), "SE");
}

TEST_CASE("Logger") {
  biods::Logger quiet;
  quiet.mesg("nobody listens");
  CHECK_THROWS_WITH_AS(quiet.err("bad value ", 7), "bad value 7", std::runtime_error);

  std::vector<std::string> messages;
  biods::Logger logger;
  logger.callback = [&](const std::string& s) { messages.push_back(s); };
  logger.debug("hidden");
  logger.mesg("read ", 3, " atoms");
  logger.note("dropped OXT");
  logger.err("bad value ", 7);
  CHECK_EQ(messages, (std::vector<std::string>{"read 3 atoms", "Note: dropped OXT",
                                               "Warning: bad value 7"}));
  logger.threshold = 3;
  logger.note("hidden");
  logger.threshold = 8;
  logger.debug("shown");
  CHECK_EQ(messages.back(), "Debug: shown");
  CHECK_EQ(messages.size(), 4u);
}

TEST_CASE("to_str_fixed") {
  CHECK_EQ(biods::to_str_fixed(1.5, 3), "1.500");
  CHECK_EQ(biods::to_str_fixed(-0.25, 2), "-0.25");
}

TEST_CASE("Array2D") {
  biods::Array2D<int> a(2, 3, 7);
  CHECK_EQ(a.data.size(), 6);
  a(1, 2) = 5;
  CHECK_EQ(a.at(1, 2), 5);
  CHECK_EQ(a.data[5], 5);
  CHECK_THROWS_AS(a.at(2, 0), std::out_of_range);
  CHECK(!a.empty());
  CHECK(biods::Array2D<int>().empty());
}
