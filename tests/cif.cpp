#include <doctest/doctest.h>

#include <cstdio>   // for remove
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <biods/cif.hpp>
#include <biods/dirwalk.hpp>
#include <biods/fileutil.hpp>  // for make_directories, path_join
#include <biods/to_cif.hpp>

namespace cif = biods::cif;

TEST_CASE("cif::Column") {
  cif::Document doc = cif::read_string("data_1"
          " loop_ _a _b _c _d a1 b1 c1 d1 a2 b2 c2 d2"
          " _pair 1");
  cif::Block& block = doc.blocks[0];
  cif::Column col_c = block.find_loop("_c");
  CHECK_EQ(col_c.length(), 2);
  CHECK_EQ(col_c.at(0), "c1");
  CHECK_EQ(col_c.at(-1), "c2");
  CHECK_THROWS_AS(col_c.at(2), std::out_of_range);
  cif::Column pair = block.find_values("_pair");
  CHECK_EQ(pair.length(), 1);
  CHECK_EQ(pair.str(0), "1");
  CHECK(!block.find_loop("_pair"));
  CHECK(!block.find_values("_nothing"));
}

TEST_CASE("cif::Table") {
  cif::Document doc = cif::read_string(
      "data_t\n"
      "_cat.id 'one two'\n"
      "_cat.value ?\n"
      "loop_\n_x.a\n_x.b\n1 .\n2 'q'\n");
  cif::Block& block = doc.sole_block();
  cif::Table pairs = block.find("_cat.", {"id", "value", "?missing"});
  REQUIRE(pairs.ok());
  CHECK_EQ(pairs.length(), 1);
  auto row = pairs[0];
  CHECK_EQ(row.str(0), "one two");
  CHECK(row.has(1));
  CHECK(!row.has2(1));
  CHECK(!row.has(2));
  cif::Table loop = block.find("_x.", {"a", "b"});
  CHECK_EQ(loop.length(), 2);
  CHECK(cif::is_null(loop[0][1]));
  CHECK_EQ(loop[1].str(1), "q");
  CHECK(!block.find("_x.", {"c"}).ok());
  cif::Loop& cat_loop = block.init_mmcif_loop("_cat", {"id"});
  cat_loop.values.push_back("3");
  REQUIRE_EQ(block.items.size(), 2);
  CHECK_EQ(block.items[0].loop.tags[0], "_x.a");
  CHECK_EQ(block.find_loop("_cat.id").length(), 1);
  CHECK(!block.find_value("_cat.value"));
}

TEST_CASE("cif::quote") {
  CHECK_EQ(cif::quote("CA"), "CA");
  CHECK_EQ(cif::quote("O5'"), "\"O5'\"");
  CHECK_EQ(cif::quote("a b"), "'a b'");
  CHECK_EQ(cif::quote("?"), "'?'");
  CHECK_EQ(cif::quote(""), "''");
  CHECK_EQ(cif::quote("loop_"), "'loop_'");
  CHECK_EQ(cif::as_string("'a b'"), "a b");
}

TEST_CASE("cif syntax errors") {
  CHECK_THROWS(cif::read_string("data_a _tag"));
  CHECK_THROWS(cif::read_string("data_a _tag 1 _tag 2"));
  CHECK_THROWS(cif::read_string("data_a _t 1 data_a _u 2"));
  // relaxations: bare data_, empty loop, case-insensitive keywords
  CHECK_NOTHROW(cif::read_string("DATA_x LOOP_ _a _b\n"));
  CHECK_NOTHROW(cif::read_string("data_ _a 1"));
}

static std::string parse_error_of(const std::string& text) {
  try {
    cif::read_string(text);
  } catch (std::runtime_error& e) {
    return e.what();
  }
  return "";
}

TEST_CASE("cif syntax error messages") {
  auto has = [](const std::string& msg, const char* part) {
    return msg.find(part) != std::string::npos;
  };
  CHECK(has(parse_error_of("data_a _t 'abc\n"), "unterminated 'string'"));
  CHECK(has(parse_error_of("data_a _t\n;text\n"), "unterminated text field"));
  CHECK(has(parse_error_of("data_a _t loop_"), "expected value"));
  CHECK(has(parse_error_of("data_a loop_ _x _y 1 2 3"), "Wrong number of values"));
  CHECK(has(parse_error_of("data_a _t 1 _t 2"), "duplicate tag _t"));
}

TEST_CASE("write_cif_to_stream") {
  cif::Document doc = cif::read_string(
      "data_w _one.a 1 _one.b 'x y' loop_ _two.c 1 2 3");
  std::ostringstream os;
  cif::write_cif_to_stream(os, doc, cif::WriteOptions());
  cif::Document doc2 = cif::read_string(os.str());
  cif::Block& block = doc2.sole_block();
  CHECK_EQ(block.name, "w");
  CHECK_EQ(cif::as_string(block.find_value("_one.b")), "x y");
  CHECK_EQ(block.find_loop("_two.c").length(), 3);
}

TEST_CASE("write_cif_to_stream with options") {
  cif::Document doc = cif::read_string("data_w _one.a 1 _one.b 'x y'"
      " loop_ _two.c _two.d 1 abc 22 d loop_ _three.e x");
  std::ostringstream plain;
  cif::write_cif_to_stream(plain, doc);
  CHECK_EQ(plain.str(), "data_w\n_one.a 1\n_one.b 'x y'\n\n"
                        "loop_\n_two.c\n_two.d\n1 abc\n22 d\n\n"
                        "loop_\n_three.e\nx\n");
  cif::WriteOptions options;
  options.prefer_pairs = true;
  options.misuse_hash = true;
  options.align_loops = 30;
  std::ostringstream pdbx;
  cif::write_cif_to_stream(pdbx, doc, options);
  CHECK_EQ(pdbx.str(), "data_w\n#\n_one.a 1\n_one.b 'x y'\n#\n"
                       "loop_\n_two.c\n_two.d\n1  abc\n22 d\n#\n"
                       "_three.e x\n#\n");
}

TEST_CASE("find_cif_files") {
  using biods::path_join;
  const std::string top = "biods_test_walk";
  biods::make_directories(path_join(top, "b"));
  const char* names[] = {"z.mmcif", "a.cif", "notes.txt", "b/x.cif.gz", "b/c.CIF"};
  for (const char* name : names)
    std::ofstream(path_join(top, name)) << "data_x\n";
  std::vector<std::string> found = biods::find_cif_files(top);
  CHECK_EQ(found, (std::vector<std::string>{"a.cif", "b/c.CIF", "b/x.cif.gz", "z.mmcif"}));
  CHECK_THROWS_AS(biods::find_cif_files(path_join(top, "nothing")), std::runtime_error);
  for (const char* name : names)
    std::remove(path_join(top, name).c_str());
  std::remove(path_join(top, "b").c_str());
  std::remove(top.c_str());
}
