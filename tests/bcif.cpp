#include <doctest/doctest.h>

#include <cmath>    // for nan
#include <cstring>  // for memcpy
#include <limits>
#include <biods/bcif.hpp>
#include <biods/cif.hpp>

namespace bcif = biods::bcif;
namespace cif = biods::cif;

static bcif::EncodedColumn encode(const std::vector<std::string>& raw, int max_decimals=6) {
  std::vector<const std::string*> ptrs;
  for (const std::string& s : raw)
    ptrs.push_back(&s);
  return bcif::encode_column("col", ptrs, max_decimals);
}

TEST_CASE("bcif::format_fixed") {
  CHECK_EQ(bcif::format_fixed(-5, 2), "-0.05");
  CHECK_EQ(bcif::format_fixed(12345, 3), "12.345");
  CHECK_EQ(bcif::format_fixed(7, 0), "7");
  CHECK_EQ(bcif::format_fixed(0, 1), "0.0");
}

TEST_CASE("bcif::encode_integers") {
  std::vector<std::vector<std::int32_t>> inputs = {
    {},
    {42},
    {1, 2, 3, 4, 5, 6, 7, 8, 9, 10},
    {7, 7, 7, 7, 7, 7, 7, 7, 7, 7, 7, 7},
    {-300, 70000, 0, 127, 128, -128, -129, 255, 256, 32767, -32768},
    {INT32_MAX, INT32_MIN, 0},
  };
  for (const std::vector<std::int32_t>& v : inputs) {
    bcif::EncodedData data = bcif::encode_integers(v);
    CHECK(data.encoding.back().kind == bcif::EncodingKind::ByteArray);
    CHECK_EQ(bcif::decode_integers(data), v);
  }
  // sequential ids compress to a few bytes
  std::vector<std::int32_t> ids;
  for (int i = 1; i <= 1000; ++i)
    ids.push_back(i);
  bcif::EncodedData data = bcif::encode_integers(ids);
  CHECK(data.data.size() < 10);
  CHECK(data.encoding[0].kind == bcif::EncodingKind::Delta);
  CHECK_EQ(data.encoding[0].origin, 1);
}

TEST_CASE("bcif::encode_column picks the value kind") {
  bcif::EncodedColumn ints = encode({"1", "-20", "300"});
  bcif::Values v = bcif::decode(ints.data);
  CHECK(v.kind == bcif::ValueKind::Int);
  CHECK(!ints.has_mask);

  bcif::EncodedColumn fixed = encode({"1.50", "-0.25", "?", "10.00"});
  CHECK(fixed.has_mask);
  CHECK(fixed.data.encoding[0].kind == bcif::EncodingKind::FixedPoint);
  v = bcif::decode(fixed.data);
  CHECK(v.kind == bcif::ValueKind::Fixed);
  CHECK_EQ(v.decimals, 2);
  CHECK_EQ(v.to_cif(0), "1.50");
  CHECK_EQ(v.to_cif(1), "-0.25");
  std::vector<std::int32_t> mask = bcif::decode_integers(fixed.mask);
  CHECK_EQ(mask, std::vector<std::int32_t>{0, 0, 2, 0});

  // "1.50" would not be the same text as "1.5", so strings are used
  bcif::EncodedColumn mixed = encode({"1.5", "1.50"});
  CHECK(bcif::decode(mixed.data).kind == bcif::ValueKind::String);
  // leading zeros and '+' make integers non-canonical
  CHECK(bcif::decode(encode({"007"}).data).kind == bcif::ValueKind::String);
  CHECK(bcif::decode(encode({"+1"}).data).kind == bcif::ValueKind::String);
  // too many decimal places
  CHECK(bcif::decode(encode({"0.1234567"}).data).kind == bcif::ValueKind::String);
  CHECK(bcif::decode(encode({"0.1234567"}, 7).data).kind == bcif::ValueKind::Fixed);
}

TEST_CASE("bcif::encode_strings") {
  std::vector<std::string> values = {"ALA", "GLY", "", "ALA", "x y"};
  std::vector<std::uint8_t> masked = {0, 0, 1, 0, 0};
  bcif::EncodedData data = bcif::encode_strings(values, masked);
  REQUIRE_EQ(data.encoding.size(), 1);
  const bcif::Encoding& sa = data.encoding[0];
  CHECK(sa.kind == bcif::EncodingKind::StringArray);
  CHECK_EQ(sa.string_array->string_data, "ALAGLYx y");
  bcif::Values v = bcif::decode(data);
  CHECK(v.kind == bcif::ValueKind::String);
  CHECK_EQ(v.strings, values);
  CHECK_EQ(v.to_cif(4), "'x y'");
}

TEST_CASE("BinaryCIF document round-trip") {
  cif::Document doc = cif::read_string(
      "data_1ABC\n"
      "_entry.id 1ABC\n"
      "_cell.length_a 50.120\n"
      "loop_\n"
      "_atom_site.id\n"
      "_atom_site.label_atom_id\n"
      "_atom_site.Cartn_x\n"
      "_atom_site.pdbx_PDB_ins_code\n"
      "_atom_site.label_alt_id\n"
      "1 N 1.500 ? .\n"
      "2 CA -2.250 ? A\n"
      "3 \"O5'\" 10.125 B .\n"
      "loop_\n"
      "_skipped.a\n"
      "1\n2\n");
  biods::BcifWriteOptions options;
  options.skip_categories.push_back("_skipped");
  std::vector<char> buf = biods::write_bcif_to_buffer(doc, options);
  CHECK(biods::is_bcif_data(buf.data(), buf.size()));
  cif::Document doc2 = biods::read_bcif_memory(buf.data(), buf.size(), "buf");
  cif::Block& block = doc2.sole_block();
  CHECK_EQ(block.name, "1ABC");
  CHECK_EQ(*block.find_value("_entry.id"), "1ABC");
  CHECK_EQ(*block.find_value("_cell.length_a"), "50.120");
  CHECK(!block.find_loop("_skipped.a"));
  cif::Column x = block.find_loop("_atom_site.Cartn_x");
  REQUIRE_EQ(x.length(), 3);
  CHECK_EQ(x[0], "1.500");
  CHECK_EQ(x[1], "-2.250");
  CHECK_EQ(x[2], "10.125");
  cif::Column name = block.find_loop("_atom_site.label_atom_id");
  CHECK_EQ(name.str(2), "O5'");
  cif::Column ins = block.find_loop("_atom_site.pdbx_PDB_ins_code");
  CHECK_EQ(ins[0], "?");
  CHECK_EQ(ins[2], "B");
  cif::Column alt = block.find_loop("_atom_site.label_alt_id");
  CHECK_EQ(alt[0], ".");
  CHECK_EQ(alt[1], "A");
}

TEST_CASE("read_bcif_memory errors") {
  const char not_msgpack[] = "data_x";
  CHECK(!biods::is_bcif_data(not_msgpack, sizeof(not_msgpack) - 1));
  const char truncated[] = "\x81\xaa" "dataBlo";
  CHECK_THROWS_AS(biods::read_bcif_memory(truncated, sizeof(truncated) - 1, "t"),
                  std::runtime_error);
}

TEST_CASE("bcif::decode IntervalQuantization") {
  bcif::EncodedData data = bcif::encode_integers({0, 5, 10, 2});
  bcif::Encoding iq(bcif::EncodingKind::IntervalQuantization);
  iq.min = -1.0;
  iq.max = 1.0;
  iq.num_steps = 11;
  iq.src_type = bcif::DataType::Float32;
  data.encoding.insert(data.encoding.begin(), iq);
  bcif::Values v = bcif::decode(data);
  CHECK(v.kind == bcif::ValueKind::Float);
  CHECK(v.single_precision);
  REQUIRE_EQ(v.floats.size(), 4);
  CHECK_EQ(v.floats[0], doctest::Approx(-1.0));
  CHECK_EQ(v.floats[1], doctest::Approx(0.0));
  CHECK_EQ(v.floats[2], doctest::Approx(1.0));
  CHECK_EQ(v.floats[3], doctest::Approx(-0.6));

  data.encoding[0].num_steps = 1;
  CHECK_THROWS_AS(bcif::decode(data), std::runtime_error);
}

TEST_CASE("bcif::decode checks srcSize") {
  // (value, count) pairs
  bcif::EncodedData rle = bcif::encode_integers({7, 3, 8, 2});
  bcif::Encoding run_length(bcif::EncodingKind::RunLength);
  run_length.src_size = 5;
  rle.encoding.insert(rle.encoding.begin(), run_length);
  CHECK_EQ(bcif::decode_integers(rle), (std::vector<std::int32_t>{7, 7, 7, 8, 8}));
  rle.encoding[0].src_size = 6;
  CHECK_THROWS_AS(bcif::decode(rle), std::runtime_error);
  rle.encoding[0].src_size = std::numeric_limits<std::int32_t>::max();
  CHECK_THROWS_AS(bcif::decode(rle), std::runtime_error);

  bcif::EncodedData packed;
  packed.data = {1, 2, 3};
  bcif::Encoding packing(bcif::EncodingKind::IntegerPacking);
  packing.byte_count = 1;
  packing.src_size = 3;
  bcif::Encoding bytes(bcif::EncodingKind::ByteArray);
  bytes.type = bcif::DataType::Int8;
  packed.encoding = {packing, bytes};
  CHECK_EQ(bcif::decode_integers(packed), (std::vector<std::int32_t>{1, 2, 3}));
  packed.encoding[0].src_size = 4;
  CHECK_THROWS_AS(bcif::decode(packed), std::runtime_error);
  packed.encoding[0].src_size = std::numeric_limits<std::int32_t>::max();
  CHECK_THROWS_AS(bcif::decode(packed), std::runtime_error);
}

TEST_CASE("write_bcif_to_buffer rejects save frames") {
  cif::Document doc = cif::read_string(
      "data_d\n"
      "_entry.id d\n"
      "save_frame1\n"
      "_item.name x\n"
      "save_\n");
  CHECK_THROWS_AS(biods::write_bcif_to_buffer(doc), std::runtime_error);
}

namespace {

// Writes the small subset of MessagePack used to build test files by hand.
struct MsgpackText {
  std::string buf;

  MsgpackText& map(int n) { buf += char(0x80 | n); return *this; }
  MsgpackText& array(int n) { buf += char(0x90 | n); return *this; }
  MsgpackText& str(const std::string& s) {  // fixstr, up to 31 bytes
    buf += char(0xa0 | s.size());
    buf += s;
    return *this;
  }
  MsgpackText& fixint(int n) { buf += char(n); return *this; }  // up to 127
  MsgpackText& float64(double d) {
    std::uint64_t u;
    std::memcpy(&u, &d, 8);
    buf += '\xcb';
    for (int shift = 56; shift >= 0; shift -= 8)
      buf += char((u >> shift) & 0xff);
    return *this;
  }
  MsgpackText& bin(const std::string& b) {  // bin8
    buf += '\xc4';
    buf += char(b.size());
    buf += b;
    return *this;
  }
};

// encoded data: Int8 values stored with a single ByteArray encoding
void add_int8_data(MsgpackText& mp, const std::string& bytes,
                   const std::string& kind="ByteArray") {
  mp.map(2).str("encoding").array(1)
    .map(2).str("kind").str(kind).str("type").fixint(1)
    .str("data").bin(bytes);
}

// one block with category _c and column v
std::string make_bcif(int row_count, const std::string& values,
                      const std::string* mask=nullptr,
                      const std::string& kind="ByteArray") {
  MsgpackText mp;
  mp.map(1).str("dataBlocks").array(1)
    .map(2).str("header").str("x").str("categories").array(1)
    .map(3).str("name").str("_c").str("rowCount").fixint(row_count)
    .str("columns").array(1)
    .map(mask ? 3 : 2).str("name").str("v").str("data");
  add_int8_data(mp, values, kind);
  if (mask) {
    mp.str("mask");
    add_int8_data(mp, *mask);
  }
  return mp.buf;
}

cif::Document read_bcif_string(const std::string& s) {
  return biods::read_bcif_memory(s.data(), s.size(), "test");
}

} // anonymous namespace

TEST_CASE("read_bcif_memory from hand-written MessagePack") {
  std::string values("\x01\x02\x03", 3);
  std::string mask("\x00\x02\x01", 3);
  cif::Document doc = read_bcif_string(make_bcif(3, values, &mask));
  cif::Column col = doc.sole_block().find_loop("_c.v");
  REQUIRE_EQ(col.length(), 3);
  CHECK_EQ(col[0], "1");
  CHECK_EQ(col[1], "?");
  CHECK_EQ(col[2], ".");

  // rowCount does not match the number of values
  CHECK_THROWS_AS(read_bcif_string(make_bcif(4, values)), std::runtime_error);
  // mask of a wrong length
  std::string short_mask("\x00\x00", 2);
  CHECK_THROWS_AS(read_bcif_string(make_bcif(3, values, &short_mask)),
                  std::runtime_error);
  // unknown encoding
  CHECK_THROWS_AS(read_bcif_string(make_bcif(3, values, nullptr, "Huffman")),
                  std::runtime_error);

  // an integer field given as NaN
  MsgpackText mp;
  mp.map(1).str("dataBlocks").array(1)
    .map(2).str("header").str("x").str("categories").array(1)
    .map(3).str("name").str("_c").str("rowCount").float64(std::nan(""))
    .str("columns").array(0);
  CHECK_THROWS_AS(read_bcif_string(mp.buf), std::runtime_error);
}
