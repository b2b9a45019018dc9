// Copyright The biods Developers.

#include <biods/pdb.hpp>
#include <algorithm>          // for swap
#include <cctype>             // for isalpha
#include <sstream>            // for ostringstream
#include <biods/atof.hpp>     // for fast_from_chars
#include <biods/atox.hpp>     // for is_space, string_to_int
#include <biods/elem.hpp>     // for element_from_atom_name, is_hydrogen
#include <biods/gz.hpp>       // for MaybeGzipped
#include <biods/sprintf.hpp>  // for snprintf_z

namespace biods {

namespace {

int read_int(const char* p, int field_length) {
  return string_to_int(p, false, field_length);
}

double read_double(const char* p, int field_length) {
  double d = 0.;
  // we don't check for errors here
  fast_from_chars(p, p + field_length, d);
  return d;
}

std::string read_string(const char* p, int field_length) {
  // left trim
  while (field_length != 0 && is_space(*p)) {
    ++p;
    --field_length;
  }
  // EOL/EOF ends the string
  for (int i = 0; i < field_length; ++i)
    if (p[i] == '\n' || p[i] == '\r' || p[i] == '\0') {
      field_length = i;
      break;
    }
  // right trim
  while (field_length != 0 && is_space(p[field_length-1]))
    --field_length;
  return std::string(p, field_length);
}

// The standard charge format is 2+, but some files have +2.
int read_charge(char digit, char sign) {
  if (sign == ' ' && digit == ' ')  // by far the most common case
    return 0;
  if (sign >= '0' && sign <= '9')
    std::swap(digit, sign);
  if (digit >= '0' && digit <= '9') {
    if (sign != '+' && sign != '-' && sign != '\0' && !is_space(sign))
      fail("Wrong format for charge: ", digit, sign);
    return (digit - '0') * (sign == '-' ? -1 : 1);
  }
  return 0;
}

} // anonymous namespace

AtomArray read_pdb_from_stream(AnyStream& line_reader, const std::string& source,
                               const AtomSiteReadOptions& options) {
  AtomArray atoms;
  char line[122] = {0};
  int line_num = 0;
  int model_num = 0;  // 0 before the first MODEL record
  int wanted_model = options.model;
  bool after_wanted_model = false;
  FirstAltlocFilter altloc_filter;
  auto wrong = [&](const std::string& msg) {
    fail(source, ":", line_num, ": ", msg);
  };
  while (size_t len = line_reader.copy_line(line, 121)) {
    ++line_num;
    if (is_record_type(line, "ATOM") || is_record_type(line, "HETA")) {
      if (len < 55)
        wrong("The line is too short to be correct:\n" + std::string(line));
      int num = model_num == 0 ? 1 : model_num;
      if (wanted_model == 0)
        wanted_model = num;
      if (num != wanted_model)
        continue;
      AtomRecord rec;
      rec.hetero = (line[0] & ~0x20) == 'H';
      rec.atom_id = read_int(line+6, 5);
      rec.atom_name = read_string(line+12, 4);
      rec.res_name = read_string(line+17, 3);
      rec.chain_id = read_string(line+20, 2);
      rec.res_id = read_int(line+22, 4);
      if (line[26] != '\n' && line[26] != '\r' && !is_space(line[26]))
        rec.ins_code = line[26];
      rec.pos.x = read_double(line+30, 8);
      rec.pos.y = read_double(line+38, 8);
      rec.pos.z = read_double(line+46, 8);
      if (len > 58)
        rec.occupancy = (float) read_double(line+54, 6);
      if (len > 64)
        rec.b_factor = (float) read_double(line+60, 6);
      if (len > 76 && (std::isalpha(line[76]) || std::isalpha(line[77])))
        rec.element = normalize_element(read_string(line+76, 2));
      else
        rec.element = element_from_atom_name(std::string(line+12, 4));
      rec.charge = len > 78 ? read_charge(line[78], line[79]) : 0;
      if (!options.keep_hydrogens && is_hydrogen(rec.element))
        continue;
      if (line[16] != ' ' && !altloc_filter.keep(rec, std::string(1, line[16])))
        continue;
      atoms.add_atom(rec);
    } else if (is_record_type(line, "MODE")) {  // MODEL
      model_num = read_int(line+6, 8);
      if (after_wanted_model)
        break;
    } else if (is_record_type(line, "ENDM")) {  // ENDMDL
      if (model_num != 0 && model_num == wanted_model)
        after_wanted_model = true;
    } else if (is_record_type(line, "END")) {
      break;
    } else if (is_record_type(line, "data") && line[4] == '_') {
      fail("Incorrect file format (perhaps it is cif not pdb?): " + source);
    }
  }
  if (options.model != 0 && atoms.empty())
    fail("model ", options.model, " not found in ", source);
  return atoms;
}

AtomArray read_pdb_file(const std::string& path, const AtomSiteReadOptions& options) {
  MaybeGzipped input(path);
  std::unique_ptr<AnyStream> stream = input.create_stream();
  return read_pdb_from_stream(*stream, path, options);
}

AtomArray read_pdb_string(const std::string& str, const AtomSiteReadOptions& options) {
  MemoryStream stream(str.c_str(), str.size());
  return read_pdb_from_stream(stream, "string", options);
}

#define WRITE(...) do { \
    snprintf_z(buf, 82, __VA_ARGS__); \
    os.write(buf, 81); \
  } while(0)

void write_pdb(const AtomArray& atoms, std::ostream& os) {
  atoms.check_lengths();
  char buf[88];
  int serial = 0;
  size_t last = atoms.size();  // last written atom
  auto write_ter = [&]() {
    if (last == atoms.size() || atoms.hetero[last])
      return;
    // TER    4153      LYS B 286
    WRITE("TER   %5d      %3s%2s%4d%c%53s\n", ++serial,
          atoms.res_name[last].c_str(), atoms.chain_id[last].c_str(),
          atoms.res_id[last], atoms.ins_code[last], "");
  };
  for (size_t i = 0; i != atoms.size(); ++i) {
    const Vec3& pos = atoms.coord[i];
    if (pos.has_nan())
      continue;
    const std::string& chain = atoms.chain_id[i];
    if (chain.size() > 2)
      fail("chain name too long for the PDB format: ", chain);
    const std::string& res_name = atoms.res_name[i];
    if (res_name.size() > 3)
      fail("residue name too long for the PDB format: ", res_name);
    const std::string& name = atoms.atom_name[i];
    if (name.size() > 4)
      fail("atom name too long for the PDB format: ", name);
    if (last != atoms.size() && atoms.chain_id[last] != chain)
      write_ter();
    if (serial == 99999)
      fail("Too many atoms for the PDB format.");
    //  1- 6  6s  record name
    //  7-11  5d  integer serial
    // 13-16  4s  atom name (from 13 only if 4-char or 2-char symbol)
    // 17     1c  altloc
    // 18-20  3s  residue name
    // 21-22  2s  chain
    // 23-26  4d  residue sequence number
    // 27     1c  insertion code
    // 31-54  3x8f  x, y, z (8.3)
    // 55-60  6f  occupancy (6.2)
    // 61-66  6f  temperature factor (6.2)
    // 77-78  2s  element symbol, right-justified
    // 79-80  2s  charge
    const std::string& el = atoms.element[i];
    bool empty13 = el.size() < 2 && name.size() < 4;
    int charge = atoms.charge[i];
    WRITE("%-6s%5d %c%-3s%c%3s%2s%4d%c"
          "   %8.3f%8.3f%8.3f"
          "%6.2f%6.2f          %2s%c%c\n",
          atoms.hetero[i] ? "HETATM" : "ATOM",
          ++serial,
          empty13 || name.empty() ? ' ' : name[0],
          name.c_str() + (empty13 || name.empty() ? 0 : 1),
          ' ',
          res_name.c_str(),
          chain.c_str(),
          atoms.res_id[i],
          atoms.ins_code[i],
          // avoid negative zero
          pos.x > -5e-4 && pos.x < 0 ? 0 : pos.x + 1e-10,
          pos.y > -5e-4 && pos.y < 0 ? 0 : pos.y + 1e-10,
          pos.z > -5e-4 && pos.z < 0 ? 0 : pos.z + 1e-10,
          atoms.occupancy[i] + 1e-6,
          atoms.b_factor[i] + 0.5e-5,
          el.c_str(),
          charge != 0 ? char('0' + (charge > 0 ? charge : -charge)) : ' ',
          charge != 0 ? (charge > 0 ? '+' : '-') : ' ');
    last = i;
  }
  write_ter();
  WRITE("%-80s\n", "END");
}

#undef WRITE

std::string make_pdb_string(const AtomArray& atoms) {
  std::ostringstream os;
  write_pdb(atoms, os);
  return os.str();
}

} // namespace biods
