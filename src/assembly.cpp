// Copyright The biods Developers.

#include <biods/assembly.hpp>
#include <map>
#include <set>
#include <biods/atox.hpp>      // for string_to_int
#include <biods/mmread.hpp>    // for coor_format_from_ext
#include <biods/numb.hpp>      // for as_number, as_int
#include <biods/pdb.hpp>       // for read_pdb_file
#include <biods/read_cif.hpp>  // for read_cif_or_bcif_gz

namespace biods {

std::string ChainNameGenerator::make_short_name(const std::string& preferred) {
  static const char symbols[] = {
    'A','B','C','D','E','F','G','H','I','J','K','L','M',
    'N','O','P','Q','R','S','T','U','V','W','X','Y','Z',
    'a','b','c','d','e','f','g','h','i','j','k','l','m',
    'n','o','p','q','r','s','t','u','v','w','x','y','z',
    '0','1','2','3','4','5','6','7','8','9'
  };
  if (!has(preferred))
    return added(preferred);
  std::string name(1, 'A');
  for (char symbol : symbols) {
    name[0] = symbol;
    if (!has(name))
      return added(name);
  }
  name += 'A';
  for (char symbol1 : symbols) {
    name[0] = symbol1;
    for (char symbol2 : symbols) {
      name[1] = symbol2;
      if (!has(name))
        return added(name);
    }
  }
  fail("run out of 1- and 2-letter chain names");
}

std::string ChainNameGenerator::make_name_with_numeric_postfix(const std::string& base,
                                                               int n) {
  std::string name = base;
  name += std::to_string(n);
  while (has(name)) {
    name.resize(base.size());
    name += std::to_string(++n);
  }
  return added(name);
}

std::string ChainNameGenerator::make_new_name(const std::string& old, int n) {
  switch (how) {
    case How::Short: return make_short_name(old);
    case How::AddNumber: return make_name_with_numeric_postfix(old, n);
    case How::Dup: return old;
  }
  unreachable();
}

std::vector<std::vector<std::string>> parse_oper_expression(const std::string& expr) {
  std::vector<std::vector<std::string>> collection;
  std::string s;
  for (char c : expr)
    if (!is_space(c))
      s += c;
  if (s.empty())
    fail("empty oper_expression");
  // split into parenthesized chunks
  for (const std::string& chunk : split_str(s, ')')) {
    size_t start = chunk.find_first_not_of('(');
    if (start == std::string::npos)
      continue;
    if (start > 1)
      fail("unexpected '(' in oper_expression: ", expr);
    collection.emplace_back();
    std::vector<std::string>& ids = collection.back();
    for (const std::string& item : split_str(chunk.substr(start), ',')) {
      if (item.empty())
        fail("empty operator in oper_expression: ", expr);
      size_t dash = item.find('-', 1);
      if (dash == std::string::npos) {
        ids.push_back(item);
        continue;
      }
      // range of numeric ids
      int first, last;
      try {
        first = string_to_int(item.substr(0, dash), true);
        last = string_to_int(item.substr(dash + 1), true);
      } catch (std::invalid_argument&) {
        fail("bad range in oper_expression: ", expr);
      }
      if (last < first)
        fail("bad range in oper_expression: ", expr);
      for (int i = first; i <= last; ++i)
        ids.push_back(std::to_string(i));
    }
  }
  return collection;
}

std::vector<Assembly> read_assemblies(cif::Block& block) {
  std::vector<Assembly> assemblies;
  cif::Table oper_table = block.find("_pdbx_struct_oper_list.",
      {"id",
       "matrix[1][1]", "matrix[1][2]", "matrix[1][3]", "vector[1]",
       "matrix[2][1]", "matrix[2][2]", "matrix[2][3]", "vector[2]",
       "matrix[3][1]", "matrix[3][2]", "matrix[3][3]", "vector[3]"});
  std::map<std::string, Transform> opers;
  for (auto op : oper_table) {
    Transform tr;
    for (int i = 0; i != 3; ++i) {
      for (int j = 0; j != 3; ++j)
        tr.mat[i][j] = cif::as_number(op[1 + 4*i + j]);
      tr.vec.at(i) = cif::as_number(op[4 + 4*i]);
    }
    opers.emplace(op.str(0), tr);
  }

  cif::Table assembly_table = block.find("_pdbx_struct_assembly.",
      {"id", "?details", "?oligomeric_details", "?oligomeric_count"});
  cif::Table gen_table = block.find("_pdbx_struct_assembly_gen.",
      {"assembly_id", "oper_expression", "asym_id_list"});
  for (auto row : assembly_table) {
    assemblies.emplace_back(row.str(0));
    Assembly& assembly = assemblies.back();
    if (row.has2(1))
      assembly.details = row.str(1);
    if (row.has2(2))
      assembly.oligomeric_details = row.str(2);
    if (row.has2(3))
      assembly.oligomeric_count = cif::as_int(row[3], 0);
    for (auto gen_row : gen_table) {
      if (gen_row.str(0) != assembly.name)
        continue;
      Assembly::Gen gen;
      for (const std::string& sub : split_str(gen_row.str(2), ','))
        gen.subchains.push_back(trim_str(sub));
      std::vector<std::vector<std::string>> factors =
          parse_oper_expression(gen_row.str(1));
      // Cartesian product of the factors. The rightmost operator is
      // applied first.
      std::vector<Assembly::Operator> ops(1);
      for (const std::vector<std::string>& factor : factors) {
        std::vector<Assembly::Operator> product;
        product.reserve(ops.size() * factor.size());
        for (const Assembly::Operator& left : ops)
          for (const std::string& id : factor) {
            auto it = opers.find(id);
            if (it == opers.end())
              fail("Assembly ", assembly.name, ": operator ", id,
                   " not found in _pdbx_struct_oper_list");
            Assembly::Operator op;
            op.name = left.name.empty() ? id : left.name + "x" + id;
            op.transform = left.transform.combine(it->second);
            product.push_back(op);
          }
        ops.swap(product);
      }
      gen.operators = std::move(ops);
      assembly.generators.push_back(std::move(gen));
    }
  }
  return assemblies;
}

const Assembly* find_assembly(const std::vector<Assembly>& assemblies,
                              const std::string& name) {
  for (const Assembly& a : assemblies)
    if (a.name == name)
      return &a;
  return nullptr;
}

AtomArray make_assembly(const AtomArray& atoms, const Assembly& assembly,
                        HowToNameCopiedChain how, const Logger& logger) {
  std::vector<AtomArray> copies;
  ChainNameGenerator namegen(how);
  std::vector<std::string> subchains(atoms.size());
  std::set<std::string> present;
  for (size_t i = 0; i != atoms.size(); ++i) {
    subchains[i] = atoms.label_asym_id[i].empty() ? atoms.chain_id[i]
                                                  : atoms.label_asym_id[i];
    present.insert(subchains[i]);
  }
  int counter = 0;
  for (const Assembly::Gen& gen : assembly.generators) {
    for (const std::string& sub : gen.subchains)
      if (present.count(sub) == 0)
        logger.note("Assembly ", assembly.name, ": no subchain ", sub);
    std::vector<int> indices;
    for (size_t i = 0; i != atoms.size(); ++i)
      if (in_vector(subchains[i], gen.subchains))
        indices.push_back((int) i);
    for (const Assembly::Operator& oper : gen.operators) {
      logger.mesg("Applying operator ", oper.name, " to subchains: ",
                  join_str(gen.subchains, ','));
      ++counter;
      AtomArray copy = atoms.take(indices);
      // old->new chain names for this operator
      std::map<std::string, std::string> names;
      for (size_t i = 0; i != copy.size(); ++i) {
        auto result = names.emplace(copy.chain_id[i], "");
        if (result.second)
          result.first->second = namegen.make_new_name(copy.chain_id[i], counter);
        copy.chain_id[i] = result.first->second;
        copy.coord[i] = oper.transform.apply(copy.coord[i]);
      }
      copies.push_back(std::move(copy));
    }
  }
  return concatenate(copies);
}

AtomArray load_assembly(const std::string& path, const std::string& assembly_id,
                        HowToNameCopiedChain how, const AtomSiteReadOptions& options,
                        const Logger& logger) {
  if (coor_format_from_ext(path) == CoorFormat::Pdb) {
    logger.note(path, ": assemblies are not read from PDB files, using the asymmetric unit");
    return read_pdb_file(path, options);
  }
  cif::Document doc = read_cif_or_bcif_gz(path);
  AtomArray atoms = make_atom_array(doc, options);
  cif::Block* block = nullptr;
  for (cif::Block& b : doc.blocks)
    if (b.find_loop_item("_atom_site.Cartn_x") || b.find_pair_item("_atom_site.Cartn_x")) {
      block = &b;
      break;
    }
  std::vector<Assembly> assemblies = read_assemblies(*block);
  if (assemblies.empty()) {
    if (!assembly_id.empty())
      fail(path, ": no assembly ", assembly_id, " (no assemblies in the file)");
    logger.note(path, ": no assemblies, using the asymmetric unit");
    return atoms;
  }
  const Assembly* assembly = &assemblies[0];
  if (!assembly_id.empty()) {
    assembly = find_assembly(assemblies, assembly_id);
    if (!assembly)
      fail(path, ": assembly ", assembly_id, " not found");
  }
  return make_assembly(atoms, *assembly, how, logger);
}

} // namespace biods
