// Copyright The biods Developers.
//
// Biological assemblies from _pdbx_struct_assembly* and
// _pdbx_struct_oper_list: reading them and applying the operators
// to an AtomArray. Includes chain (re)naming utilities.

#ifndef BIODS_ASSEMBLY_HPP_
#define BIODS_ASSEMBLY_HPP_

#include <string>
#include <vector>
#include "atomarray.hpp"  // for AtomArray
#include "cifdoc.hpp"     // for Block
#include "logger.hpp"     // for Logger
#include "math.hpp"       // for Transform
#include "mmcif.hpp"      // for AtomSiteReadOptions
#include "util.hpp"       // for in_vector

namespace biods {

struct Assembly {
  struct Operator {
    std::string name;  // e.g. "1" or, for products, "1x61"
    Transform transform;
  };
  // subchains (label_asym_id) to which the operators are applied
  struct Gen {
    std::vector<std::string> subchains;
    std::vector<Operator> operators;
  };
  std::string name;
  std::string details;
  std::string oligomeric_details;
  int oligomeric_count = 0;
  std::vector<Gen> generators;

  Assembly() = default;
  explicit Assembly(const std::string& name_) : name(name_) {}
};

enum class HowToNameCopiedChain { Short, AddNumber, Dup };

struct ChainNameGenerator {
  using How = HowToNameCopiedChain;
  How how;
  std::vector<std::string> used_names;

  explicit ChainNameGenerator(How how_) : how(how_) {}
  bool has(const std::string& name) const {
    return in_vector(name, used_names);
  }
  const std::string& added(const std::string& name) {
    used_names.push_back(name);
    return used_names.back();
  }

  std::string make_short_name(const std::string& preferred);
  std::string make_name_with_numeric_postfix(const std::string& base, int n);
  std::string make_new_name(const std::string& old, int n);
};

/// Parses oper_expression: "1", "1,2", "1-4", "(1-4)" or a product
/// such as "(1-60)(61)". Returns one list of operator ids per parenthesized
/// factor.
BIODS_DLL std::vector<std::vector<std::string>>
parse_oper_expression(const std::string& expr);

BIODS_DLL std::vector<Assembly> read_assemblies(cif::Block& block);

BIODS_DLL const Assembly* find_assembly(const std::vector<Assembly>& assemblies,
                                        const std::string& name);

/// Atoms of the listed subchains are copied under each operator.
/// Atoms without label_asym_id are matched by chain_id.
BIODS_DLL AtomArray make_assembly(const AtomArray& atoms, const Assembly& assembly,
                                  HowToNameCopiedChain how, const Logger& logger);

/// Reads the coordinate file and generates the assembly. Empty assembly_id
/// means the first assembly. Files without assembly data (incl. PDB files)
/// give the asymmetric unit.
BIODS_DLL AtomArray load_assembly(const std::string& path,
                                  const std::string& assembly_id,
                                  HowToNameCopiedChain how,
                                  const AtomSiteReadOptions& options,
                                  const Logger& logger);

} // namespace biods
#endif
