// Copyright The biods Developers.

#include <cstdio>
#include <iostream>
#include <stdexcept>
#include <biods/assembly.hpp>     // for load_assembly
#include <biods/biomolecule.hpp>  // for BiomoleculeComplex
#include <biods/mmread.hpp>       // for read_atoms_from_file
#define BIODS_PROG info
#include "options.h"

namespace {

enum OptionIndex { AssemblyId=4, ChainNaming, Preset, KeepOxt, LabelFields, Strict };

struct InfoArg: public Arg {
  static option::ArgStatus PresetChoice(const option::Option& option, bool msg) {
    return Arg::Choice(option, msg, {"protein", "dna", "rna"});
  }
  static option::ArgStatus ChainNaming(const option::Option& option, bool msg) {
    return Arg::Choice(option, msg, {"short", "number", "dup"});
  }
};

const option::Descriptor Usage[] = {
  { NoOp, 0, "", "", Arg::None,
    "Usage:"
    "\n " EXE_NAME " [options] FILE"
    "\n\nStandardise a coordinate file (PDB, mmCIF or BinaryCIF) and print"
    "\nchains, residue counts, sequences and numbers of filled-in atoms."
    "\n\nOptions:" },
  CommonUsage[Help],
  CommonUsage[Version],
  CommonUsage[Verbose],
  { AssemblyId, 0, "", "assembly", Arg::Required,
    "  --assembly=ID  \tUse biological assembly ID (asymmetric unit by default)." },
  { ChainNaming, 0, "", "chain-naming", InfoArg::ChainNaming,
    "  --chain-naming=CN  \tHow to name chains copied in the assembly:"
    "\v  short (default), number (add copy number) or dup (keep the name)." },
  { Preset, 0, "", "preset", InfoArg::PresetChoice,
    "  --preset=NAME  \tResidue dictionary: protein (default), dna or rna." },
  { KeepOxt, 0, "", "keep-oxt", Arg::None,
    "  --keep-oxt  \tKeep terminal OXT (protein) or OP3 (nucleic acids)." },
  { LabelFields, 0, "", "label", Arg::None,
    "  --label  \tUse label_* fields of mmCIF rather than auth_*." },
  { Strict, 0, "", "strict", Arg::None,
    "  --strict  \tFail on residues that are not in the dictionary." },
  { 0, 0, 0, 0, 0, 0 }
};

biods::HowToNameCopiedChain chain_naming(const option::Option& opt) {
  if (opt) {
    if (opt.arg[0] == 'n')
      return biods::HowToNameCopiedChain::AddNumber;
    if (opt.arg[0] == 'd')
      return biods::HowToNameCopiedChain::Dup;
  }
  return biods::HowToNameCopiedChain::Short;
}

void print_info(const biods::BiomoleculeComplex& complex) {
  std::printf("Chains: %zu, residues: %d, atom slots: %zu\n",
              complex.chain_ids().size(), complex.num_residues(), complex.atoms.size());
  for (const biods::BiomoleculeChain& chain : complex.chains()) {
    int filled = 0;
    for (bool m : chain.atoms.mask)
      if (!m)
        ++filled;
    std::printf("Chain %s: %d residues, %zu atom slots, %d filled-in\n",
                chain.chain_id().c_str(), chain.num_residues(), chain.atoms.size(), filled);
    std::printf("  %s\n", chain.sequence().c_str());
  }
}

} // anonymous namespace

int BIODS_MAIN(int argc, char **argv) {
  OptParser p(EXE_NAME);
  p.parse_or_exit(argc, argv, Usage, 1);
  std::string path = p.nonOption(0);
  biods::Logger logger;
  logger.callback = biods::Logger::to_stderr;
  if (p.options[Verbose])
    logger.threshold = 8;
  biods::AtomSiteReadOptions read_options;
  read_options.use_author_fields = !p.options[LabelFields];
  biods::BiomoleculeOptions options;
  options.raise_error_on_unexpected = p.options[Strict];
  try {
    std::string preset = p.options[Preset] ? p.options[Preset].arg : "protein";
    biods::ResidueDictionary dict =
      biods::ResidueDictionary::from_preset(preset, p.options[KeepOxt]);
    biods::AtomArray atoms;
    if (p.options[AssemblyId])
      atoms = biods::load_assembly(path, p.options[AssemblyId].arg,
                                   chain_naming(p.options[ChainNaming]),
                                   read_options, logger);
    else
      atoms = biods::read_atoms_from_file(path, read_options);
    logger.debug("Read ", atoms.size(), " atoms from ", path);
    print_info(biods::BiomoleculeComplex::from_atoms(atoms, dict, options, logger));
  } catch (std::runtime_error& e) {
    std::cerr << "ERROR: " << e.what() << std::endl;
    return 2;
  } catch (std::invalid_argument& e) {
    std::cerr << "ERROR: " << e.what() << std::endl;
    return 3;
  }
  return 0;
}
