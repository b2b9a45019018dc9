// Copyright The biods Developers.

#include <cstdio>
#include <iostream>
#include <stdexcept>
#include <biods/ccd.hpp>  // for build_ccd_artifacts
#define BIODS_PROG ccd
#include "options.h"

namespace {

enum OptionIndex { MinCount=4, Force };

const option::Descriptor Usage[] = {
  { NoOp, 0, "", "", Arg::None,
    "Usage:"
    "\n " EXE_NAME " [options] COMPONENTS CC_COUNTS OUTPUT_DIR"
    "\n\nBuild " "components.bcif, cc-counts.tdd and ccd_residue_dictionary.json"
    "\nfrom the Chemical Component Dictionary (components.cif[.gz])"
    "\nand its usage counts (cc-counts.tdd)."
    "\nFiles newer than the inputs are not rebuilt."
    "\n\nOptions:" },
  CommonUsage[Help],
  CommonUsage[Version],
  CommonUsage[Verbose],
  { MinCount, 0, "", "min-count", Arg::Count,
    "  --min-count=N  \tLeave out of the dictionary components used less"
    " than N times." },
  { Force, 0, "f", "force", Arg::None,
    "  -f, --force  \tRebuild files even if they are up to date." },
  { 0, 0, 0, 0, 0, 0 }
};

} // anonymous namespace

int BIODS_MAIN(int argc, char **argv) {
  OptParser p(EXE_NAME);
  p.parse_or_exit(argc, argv, Usage, 3);
  biods::CcdBuildOptions options;
  options.min_count = p.count_or(MinCount, 0);
  options.force = p.options[Force];
  biods::Logger logger;
  logger.callback = biods::Logger::to_stderr;
  if (p.options[Verbose])
    logger.threshold = 8;
  try {
    int n = biods::build_ccd_artifacts(p.nonOption(0), p.nonOption(1), p.nonOption(2),
                                       options, logger);
    std::printf("%d file(s) written.\n", n);
  } catch (std::runtime_error& e) {
    std::cerr << "ERROR: " << e.what() << std::endl;
    return 2;
  } catch (std::invalid_argument& e) {
    std::cerr << "ERROR: " << e.what() << std::endl;
    return 3;
  }
  return 0;
}
