// Copyright The biods Developers.

#include <cstdio>
#include <iostream>
#include <stdexcept>
#include <biods/bcif.hpp>      // for write_bcif_file
#include <biods/read_cif.hpp>  // for read_cif_gz
#define BIODS_PROG cif2bcif
#include "options.h"

namespace {

enum OptionIndex { MaxDecimals=4, SkipCat };

const option::Descriptor Usage[] = {
  { NoOp, 0, "", "", Arg::None,
    "Usage:"
    "\n " EXE_NAME " [options] INPUT OUTPUT"
    "\n\nConvert (mm)CIF file to BinaryCIF."
    "\nINPUT can be gzipped. When INPUT is -, read standard input."
    "\n\nOptions:" },
  CommonUsage[Help],
  CommonUsage[Version],
  CommonUsage[Verbose],
  { MaxDecimals, 0, "", "max-decimals", Arg::Count,
    "  --max-decimals=N  \tNumbers with more decimal places are stored as"
    " strings (default: 6)." },
  { SkipCat, 0, "", "skip-category", Arg::Required,
    "  --skip-category=CAT  \tDo not write category CAT (can be repeated)." },
  { 0, 0, 0, 0, 0, 0 }
};

} // anonymous namespace

int BIODS_MAIN(int argc, char **argv) {
  OptParser p(EXE_NAME);
  p.parse_or_exit(argc, argv, Usage, 2);
  bool verbose = p.options[Verbose];
  const char* input = p.nonOption(0);
  const char* output = p.nonOption(1);
  biods::BcifWriteOptions options;
  options.max_decimals = p.count_or(MaxDecimals, options.max_decimals);
  for (std::string& cat : p.all_values(SkipCat)) {
    if (cat[0] != '_')
      cat.insert(cat.begin(), '_');
    options.skip_categories.push_back(cat);
  }
  if (verbose)
    std::fprintf(stderr, "Converting %s to %s ...\n", input, output);
  try {
    biods::cif::Document doc = biods::read_cif_gz(input);
    biods::write_bcif_file(doc, output, options);
  } catch (std::runtime_error& e) {
    std::cerr << "ERROR: " << e.what() << std::endl;
    return 2;
  } catch (std::invalid_argument& e) {
    std::cerr << "ERROR: " << e.what() << std::endl;
    return 3;
  }
  return 0;
}
