// Copyright The biods Developers.

#include <iostream>
#include <stdexcept>
#include <string>
#include <biods/bcif.hpp>     // for read_bcif_file
#include <biods/fstream.hpp>  // for Ofstream
#include <biods/to_cif.hpp>   // for write_cif_to_stream
#define BIODS_PROG bcif2cif
#include "options.h"

namespace {

enum OptionIndex { Style=4 };

struct ConvArg: public Arg {
  static option::ArgStatus CifStyle(const option::Option& option, bool msg) {
    return Arg::Choice(option, msg, {"plain", "pdbx", "aligned"});
  }
};

const option::Descriptor Usage[] = {
  { NoOp, 0, "", "", Arg::None,
    "Usage:"
    "\n " EXE_NAME " [options] INPUT OUTPUT"
    "\n\nConvert BinaryCIF (optionally gzipped) to text CIF."
    "\nWhen INPUT or OUTPUT is -, read stdin or write stdout."
    "\n\nOptions:" },
  CommonUsage[Help],
  CommonUsage[Version],
  CommonUsage[Verbose],
  { Style, 0, "", "style", ConvArg::CifStyle,
    "  --style=STYLE  \tOne of: plain (default), pdbx (categories separated"
    " with #), aligned (left-aligned columns)." },
  { 0, 0, 0, 0, 0, 0 }
};

biods::cif::WriteOptions cif_write_options(const option::Option& style) {
  biods::cif::WriteOptions options;
  if (style && std::string(style.arg) != "plain") {
    options.prefer_pairs = true;
    options.misuse_hash = true;
    if (style.arg[0] == 'a') {
      options.align_pairs = 33;
      options.align_loops = 30;
    }
  }
  return options;
}

} // anonymous namespace

int BIODS_MAIN(int argc, char **argv) {
  OptParser p(EXE_NAME);
  p.parse_or_exit(argc, argv, Usage, 2);
  const char* input = p.nonOption(0);
  const char* output = p.nonOption(1);
  try {
    biods::cif::Document doc = biods::read_bcif_file(input);
    if (p.options[Verbose])
      std::cerr << "Read " << doc.blocks.size() << " block(s) from " << input << std::endl;
    biods::Ofstream os(output, &std::cout);
    biods::cif::write_cif_to_stream(os.ref(), doc, cif_write_options(p.options[Style]));
  } catch (std::runtime_error& e) {
    std::cerr << "ERROR: " << e.what() << std::endl;
    return 2;
  } catch (std::invalid_argument& e) {
    std::cerr << "ERROR: " << e.what() << std::endl;
    return 3;
  }
  return 0;
}
