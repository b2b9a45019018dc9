// Copyright The biods Developers.

#include <cstdio>
#include <iostream>
#include <stdexcept>
#include <biods/bcif.hpp>      // for write_bcif_file
#include <biods/dirwalk.hpp>   // for find_cif_files
#include <biods/fileutil.hpp>  // for make_directories, file_exists
#include <biods/read_cif.hpp>  // for read_cif_gz
#include <biods/util.hpp>      // for giends_with
#define BIODS_PROG cifs2bcifs
#include "options.h"

namespace {

enum OptionIndex { Overwrite=4, MaxDecimals };

const option::Descriptor Usage[] = {
  { NoOp, 0, "", "", Arg::None,
    "Usage:"
    "\n " EXE_NAME " [options] INPUT_DIR OUTPUT_DIR"
    "\n\nConvert all .cif and .cif.gz files under INPUT_DIR to BinaryCIF."
    "\nThe directory structure is mirrored in OUTPUT_DIR."
    "\n\nOptions:" },
  CommonUsage[Help],
  CommonUsage[Version],
  CommonUsage[Verbose],
  { Overwrite, 0, "", "overwrite", Arg::None,
    "  --overwrite  \tConvert files that already have output (skipped otherwise)." },
  { MaxDecimals, 0, "", "max-decimals", Arg::Count,
    "  --max-decimals=N  \tNumbers with more decimal places are stored as"
    " strings (default: 6)." },
  { 0, 0, 0, 0, 0, 0 }
};

// a/b/1abc.cif.gz -> a/b/1abc.bcif
std::string output_name(const std::string& rel_path) {
  std::string name = rel_path;
  if (biods::giends_with(name, ".gz"))
    name.resize(name.size() - 3);
  size_t dot = name.find_last_of('.');
  size_t sep = name.find_last_of("/\\");
  if (dot != std::string::npos && (sep == std::string::npos || dot > sep))
    name.resize(dot);
  return name + ".bcif";
}

} // anonymous namespace

int BIODS_MAIN(int argc, char **argv) {
  OptParser p(EXE_NAME);
  p.parse_or_exit(argc, argv, Usage, 2);
  bool verbose = p.options[Verbose];
  std::string input_dir = p.nonOption(0);
  std::string output_dir = p.nonOption(1);
  biods::BcifWriteOptions options;
  options.max_decimals = p.count_or(MaxDecimals, options.max_decimals);
  if (!biods::is_directory(input_dir)) {
    std::cerr << "ERROR: not a directory: " << input_dir << std::endl;
    return 2;
  }
  int converted = 0;
  int skipped = 0;
  int failed = 0;
  try {
    for (const std::string& rel_path : biods::find_cif_files(input_dir)) {
      std::string path = biods::path_join(input_dir, rel_path);
      std::string out = biods::path_join(output_dir, output_name(rel_path));
      if (!p.options[Overwrite] && biods::file_exists(out)) {
        ++skipped;
        continue;
      }
      if (verbose)
        std::fprintf(stderr, "%s -> %s\n", path.c_str(), out.c_str());
      try {
        biods::make_directories(biods::path_dirname(out));
        biods::cif::Document doc = biods::read_cif_gz(path);
        biods::write_bcif_file(doc, out, options);
        ++converted;
      } catch (std::runtime_error& e) {
        std::cerr << "ERROR: " << path << ": " << e.what() << std::endl;
        ++failed;
      } catch (std::invalid_argument& e) {
        std::cerr << "ERROR: " << path << ": " << e.what() << std::endl;
        ++failed;
      }
    }
  } catch (std::runtime_error& e) {
    std::cerr << "ERROR: " << e.what() << std::endl;
    return 2;
  } catch (std::invalid_argument& e) {
    std::cerr << "ERROR: " << e.what() << std::endl;
    return 3;
  }
  std::printf("Converted %d file(s), skipped %d existing, %d failed.\n",
              converted, skipped, failed);
  return failed == 0 ? 0 : 1;
}
