// Copyright The biods Developers.
// The biods program: subcommands dispatched to the *_main() functions.

#include <cstdio>
#include <cstring>

void print_version(const char* program_name);  // in options.cpp

int bcif2cif_main(int argc, char** argv);
int ccd_main(int argc, char** argv);
int cif2bcif_main(int argc, char** argv);
int cifs2bcifs_main(int argc, char** argv);
int info_main(int argc, char** argv);

namespace {

struct SubCmd {
  const char* name;
  int (*func)(int argc, char** argv);
  const char* desc;
};

#define CMD(s, desc) { #s, &s##_main, desc }
const SubCmd subcommands[] = {
  CMD(bcif2cif, "convert BinaryCIF to text CIF"),
  CMD(ccd, "build BinaryCIF and residue dictionary from the CCD"),
  CMD(cif2bcif, "convert (mm)CIF to BinaryCIF"),
  CMD(cifs2bcifs, "convert a directory of (mm)CIF files to BinaryCIF"),
  CMD(info, "standardise a structure and print chains and sequences"),
};
#undef CMD

bool eq(const char* a, const char* b) { return std::strcmp(a, b) == 0; }

int print_usage() {
  print_version("biods");
  std::printf("Prepares biomolecular structures for ML datasets.\n\n"
              "Usage: biods [--version] [--help] <command> [<args>]\n\n"
              "Commands:\n");
  for (const SubCmd& sub : subcommands)
    std::printf(" %-13s %s\n", sub.name, sub.desc);
  return 0;
}

} // anonymous namespace

int main(int argc, char** argv) {
  if (argc < 2)
    return print_usage() + 1;
  const char* arg = argv[1];
  if (eq(arg, "-h") || eq(arg, "--help") || eq(arg, "help"))
    return print_usage();
  if (eq(arg, "-V") || eq(arg, "--version")) {
    print_version("biods");
    return 0;
  }
  for (const SubCmd& sub : subcommands)
    if (eq(arg, sub.name))
      return sub.func(argc - 1, argv + 1);
  std::fprintf(stderr, "'%s' is not a biods command. See 'biods --help'.\n", arg);
  return 1;
}
