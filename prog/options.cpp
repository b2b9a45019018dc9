// Copyright The biods Developers.

#define BIODS_PROG na
#include "options.h"
#include <cstdio>   // for fprintf, fwrite
#include <cstdlib>  // for exit
#include <cstring>  // for strcmp
#include <stdexcept>  // for invalid_argument
#include <biods/atox.hpp>     // for string_to_int
#include <biods/version.hpp>  // for BIODS_VERSION

using std::fprintf;

const option::Descriptor CommonUsage[] = {
  { 0, 0, 0, 0, 0, 0 }, // makes CommonUsage[Help] the Help descriptor, etc
  { Help, 0, "h", "help", Arg::None, "  -h, --help  \tPrint usage and exit." },
  { Version, 0, "V", "version", Arg::None,
    "  -V, --version  \tPrint version and exit." },
  { Verbose, 0, "v", "verbose", Arg::None,
    "  -v, --verbose  \tPrint debugging messages." }
};

option::ArgStatus Arg::Required(const option::Option& option, bool msg) {
  if (option.arg != nullptr)
    return option::ARG_OK;
  if (msg)
    fprintf(stderr, "Option '%s' requires an argument\n", option.name);
  return option::ARG_ILLEGAL;
}

option::ArgStatus Arg::Choice(const option::Option& option, bool msg,
                              const std::vector<const char*>& choices) {
  if (Required(option, msg) == option::ARG_ILLEGAL)
    return option::ARG_ILLEGAL;
  for (const char* a : choices)
    if (std::strcmp(option.arg, a) == 0)
      return option::ARG_OK;
  if (msg) {
    // option.name is "--option=arg" here
    fprintf(stderr, "Invalid argument for %.*s: %s\nAllowed arguments:",
            option.namelen, option.name, option.arg);
    for (const char* a : choices)
      fprintf(stderr, " %s", a);
    fprintf(stderr, "\n");
  }
  return option::ARG_ILLEGAL;
}

option::ArgStatus Arg::Count(const option::Option& option, bool msg) {
  if (option.arg) {
    try {
      if (biods::string_to_int(option.arg, true) >= 0)
        return option::ARG_OK;
    } catch (std::invalid_argument&) {}
  }
  if (msg)
    fprintf(stderr, "Option '%s' requires a non-negative integer\n", option.name);
  return option::ARG_ILLEGAL;
}

namespace {

// fwrite wrapped to avoid -Wignored-attributes when passed as a template arg
size_t write_func(const void* ptr, size_t size, size_t nmemb, FILE* stream) {
  return std::fwrite(ptr, size, nmemb, stream);
}

} // anonymous namespace

void OptParser::parse_or_exit(int argc, char** argv,
                              const option::Descriptor usage[], int n_args) {
  if (argc < 1)
    std::exit(2);
  option::Stats stats(/*reordering*/true, usage, argc-1, argv+1);
  options.resize(stats.options_max);
  buffer.resize(stats.buffer_max);
  parse(usage, argc-1, argv+1, options.data(), buffer.data());
  if (error())
    std::exit(2);
  if (options[Help]) {
    option::printUsage(write_func, stdout, usage);
    std::exit(0);
  }
  if (options[Version]) {
    print_version(program_name);
    std::exit(0);
  }
  if (options[NoOp]) {
    fprintf(stderr, "Invalid option.\n");
    option::printUsage(write_func, stderr, usage);
    std::exit(2);
  }
  if (nonOptionsCount() != n_args) {
    fprintf(stderr, "%s requires %d arguments but got %d.\n"
                    "Try '%s --help' for more information.\n",
            program_name, n_args, nonOptionsCount(), program_name);
    std::exit(2);
  }
}

int OptParser::count_or(int opt, int default_) const {
  if (options[opt])
    return biods::string_to_int(options[opt].arg, true);
  return default_;
}

std::vector<std::string> OptParser::all_values(int opt) const {
  std::vector<std::string> values;
  for (const option::Option* o = options[opt]; o; o = o->next())
    values.emplace_back(o->arg);
  return values;
}

void print_version(const char* program_name) {
  std::printf("%s " BIODS_VERSION "\n", program_name);
}
