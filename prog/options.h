// Copyright The biods Developers.

// Command-line parsing shared by the biods programs, on top of
// The Lean Mean C++ Option Parser (optionparser.h).

#pragma once

#include <string>
#include <vector>
#include <optionparser.h>

#ifndef BIODS_PROG
# error "define BIODS_PROG before including options.h"
#endif

#define BIODS_XSTRINGIZE(s) BIODS_STRINGIZE(s)
#define BIODS_STRINGIZE(s) #s
#define BIODS_XCONCAT(a, b) BIODS_CONCAT(a, b)
#define BIODS_CONCAT(a, b) a##b
// In the all-in-one program "biods bcif2cif" is implemented by bcif2cif_main().
#ifdef BIODS_ALL_IN_ONE
# define BIODS_MAIN BIODS_XCONCAT(BIODS_PROG, _main)
# define EXE_NAME "biods " BIODS_XSTRINGIZE(BIODS_PROG)
#else
# define BIODS_MAIN main
# define EXE_NAME BIODS_XSTRINGIZE(BIODS_PROG)
#endif

// Options with these indices are in every program (see CommonUsage).
// Program-specific option indices start from 4.
enum { NoOp=0, Help=1, Version=2, Verbose=3 };

extern const option::Descriptor CommonUsage[];

struct Arg: public option::Arg {
  static option::ArgStatus Required(const option::Option& option, bool msg);
  static option::ArgStatus Choice(const option::Option& option, bool msg,
                                  const std::vector<const char*>& choices);
  /// non-negative integer
  static option::ArgStatus Count(const option::Option& option, bool msg);
};

struct OptParser : option::Parser {
  const char* program_name;
  std::vector<option::Option> options;
  std::vector<option::Option> buffer;

  explicit OptParser(const char* prog) : program_name(prog) {}
  /// Exits after printing --help or --version, and on errors,
  /// including a number of positional arguments other than n_args.
  void parse_or_exit(int argc, char** argv, const option::Descriptor usage[],
                     int n_args);
  /// value of an option checked with Arg::Count
  int count_or(int opt, int default_) const;
  /// all values of a repeatable option
  std::vector<std::string> all_values(int opt) const;
};

void print_version(const char* program_name);
