// Copyright The biods Developers.
//
// Ofstream: a wrapper around std::ofstream that can interpret
// filename "-" as stdout.

#ifndef BIODS_FSTREAM_HPP_
#define BIODS_FSTREAM_HPP_

#include <fstream>
#include <memory>
#include "fail.hpp"

namespace biods {

struct Ofstream {
  Ofstream(const std::string& filename, std::ostream* dash=nullptr,
           std::ios_base::openmode mode=std::ios_base::out) {
    if (filename.size() == 1 && filename[0] == '-' && dash) {
      ptr_ = dash;
      return;
    }
    keeper_.reset(new std::ofstream(filename, mode));
    if (!*keeper_)
      sys_fail("Failed to open " + filename + " for writing");
    ptr_ = keeper_.get();
  }

  std::ostream* operator->() { return ptr_; }
  std::ostream& ref() { return *ptr_; }

private:
  std::unique_ptr<std::ofstream> keeper_;
  std::ostream* ptr_;
};

} // namespace biods
#endif
