// Copyright The biods Developers.
//
// Functions for reading possibly gzipped CIF and BinaryCIF files.

#ifndef BIODS_READ_CIF_HPP_
#define BIODS_READ_CIF_HPP_

#include "cifdoc.hpp"   // for Document
#include "fileutil.hpp" // for CharArray

namespace biods {

BIODS_DLL cif::Document read_cif_gz(const std::string& path);
BIODS_DLL CharArray read_into_buffer_gz(const std::string& path);
BIODS_DLL cif::Document read_cif_from_memory(const char* data, size_t size,
                                             const char* name);

inline bool is_bcif_path(const std::string& path) {
  return giends_with(path, ".bcif");
}

/// Reads text CIF or BinaryCIF (*.bcif), possibly gzipped.
BIODS_DLL cif::Document read_cif_or_bcif_gz(const std::string& path);

} // namespace biods

#endif
