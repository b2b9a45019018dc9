// Copyright The biods Developers.

#include <biods/read_cif.hpp>
#include <biods/cif.hpp>    // for cif::read
#include <biods/bcif.hpp>   // for read_bcif_gz
#include <biods/gz.hpp>     // for MaybeGzipped

namespace biods {

cif::Document read_cif_gz(const std::string& path) {
  return cif::read(MaybeGzipped(path));
}

CharArray read_into_buffer_gz(const std::string& path) {
  return read_into_buffer(MaybeGzipped(path));
}

cif::Document read_cif_from_memory(const char* data, size_t size, const char* name) {
  return cif::read_memory(data, size, name);
}

cif::Document read_cif_or_bcif_gz(const std::string& path) {
  if (is_bcif_path(path))
    return read_bcif_file(path);
  return read_cif_gz(path);
}

} // namespace biods
