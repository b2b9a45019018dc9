// Copyright The biods Developers.
//
// Listing (mm)CIF files in a directory tree, for batch conversion.
// Uses the tinydir library.

#ifndef BIODS_DIRWALK_HPP_
#define BIODS_DIRWALK_HPP_

#include <algorithm>  // for sort
#include <cstring>    // for strcmp
#include <string>
#include <vector>
#include <tinydir.h>
#include "fail.hpp"      // for fail
#include "fileutil.hpp"  // for path_join
#include "util.hpp"      // for giends_with

namespace biods {

inline bool is_cif_file_name(const std::string& name) {
  return giends_with(name, ".cif") || giends_with(name, ".mmcif");
}

namespace impl {

// closes tinydir_dir when going out of scope
struct OpenDir {
  tinydir_dir dir;
  explicit OpenDir(const std::string& path) {
    if (tinydir_open_sorted(&dir, path.c_str()) == -1)
      fail("Cannot open directory: " + path);
  }
  ~OpenDir() { tinydir_close(&dir); }
  OpenDir(const OpenDir&) = delete;
  OpenDir& operator=(const OpenDir&) = delete;
};

inline void add_cif_files(const std::string& top_dir, const std::string& rel_dir,
                          std::vector<std::string>& out) {
  OpenDir d(path_join(top_dir, rel_dir));
  for (size_t i = 0; i != d.dir.n_files; ++i) {
    tinydir_file file;
    if (tinydir_readfile_n(&d.dir, &file, i) == -1)
      fail("Cannot read directory entry in " + path_join(top_dir, rel_dir));
    if (std::strcmp(file.name, ".") == 0 || std::strcmp(file.name, "..") == 0)
      continue;
    std::string rel = rel_dir.empty() ? std::string(file.name)
                                      : path_join(rel_dir, file.name);
    if (file.is_dir)
      add_cif_files(top_dir, rel, out);
    else if (is_cif_file_name(file.name))
      out.push_back(rel);
  }
}

} // namespace impl

/// Paths of *.cif and *.mmcif files (optionally gzipped) under top_dir,
/// relative to top_dir, in lexicographic order.
inline std::vector<std::string> find_cif_files(const std::string& top_dir) {
  std::vector<std::string> paths;
  impl::add_cif_files(top_dir, "", paths);
  std::sort(paths.begin(), paths.end());
  return paths;
}

} // namespace biods
#endif
