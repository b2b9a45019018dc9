// Copyright The biods Developers.

#include <biods/mmread.hpp>
#include <biods/pdb.hpp>       // for read_pdb_file
#include <biods/read_cif.hpp>  // for read_cif_or_bcif_gz

namespace biods {

CoorFormat coor_format_from_ext(const std::string& path) {
  std::string base = iends_with(path, ".gz") ? path.substr(0, path.size() - 3) : path;
  if (iends_with(base, ".pdb") || iends_with(base, ".ent"))
    return CoorFormat::Pdb;
  if (iends_with(base, ".cif") || iends_with(base, ".mmcif"))
    return CoorFormat::Mmcif;
  if (iends_with(base, ".bcif"))
    return CoorFormat::Bcif;
  return CoorFormat::Unknown;
}

AtomArray read_atoms_from_file(const std::string& path,
                               const AtomSiteReadOptions& options,
                               CoorFormat format) {
  if (format == CoorFormat::Unknown)
    format = coor_format_from_ext(path);
  switch (format) {
    case CoorFormat::Pdb:
      return read_pdb_file(path, options);
    case CoorFormat::Mmcif:
    case CoorFormat::Bcif: {
      cif::Document doc = read_cif_or_bcif_gz(path);
      return make_atom_array(doc, options);
    }
    case CoorFormat::Unknown:
      fail("Unknown format of coordinate file: " + path);
  }
  unreachable();
}

} // namespace biods
