// Copyright The biods Developers.
//
// Chemical Component Dictionary (CCD): reading components.cif[.gz|.bcif]
// and cc-counts.tdd, and building the derived files used by residue
// dictionaries: components.bcif and ccd_residue_dictionary.json.

#ifndef BIODS_CCD_HPP_
#define BIODS_CCD_HPP_

#include <map>
#include <string>
#include <vector>
#include "cifdoc.hpp"   // for Block, Document
#include "logger.hpp"   // for Logger
#include "math.hpp"     // for Vec3

namespace biods {

struct CcdAtom {
  std::string id;
  std::string element;  // uppercase
  int charge = 0;
  bool leaving = false;  // pdbx_leaving_atom_flag
  Vec3 ideal = Vec3::nan();
};

struct CcdBond {
  std::string atom1;
  std::string atom2;
  std::string order;  // SING, DOUB, TRIP, ...
};

struct CcdComponent {
  std::string id;
  std::string name;
  std::string type;
  std::string one_letter_code;  // empty if not given
  std::string parent;           // mon_nstd_parent_comp_id, empty if not given
  std::vector<CcdAtom> atoms;
  std::vector<CcdBond> bonds;

  /// atoms other than H and D, in CCD order
  std::vector<const CcdAtom*> heavy_atoms() const;
  const CcdAtom* find_atom(const std::string& atom_id) const {
    for (const CcdAtom& a : atoms)
      if (a.id == atom_id)
        return &a;
    return nullptr;
  }
};

BIODS_DLL CcdComponent make_ccd_component(cif::Block& block);
BIODS_DLL std::vector<CcdComponent> read_ccd_components(cif::Document& doc);

/// Reads cc-counts.tdd: component id and count separated by whitespace.
/// Lines where the second field is not an integer (e.g. the header)
/// are skipped.
BIODS_DLL std::map<std::string, int> read_usage_counts(const std::string& path);

/// One component in ccd_residue_dictionary.json.
struct CcdDictionaryEntry {
  std::string id;
  std::string name;
  std::string one_letter_code;
  std::string type;
  std::string parent;
  std::vector<std::string> atoms;          // heavy atoms in CCD order
  std::vector<std::string> elements;       // elements of atoms
  std::vector<std::string> leaving_atoms;  // heavy leaving atoms
  int count = 0;
};

BIODS_DLL CcdDictionaryEntry make_dictionary_entry(const CcdComponent& cc, int count);
BIODS_DLL std::string ccd_dictionary_to_json(const std::vector<CcdDictionaryEntry>& entries);
BIODS_DLL std::vector<CcdDictionaryEntry> ccd_dictionary_from_json(const std::string& json,
                                                                   const std::string& source);
BIODS_DLL std::vector<CcdDictionaryEntry> read_ccd_dictionary(const std::string& path);

struct CcdBuildOptions {
  /// components used less often than this are left out of the dictionary
  int min_count = 0;
  /// rebuild even if outputs are newer than inputs
  bool force = false;
};

/// Names of the files written by build_ccd_artifacts().
extern BIODS_DLL const char* const CCD_BCIF_NAME;
extern BIODS_DLL const char* const CCD_COUNTS_NAME;
extern BIODS_DLL const char* const CCD_DICTIONARY_NAME;

/// true if output is missing or not newer than each of the inputs
BIODS_DLL bool is_outdated(const std::string& output,
                           const std::vector<std::string>& inputs);

/// Writes components.bcif, cc-counts.tdd and ccd_residue_dictionary.json
/// into out_dir. Files that are up to date are not rebuilt.
/// Returns the number of files written.
BIODS_DLL int build_ccd_artifacts(const std::string& ccd_path,
                                  const std::string& counts_path,
                                  const std::string& out_dir,
                                  const CcdBuildOptions& options,
                                  const Logger& logger);

} // namespace biods
#endif
