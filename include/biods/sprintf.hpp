// Copyright The biods Developers.
//
// interface to stb_sprintf: snprintf_z, to_str(float|double)

#ifndef BIODS_SPRINTF_HPP_
#define BIODS_SPRINTF_HPP_

#include <string>
#include "fail.hpp"  // for BIODS_DLL

namespace biods {

#if defined(__GNUC__) || defined(__clang__)
# define BIODS_ATTRIBUTE_FORMAT(fmt,va) __attribute__((format(printf,fmt,va)))
#else
# define BIODS_ATTRIBUTE_FORMAT(fmt,va)
#endif
/// stb_snprintf in biods namespace - like snprintf, but ignores locale
/// and is always zero-terminated (hence _z).
BIODS_DLL int snprintf_z(char *buf, int count, char const *fmt, ...)
                                                         BIODS_ATTRIBUTE_FORMAT(3,4);
/// stb_sprintf in biods namespace
BIODS_DLL int sprintf_z(char *buf, char const *fmt, ...) BIODS_ATTRIBUTE_FORMAT(2,3);

inline std::string to_str(double d) {
  char buf[24];
  int len = sprintf_z(buf, "%.9g", d);
  return std::string(buf, len > 0 ? len : 0);
}

inline std::string to_str(float d) {
  char buf[16];
  int len = sprintf_z(buf, "%.6g", d);
  return std::string(buf, len > 0 ? len : 0);
}

/// Fixed notation with the given number of decimal places.
inline std::string to_str_fixed(double d, int decimals) {
  char buf[64];
  int len = snprintf_z(buf, 64, "%.*f", decimals, d);
  return std::string(buf, len > 0 && len < 64 ? len : 0);
}

/// The shortest %g representation that parses back to the same value.
BIODS_DLL std::string to_str_shortest(double d);
BIODS_DLL std::string to_str_shortest(float f);

} // namespace biods
#endif
