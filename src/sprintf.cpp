// Copyright The biods Developers.

#include <biods/sprintf.hpp>
#include <stdarg.h>  // for va_list
#include <biods/atof.hpp>  // for fast_from_chars

#define STB_SPRINTF_IMPLEMENTATION
#define STB_SPRINTF_STATIC
#define STB_SPRINTF_NOUNALIGNED 1
// Making functions from stb_sprintf static may trigger warnings.
#if defined(__GNUC__)
# pragma GCC diagnostic ignored "-Wunused-function"
#endif
#if defined(__clang__)
# pragma clang diagnostic ignored "-Wunused-function"
#endif
#include <stb/stb_sprintf.h>

namespace biods {

// We wrap functions from stb_sprintf.h only to have them declared with BIODS_DLL.
int sprintf_z(char *buf, char const *fmt, ...) {
  int result;
  va_list va;
  va_start(va, fmt);
  result = STB_SPRINTF_DECORATE(vsprintfcb)(0, 0, buf, fmt, va);
  va_end(va);
  return result;
}

int snprintf_z(char *buf, int count, char const *fmt, ...) {
  int result;
  va_list va;
  va_start(va, fmt);
  result = STB_SPRINTF_DECORATE(vsnprintf)(buf, count, fmt, va);
  va_end(va);
  return result;
}

template<typename T>
static std::string shortest_repr(T value, int max_prec) {
  char buf[32];
  int len = 0;
  for (int prec = 1; prec <= max_prec; ++prec) {
    len = snprintf_z(buf, 32, "%.*g", prec, (double) value);
    T back = 0;
    auto result = fast_float::from_chars(buf, buf + len, back);
    if (result.ec == std::errc() && back == value)
      break;
  }
  return std::string(buf, len > 0 ? len : 0);
}

std::string to_str_shortest(double d) { return shortest_repr(d, 17); }
std::string to_str_shortest(float f) { return shortest_repr(f, 9); }

}  // namespace biods
