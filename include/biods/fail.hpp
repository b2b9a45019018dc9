// Copyright The biods Developers.
//
// fail(), sys_fail() and unreachable().

#ifndef BIODS_FAIL_HPP_
#define BIODS_FAIL_HPP_

#include <cerrno>     // for errno
#include <stdexcept>  // for runtime_error
#include <string>
#include <system_error> // for system_error
#include <utility>    // for forward

#ifdef __INTEL_COMPILER
# define BIODS_COLD __attribute__((cold))
#elif defined(__has_attribute)
# if __has_attribute(cold)
#  define BIODS_COLD __attribute__((cold))
# else
#  define BIODS_COLD
# endif
#else
# define BIODS_COLD
#endif

#if defined(_WIN32) && defined(BIODS_SHARED)
# if defined(BIODS_BUILD)
#  define BIODS_DLL __declspec(dllexport)
# else
#  define BIODS_DLL __declspec(dllimport)
# endif
#elif defined(__GNUC__) && defined(BIODS_SHARED)
# define BIODS_DLL __attribute__((visibility("default")))
#else
# define BIODS_DLL
#endif

namespace biods {

[[noreturn]]
inline void fail(const std::string& msg) { throw std::runtime_error(msg); }

template<typename T, typename... Args> [[noreturn]]
void fail(std::string&& str, T&& arg1, Args&&... args) {
  str += arg1;
  fail(std::move(str), std::forward<Args>(args)...);
}
template<typename T, typename... Args> [[noreturn]]
void fail(const std::string& str, T&& arg1, Args&&... args) {
  fail(str + arg1, std::forward<Args>(args)...);
}

[[noreturn]]
inline BIODS_COLD void fail(const char* msg) { throw std::runtime_error(msg); }

[[noreturn]]
inline BIODS_COLD void sys_fail(const std::string& msg) {
  throw std::system_error(errno, std::system_category(), msg);
}
[[noreturn]]
inline BIODS_COLD void sys_fail(const char* msg) {
  throw std::system_error(errno, std::system_category(), msg);
}

// unreachable() is used to silence GCC -Wreturn-type and hint the compiler
[[noreturn]] inline void unreachable() {
#if defined(__GNUC__) || defined(__clang__)
  __builtin_unreachable();
#elif defined(_MSC_VER)
  __assume(0);
#endif
}

} // namespace biods
#endif
