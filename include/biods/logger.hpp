// Copyright The biods Developers.
//
// Logger - reports progress and recoverable problems through a callback.

#ifndef BIODS_LOGGER_HPP_
#define BIODS_LOGGER_HPP_

#include <cstdio>      // for fprintf
#include <functional>  // for function
#include <string>
#include "fail.hpp"    // for fail, BIODS_COLD
#include "util.hpp"    // for cat

namespace biods {

/// Messages have syslog-like levels: 8=debug, 6=info, 5=notice, 3=warning.
/// Only messages with level <= threshold reach the callback.
/// Without a callback, messages are dropped, except that err() throws.
struct Logger {
  std::function<void(const std::string&)> callback;
  int threshold = 6;

  template<class... Args> void debug(Args const&... args) const {
    send(8, "Debug: ", args...);
  }
  template<class... Args> void mesg(Args const&... args) const {
    send(6, args...);
  }
  template<class... Args> void note(Args const&... args) const {
    send(5, "Note: ", args...);
  }
  /// An error that the caller may choose to downgrade to a warning
  /// by setting a callback.
  template<class... Args> BIODS_COLD void err(Args const&... args) const {
    if (!callback)
      fail(cat(args...));
    send(3, "Warning: ", args...);
  }

  /// logger.callback = Logger::to_stderr;
  static void to_stderr(const std::string& s) {
    std::fprintf(stderr, "%s\n", s.c_str());
  }

private:
  template<class... Args> void send(int level, Args const&... args) const {
    if (callback && level <= threshold)
      callback(cat(args...));
  }
};

} // namespace biods
#endif
