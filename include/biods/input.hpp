// Copyright The biods Developers.
//
// Line-by-line reading from a file, gzipped file or memory buffer.

#ifndef BIODS_INPUT_HPP_
#define BIODS_INPUT_HPP_

#include <algorithm>  // for min
#include <cstdio>  // for FILE, fgets, fgetc, EOF
#include <cstring> // for memchr, memcpy, strlen
#include "fileutil.hpp"  // for fileptr_t, file_open_or

namespace biods {

/// Source of lines, implemented by FileStream, MemoryStream and GzStream.
struct AnyStream {
  virtual ~AnyStream() = default;

  /// the same contract as fgets()
  virtual char* gets(char* line, int size) = 0;
  virtual int getc() = 0;

  /// Reads one line (including '\n'), truncated to size-1 characters.
  /// The rest of a long line is skipped. Returns 0 at the end of input.
  size_t copy_line(char* line, int size) {
    if (!gets(line, size))
      return 0;
    size_t len = std::strlen(line);
    if (len != 0 && line[len-1] != '\n') {
      int c;
      do
        c = getc();
      while (c != EOF && c != '\n');
    }
    return len;
  }
};

/// reads from a file, "-" means stdin
struct FileStream final : public AnyStream {
  explicit FileStream(const char* path) : f(file_open_or(path, "rb", stdin)) {}

  char* gets(char* line, int size) override { return std::fgets(line, size, f.get()); }
  int getc() override { return std::fgetc(f.get()); }

private:
  fileptr_t f;
};

struct MemoryStream final : public AnyStream {
  MemoryStream(const char* start, size_t size) : cur(start), end(start + size) {}

  char* gets(char* line, int size) override {
    if (cur == end || size < 2)
      return nullptr;
    size_t n = std::min(size_t(size - 1), size_t(end - cur));
    const char* nl = (const char*) std::memchr(cur, '\n', n);
    if (nl)
      n = nl - cur + 1;
    std::memcpy(line, cur, n);
    line[n] = '\0';
    cur += n;
    return line;
  }
  int getc() override { return cur != end ? (unsigned char) *cur++ : EOF; }

private:
  const char* cur;
  const char* const end;
};

} // namespace biods
#endif
