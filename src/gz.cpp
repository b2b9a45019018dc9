// Copyright The biods Developers.

#include <biods/gz.hpp>
#include <algorithm>  // for min, max
#include <climits>    // for INT_MAX
#include <cstdio>     // for fseek, fread
#include <zlib.h>

namespace biods {

namespace {

// The gzip trailer ends with the uncompressed size modulo 4 GiB.
// It is only a hint for the initial buffer size, 0 if implausible.
size_t gzip_size_hint(const std::string& path) {
  fileptr_t f = file_open(path.c_str(), "rb");
  size_t compressed_size = file_size(f.get(), path);
  unsigned char b[4];
  if (compressed_size < 18 || std::fseek(f.get(), -4, SEEK_END) != 0 ||
      std::fread(b, 1, 4, f.get()) != 4)
    return 0;
  size_t size = b[0] | (b[1] << 8) | (b[2] << 16) | ((size_t) b[3] << 24);
  return size <= 1000 * compressed_size ? size : 0;
}

// returns 0 at the end of file
size_t gzread_checked(gzFile file, char* buf, size_t len, const std::string& path) {
  int n = gzread(file, buf, (unsigned) std::min(len, (size_t) INT_MAX));
  if (n < 0) {
    int errnum = 0;
    const char* msg = gzerror(file, &errnum);
    if (errnum == Z_ERRNO)
      sys_fail("Failed to read " + path);
    fail("Error reading " + path + ": " + msg);
  }
  return (size_t) n;
}

} // anonymous namespace

char* GzStream::gets(char* line, int size) {
  return gzgets((gzFile) f, line, size);
}

int GzStream::getc() {
  return gzgetc((gzFile) f);
}

MaybeGzipped::~MaybeGzipped() {
  if (file_)
    gzclose_r((gzFile) file_);
}

void MaybeGzipped::open_gz() {
  if (file_)
    fail("gzipped file opened twice: " + path_);
  file_ = gzopen(path_.c_str(), "rb");
  if (!file_)
    sys_fail("Failed to gzopen " + path_);
}

CharArray MaybeGzipped::uncompress_into_buffer() {
  if (!is_compressed())
    return CharArray();
  size_t hint = gzip_size_hint(path_);
  open_gz();
  // one byte more than expected, so that the end of file is noticed
  CharArray mem(std::max(hint + 1, (size_t) 64 * 1024));
  size_t size = 0;
  while (size_t n = gzread_checked((gzFile) file_, mem.data() + size,
                                   mem.size() - size, path_)) {
    size += n;
    if (size == mem.size())
      mem.resize(2 * size);
  }
  mem.set_size(size);
  return mem;
}

std::unique_ptr<AnyStream> MaybeGzipped::create_stream() {
  if (!is_compressed())
    return std::unique_ptr<AnyStream>(new FileStream(path_.c_str()));
  open_gz();
  gzbuffer((gzFile) file_, 64 * 1024);
  return std::unique_ptr<AnyStream>(new GzStream(file_));
}

} // namespace biods
