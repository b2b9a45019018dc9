// Copyright The biods Developers.
//
// Transparent reading of gzipped files (*.gz). Uses zlib.

#ifndef BIODS_GZ_HPP_
#define BIODS_GZ_HPP_

#include <memory>       // for unique_ptr
#include <string>
#include "fail.hpp"     // for BIODS_DLL
#include "fileutil.hpp" // for CharArray
#include "input.hpp"    // for AnyStream
#include "util.hpp"     // for iends_with

namespace biods {

/// Lines of a gzipped file. The file is owned by MaybeGzipped.
struct BIODS_DLL GzStream final : public AnyStream {
  explicit GzStream(void* gzfile) : f(gzfile) {}
  char* gets(char* line, int size) override;
  int getc() override;
private:
  void* f;  // gzFile
};

/// A path that is decompressed while reading if it ends with .gz.
/// "-" stands for stdin (not compressed).
class BIODS_DLL MaybeGzipped {
public:
  explicit MaybeGzipped(const std::string& path) : path_(path) {}
  ~MaybeGzipped();
  MaybeGzipped(const MaybeGzipped&) = delete;
  MaybeGzipped& operator=(const MaybeGzipped&) = delete;

  const std::string& path() const { return path_; }
  bool is_stdin() const { return path_ == "-"; }
  bool is_compressed() const { return iends_with(path_, ".gz"); }

  /// the whole uncompressed content (only for compressed files)
  CharArray uncompress_into_buffer();
  /// The stream is valid as long as this object.
  std::unique_ptr<AnyStream> create_stream();

private:
  std::string path_;
  void* file_ = nullptr;  // gzFile
  void open_gz();
};

} // namespace biods
#endif
