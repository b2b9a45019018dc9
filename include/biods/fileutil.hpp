// Copyright The biods Developers.
//
// File-related utilities.

#ifndef BIODS_FILEUTIL_HPP_
#define BIODS_FILEUTIL_HPP_

#include <cstdio>    // for FILE, fopen, fclose
#include <cstdint>
#include <cstdlib>   // for malloc, realloc, free
#include <memory>    // for unique_ptr
#include <string>
#include <utility>   // for swap
#include <sys/stat.h>  // for stat
#if defined(_WIN32)
# include <direct.h>   // for _mkdir
#endif
#include "fail.hpp"  // for sys_fail

namespace biods {

inline std::string path_dirname(const std::string& path) {
  size_t pos = path.find_last_of("\\/");
  return pos == std::string::npos ? std::string() : path.substr(0, pos);
}

inline std::string path_join(const std::string& dir, const std::string& name) {
  if (dir.empty())
    return name;
  if (dir.back() == '/' || dir.back() == '\\')
    return dir + name;
  return dir + "/" + name;
}

// file operations

/// deleter for fileptr_t
struct needs_fclose {
  bool use_fclose;
  void operator()(std::FILE* f) const noexcept {
    if (use_fclose)
      std::fclose(f);
  }
};

typedef std::unique_ptr<std::FILE, needs_fclose> fileptr_t;

inline fileptr_t file_open(const char* path, const char* mode) {
  std::FILE* file = std::fopen(path, mode);
  if (file == nullptr)
    sys_fail(std::string("Failed to open ") + path +
             (*mode == 'w' ? " for writing" : ""));
  return fileptr_t(file, needs_fclose{true});
}

// helper function for treating "-" as stdin or stdout
inline fileptr_t file_open_or(const char* path, const char* mode,
                              std::FILE* dash_stream) {
  if (path[0] == '-' && path[1] == '\0')
    return fileptr_t(dash_stream, needs_fclose{false});
  return file_open(path, mode);
}

inline std::size_t file_size(std::FILE* f, const std::string& path) {
  if (std::fseek(f, 0, SEEK_END) != 0)
    sys_fail(path + ": fseek failed");
  long length = std::ftell(f);
  if (length < 0)
    sys_fail(path + ": ftell failed");
  if (std::fseek(f, 0, SEEK_SET) != 0)
    sys_fail(path + ": fseek failed");
  return length;
}

inline bool file_exists(const std::string& path) {
  struct stat st;
  return ::stat(path.c_str(), &st) == 0;
}

inline bool is_directory(const std::string& path) {
  struct stat st;
  return ::stat(path.c_str(), &st) == 0 && (st.st_mode & S_IFMT) == S_IFDIR;
}

// Modification time in nanoseconds since the epoch, or -1 if the file
// does not exist. On Windows the resolution is one second.
inline long long file_mtime(const std::string& path) {
  struct stat st;
  if (::stat(path.c_str(), &st) != 0)
    return -1;
#if defined(_WIN32)
  return (long long) st.st_mtime * 1000000000LL;
#elif defined(__APPLE__)
  return (long long) st.st_mtimespec.tv_sec * 1000000000LL + st.st_mtimespec.tv_nsec;
#else
  return (long long) st.st_mtim.tv_sec * 1000000000LL + st.st_mtim.tv_nsec;
#endif
}

// Creates directory and missing parents (like mkdir -p).
inline void make_directories(const std::string& path) {
  if (path.empty() || is_directory(path))
    return;
  size_t sep = path.find_last_of("\\/", path.size() - 2);
  if (sep != std::string::npos && sep != 0)
    make_directories(path.substr(0, sep));
#if defined(_WIN32)
  int ret = ::_mkdir(path.c_str());
#else
  int ret = ::mkdir(path.c_str(), 0777);
#endif
  if (ret != 0 && !is_directory(path))
    sys_fail("Failed to create directory " + path);
}

// helper functions for working with binary data
inline bool is_little_endian() {
  std::uint32_t x = 1;
  return *reinterpret_cast<char *>(&x) == 1;
}

inline void swap_two_bytes(void* start) {
  char* bytes = static_cast<char*>(start);
  std::swap(bytes[0], bytes[1]);
}

inline void swap_four_bytes(void* start) {
  char* bytes = static_cast<char*>(start);
  std::swap(bytes[0], bytes[3]);
  std::swap(bytes[1], bytes[2]);
}

inline void swap_eight_bytes(void* start) {
  char* bytes = static_cast<char*>(start);
  std::swap(bytes[0], bytes[7]);
  std::swap(bytes[1], bytes[6]);
  std::swap(bytes[2], bytes[5]);
  std::swap(bytes[3], bytes[4]);
}


class CharArray {
  std::unique_ptr<char, decltype(&std::free)> ptr_;
  size_t size_;
public:
  CharArray() : ptr_(nullptr, &std::free), size_(0) {}
  explicit CharArray(size_t n) : ptr_((char*)std::malloc(n), &std::free), size_(n) {
    if (!ptr_ && n != 0)
      fail("Out of memory.");
  }
  explicit operator bool() const { return (bool)ptr_; }
  char* data() { return ptr_.get(); }
  const char* data() const { return ptr_.get(); }
  size_t size() const { return size_; }
  void set_size(size_t n) { size_ = n; }

  void resize(size_t n) {
    char* new_ptr = (char*) std::realloc(ptr_.get(), n);
    if (!new_ptr && n != 0)
      fail("Out of memory.");
    (void) ptr_.release();  // NOLINT(bugprone-unused-return-value)
    ptr_.reset(new_ptr);
    size_ = n;
  }
};


/// reading file into a memory buffer (uses fseek to determine file size)
inline CharArray read_file_into_buffer(const std::string& path) {
  fileptr_t f = file_open(path.c_str(), "rb");
  size_t size = file_size(f.get(), path);
  CharArray buffer(size);
  if (size != 0 && std::fread(buffer.data(), size, 1, f.get()) != 1)
    sys_fail(path + ": fread failed");
  return buffer;
}

inline CharArray read_stdin_into_buffer() {
  size_t n = 0;
  CharArray buffer(16 * 1024);
  for (;;) {
    n += std::fread(buffer.data() + n, 1, buffer.size() - n, stdin);
    if (n != buffer.size()) {
      buffer.set_size(n);
      break;
    }
    buffer.resize(2*n);
  }
  return buffer;
}

template<typename T>
inline CharArray read_into_buffer(T&& input) {
  if (input.is_compressed())
    return input.uncompress_into_buffer();
  if (input.is_stdin())
    return read_stdin_into_buffer();
  return read_file_into_buffer(input.path());
}

inline void write_buffer_to_file(const std::string& path,
                                 const char* data, size_t size) {
  fileptr_t f = file_open_or(path.c_str(), "wb", stdout);
  if (size != 0 && std::fwrite(data, size, 1, f.get()) != 1)
    sys_fail("Failed to write " + path);
}

} // namespace biods
#endif
