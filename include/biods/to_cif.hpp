// Copyright The biods Developers.
//
// Writing cif::Document as text CIF (the output of bcif2cif).

#ifndef BIODS_TO_CIF_HPP_
#define BIODS_TO_CIF_HPP_

#include <algorithm>  // for max, min
#include <cstring>    // for memcpy, memset
#include <ostream>
#include "cifdoc.hpp"

namespace biods {
namespace cif {

struct WriteOptions {
  /// single-row loops are written as tag-value pairs
  bool prefer_pairs = false;
  /// '#' lines separate categories (as in files from the PDB)
  bool misuse_hash = false;
  /// values of pairs start after this column
  size_t align_pairs = 0;
  /// maximal width to which loop columns are padded, 0 = no padding
  size_t align_loops = 0;
};

/// Writes blocks to std::ostream through a local buffer,
/// which is much faster than writing values one by one.
class CifWriter {
public:
  CifWriter(std::ostream& os, const WriteOptions& options)
    : os_(os), opt_(options), ptr_(buf_) {}
  ~CifWriter() { flush(); }
  CifWriter(const CifWriter&) = delete;
  CifWriter& operator=(const CifWriter&) = delete;

  void flush() {
    os_.write(buf_, ptr_ - buf_);
    ptr_ = buf_;
  }

  void write_block(const Block& block) {
    if (!first_block_)
      put('\n');
    first_block_ = false;
    put("data_");
    put(block.name);
    put('\n');
    hash_line();
    write_items(block.items);
    hash_line();
  }

private:
  // put(char) and pad() may add up to kReserve bytes without flushing
  static const size_t kReserve = 512;
  std::ostream& os_;
  WriteOptions opt_;
  char buf_[8192];
  char* ptr_;
  bool first_block_ = true;

  void put(const char* s, size_t len) {
    if (size_t(ptr_ - buf_) + len > sizeof(buf_) - kReserve) {
      flush();
      if (len > sizeof(buf_) - kReserve) {
        os_.write(s, len);
        return;
      }
    }
    std::memcpy(ptr_, s, len);
    ptr_ += len;
  }
  void put(const std::string& s) { put(s.c_str(), s.size()); }
  void put(const char* s) { put(s, std::strlen(s)); }
  void put(char c) { *ptr_++ = c; }
  void pad(size_t n) {
    n = std::min(n, kReserve - 2);
    std::memset(ptr_, ' ', n);
    ptr_ += n;
  }
  void hash_line() {
    if (opt_.misuse_hash)
      put("#\n");
  }

  // \r\n in text fields becomes \n
  void put_text_field(const std::string& value) {
    size_t pos = 0;
    for (size_t crlf; (crlf = value.find("\r\n", pos)) != std::string::npos; pos = crlf + 1)
      put(value.c_str() + pos, crlf - pos);
    put(value.c_str() + pos, value.size() - pos);
  }

  void write_pair(const std::string& tag, const std::string& value) {
    put(tag);
    if (is_text_field(value)) {
      put('\n');
      put_text_field(value);
    } else if (tag.size() + value.size() > 120) {
      put('\n');
      put(value);
    } else {
      put(' ');
      if (tag.size() < opt_.align_pairs)
        pad(opt_.align_pairs - tag.size());
      put(value);
    }
    put('\n');
  }

  void write_loop(const Loop& loop) {
    size_t ncol = loop.width();
    if (opt_.prefer_pairs && loop.length() == 1) {
      for (size_t i = 0; i != ncol; ++i)
        write_pair(loop.tags[i], loop.values[i]);
      return;
    }
    put("loop_");
    for (const std::string& tag : loop.tags) {
      put('\n');
      put(tag);
    }
    std::vector<size_t> widths(ncol, 0);
    if (opt_.align_loops != 0)
      for (size_t i = 0; i != loop.values.size(); ++i) {
        const std::string& val = loop.values[i];
        size_t& w = widths[i % ncol];
        if (!is_text_field(val))
          w = std::min(std::max(w, val.size()), opt_.align_loops);
      }
    for (size_t i = 0; i != loop.values.size(); ++i) {
      const std::string& val = loop.values[i];
      size_t col = i % ncol;
      bool text_field = is_text_field(val);
      // a text field always starts and ends a line
      bool after_text = i != 0 && is_text_field(loop.values[i-1]);
      put(col == 0 || text_field || after_text ? '\n' : ' ');
      if (text_field) {
        put_text_field(val);
      } else {
        put(val);
        if (col + 1 != ncol && val.size() < widths[col])
          pad(widths[col] - val.size());
      }
    }
    put('\n');
  }

  // a blank line (or '#') precedes each category, but not between
  // consecutive pairs of the same category
  static bool same_category(const Item& a, const Item& b) {
    if (a.type != ItemType::Pair || b.type != ItemType::Pair)
      return false;
    size_t dot = a.pair[0].find('.');
    return dot != std::string::npos && b.pair[0].size() > dot &&
           a.pair[0].compare(0, dot + 1, b.pair[0], 0, dot + 1) == 0;
  }

  void write_items(const std::vector<Item>& items) {
    for (size_t i = 0; i != items.size(); ++i) {
      const Item& item = items[i];
      if (i != 0 && !same_category(items[i-1], item)) {
        if (opt_.misuse_hash)
          put('#');
        put('\n');
      }
      switch (item.type) {
        case ItemType::Pair:
          write_pair(item.pair[0], item.pair[1]);
          break;
        case ItemType::Loop:
          write_loop(item.loop);
          break;
        case ItemType::Frame:
          put("save_");
          put(item.frame->name);
          put('\n');
          write_items(item.frame->items);
          put("save_\n");
          break;
      }
    }
  }
};

inline void write_cif_to_stream(std::ostream& os, const Document& doc,
                                const WriteOptions& options=WriteOptions()) {
  CifWriter writer(os, options);
  for (const Block& block : doc.blocks)
    writer.write_block(block);
}

} // namespace cif
} // namespace biods

#endif
