// Copyright The biods Developers.
//
// cif::Document: the content of a CIF file, read from text CIF
// or decoded from BinaryCIF (bcif.hpp). Values are kept as written
// in text CIF, with quotes; as_string() and as_number() convert them.

#ifndef BIODS_CIFDOC_HPP_
#define BIODS_CIFDOC_HPP_

#include <algorithm> // for find
#include <array>
#include <cstring>   // for memchr
#include <memory>    // for unique_ptr
#include <stdexcept> // for out_of_range
#include <string>
#include <unordered_set>
#include <vector>
#include "util.hpp"  // for starts_with, to_lower, vector_remove_if
#include "fail.hpp"  // for fail

namespace biods {
namespace cif {
using std::size_t;

/// '?' (unknown) and '.' (inapplicable) are nulls, but not quoted '?' or '.'
inline bool is_null(const std::string& value) {
  return value.size() == 1 && (value[0] == '?' || value[0] == '.');
}

inline bool is_text_field(const std::string& val) {
  size_t len = val.size();
  return len > 3 && val[0] == ';' && (val[len-2] == '\n' || val[len-2] == '\r');
}

/// The value without quotes or text field delimiters; "" for nulls.
inline std::string as_string(const std::string& value) {
  if (value.empty() || is_null(value))
    return std::string();
  char first = value[0];
  if ((first == '\'' || first == '"') && value.size() >= 2)
    return value.substr(1, value.size() - 2);
  if (is_text_field(value)) {
    size_t end = value.size() - (value[value.size() - 3] == '\r' ? 3 : 2);
    return value.substr(1, end - 1);
  }
  return value;
}

inline std::string as_string(const std::string* value) {
  return value ? as_string(*value) : std::string();
}

/// for one-character fields such as pdbx_PDB_ins_code
inline char as_char(const std::string& value, char null) {
  std::string s = as_string(value);
  if (s.size() > 1)
    fail("Not a single character: " + value);
  return s.empty() ? null : s[0];
}

// data_, save_, loop_, stop_ and global_ cannot be used as unquoted values
inline bool is_reserved_word(const std::string& v) {
  std::string lower = to_lower(v.substr(0, 7));
  return starts_with(lower, "data_") || starts_with(lower, "save_") ||
         ((lower == "loop_" || lower == "stop_") && v.size() == 5) ||
         (lower == "global_" && v.size() == 7);
}

/// Adds quotes to a string that could not be written as an unquoted value.
inline std::string quote(const std::string& v) {
  // values with brackets are quoted in PDB files, so we do the same
  if (!v.empty() && v.find_first_of(" \t\r\n'\"()[]{}#") == std::string::npos &&
      v[0] != '_' && v[0] != '$' && v[0] != ';' &&
      (v.size() > 1 || (v[0] != '.' && v[0] != '?')) &&
      !is_reserved_word(v))
    return v;
  bool multiline = std::memchr(v.c_str(), '\n', v.size()) != nullptr;
  if (!multiline && v.find('\'') == std::string::npos)
    return "'" + v + "'";
  if (!multiline && v.find('"') == std::string::npos)
    return '"' + v + '"';
  return ";" + v + "\n;";
}

enum class ItemType : unsigned char { Pair, Loop, Frame };

using Pair = std::array<std::string, 2>;  // tag and value

struct Loop {
  std::vector<std::string> tags;
  std::vector<std::string> values;  // row after row

  int find_tag(const std::string& tag) const {
    auto it = std::find(tags.begin(), tags.end(), tag);
    return it != tags.end() ? int(it - tags.begin()) : -1;
  }
  size_t width() const { return tags.size(); }
  size_t length() const { return tags.empty() ? 0 : values.size() / tags.size(); }
  const std::string& val(size_t row, size_t col) const {
    return values[row * tags.size() + col];
  }
};

// tags of the Item constructors
struct LoopArg {};
struct FrameArg { std::string str; };

struct Block;

/// An element of a block: tag-value pair, loop or save frame.
/// Only the member corresponding to type is used.
struct Item {
  ItemType type;
  int line_number = -1;
  Pair pair;
  Loop loop;
  std::unique_ptr<Block> frame;

  // defined after Block, which must be complete for unique_ptr<Block>
  explicit Item(LoopArg);
  explicit Item(std::string&& tag);
  Item(const std::string& tag, const std::string& value);
  explicit Item(FrameArg&& frame_arg);
  Item(const Item& o);
  Item(Item&& o) noexcept;
  Item& operator=(const Item& o);
  Item& operator=(Item&& o) noexcept;
  ~Item();
};

/// Values of one tag: a loop column or the value of a pair.
class Column {
public:
  Column() = default;
  Column(Loop* loop, size_t col) : loop_(loop), col_(col) {}
  explicit Column(std::string* value) : value_(value) {}

  explicit operator bool() const { return loop_ || value_; }
  bool is_loop() const { return loop_ != nullptr; }
  int length() const {
    return loop_ ? (int) loop_->length() : (value_ ? 1 : 0);
  }
  std::string& operator[](int n) {
    return loop_ ? loop_->values[n * loop_->width() + col_] : *value_;
  }
  /// negative n counts from the end
  std::string& at(int n) {
    int len = length();
    if (n < 0)
      n += len;
    if (n < 0 || n >= len)
      throw std::out_of_range("Cannot access element " + std::to_string(n) +
                              " of Column with length " + std::to_string(len));
    return (*this)[n];
  }
  const std::string& at(int n) const { return const_cast<Column*>(this)->at(n); }
  std::string str(int n) const { return as_string(at(n)); }

private:
  Loop* loop_ = nullptr;
  std::string* value_ = nullptr;
  size_t col_ = 0;
};

/// Selected tags of one category, which is given either as a loop or as
/// tag-value pairs (then it has one row). Only for reading.
class Table {
public:
  /// empty table, returned when a required tag is absent
  Table() = default;
  /// cols are column indices in the loop, -1 for absent optional tags
  Table(const Loop* loop, std::vector<int> cols) : loop_(loop), cols_(std::move(cols)) {}
  /// values of pairs, null for absent optional tags
  explicit Table(std::vector<const std::string*> values) : values_(std::move(values)) {}

  struct Row {
    const Table& tab;
    size_t index;

    /// nullptr for absent optional tags
    const std::string* ptr_at(int n) const {
      if (!tab.loop_)
        return tab.values_.at(n);
      int col = tab.cols_.at(n);
      return col >= 0 ? &tab.loop_->values[index * tab.loop_->width() + col] : nullptr;
    }
    const std::string& operator[](int n) const {
      if (const std::string* p = ptr_at(n))
        return *p;
      throw std::out_of_range("Cannot access missing optional tag.");
    }
    bool has(int n) const { return tab.has_column(n); }
    /// has the tag and its value is not null
    bool has2(int n) const { return has(n) && !is_null((*this)[n]); }
    std::string str(int n) const { return as_string((*this)[n]); }
    size_t size() const { return tab.width(); }
  };

  bool ok() const { return width() != 0; }
  size_t width() const { return loop_ ? cols_.size() : values_.size(); }
  size_t length() const {
    if (loop_)
      return loop_->length();
    return values_.empty() ? 0 : 1;
  }
  bool has_column(int n) const {
    return loop_ ? cols_.at(n) >= 0 : values_.at(n) != nullptr;
  }
  Row operator[](size_t n) const { return Row{*this, n}; }

  // just enough of an iterator for range-for
  struct iterator {
    const Table& tab;
    size_t index;
    void operator++() { ++index; }
    bool operator!=(const iterator& o) const { return index != o.index; }
    Row operator*() const { return tab[index]; }
  };
  iterator begin() const { return iterator{*this, 0}; }
  iterator end() const { return iterator{*this, length()}; }

private:
  const Loop* loop_ = nullptr;
  std::vector<int> cols_;
  std::vector<const std::string*> values_;
};

struct Block {
  std::string name;
  std::vector<Item> items;

  Block() = default;
  explicit Block(const std::string& name_) : name(name_) {}

  const Item* find_pair_item(const std::string& tag) const {
    for (const Item& i : items)
      if (i.type == ItemType::Pair && i.pair[0] == tag)
        return &i;
    return nullptr;
  }

  Item* find_loop_item(const std::string& tag) {
    for (Item& i : items)
      if (i.type == ItemType::Loop && i.loop.find_tag(tag) != -1)
        return &i;
    return nullptr;
  }

  /// value of a pair or of a loop with one row
  const std::string* find_value(const std::string& tag) const {
    for (const Item& i : items) {
      if (i.type == ItemType::Pair && i.pair[0] == tag)
        return &i.pair[1];
      if (i.type == ItemType::Loop && i.loop.length() == 1) {
        int pos = i.loop.find_tag(tag);
        if (pos != -1)
          return &i.loop.values[pos];
      }
    }
    return nullptr;
  }

  /// values of a tag given either in a loop or as a pair
  Column find_values(const std::string& tag) {
    for (Item& i : items) {
      if (i.type == ItemType::Pair && i.pair[0] == tag)
        return Column(&i.pair[1]);
      if (i.type == ItemType::Loop) {
        int pos = i.loop.find_tag(tag);
        if (pos != -1)
          return Column(&i.loop, pos);
      }
    }
    return Column();
  }

  /// the same as find_values(), but only from a loop
  Column find_loop(const std::string& tag) {
    Column c = find_values(tag);
    return c.is_loop() ? c : Column();
  }

  /// Table with tags prefix+tags[i]. Tags starting with '?' are optional.
  /// Returns an empty Table (!ok()) if a required tag is absent.
  Table find(const std::string& prefix, const std::vector<std::string>& tags) const;

  void set_pair(const std::string& tag, const std::string& value) {
    if (tag.empty() || tag[0] != '_')
      fail("Tag should start with '_', got: " + tag);
    for (Item& i : items)
      if (i.type == ItemType::Pair && i.pair[0] == tag) {
        i.pair[1] = value;
        return;
      }
    items.emplace_back(tag, value);
  }

  /// Removes items of mmCIF category cat (e.g. "_atom_site.") and returns
  /// a new empty loop with the given tags (without the category prefix).
  Loop& init_mmcif_loop(std::string cat, const std::vector<std::string>& tags) {
    if (cat.empty() || cat[0] != '_')
      fail("Category should start with '_', got: " + cat);
    if (cat.back() != '.')
      cat += '.';
    vector_remove_if(items, [&](const Item& i) {
      if (i.type == ItemType::Pair)
        return starts_with(i.pair[0], cat);
      return i.type == ItemType::Loop && !i.loop.tags.empty() &&
             starts_with(i.loop.tags[0], cat);
    });
    items.emplace_back(LoopArg{});
    Loop& loop = items.back().loop;
    for (const std::string& tag : tags)
      loop.tags.push_back(cat + tag);
    return loop;
  }
};

inline Item::Item(LoopArg) : type(ItemType::Loop) {}

inline Item::Item(std::string&& tag)
  : type(ItemType::Pair), pair{{std::move(tag), std::string()}} {}

inline Item::Item(const std::string& tag, const std::string& value)
  : type(ItemType::Pair), pair{{tag, value}} {}

inline Item::Item(FrameArg&& frame_arg)
  : type(ItemType::Frame), frame(new Block(frame_arg.str)) {}

inline Item::Item(const Item& o)
  : type(o.type), line_number(o.line_number), pair(o.pair), loop(o.loop),
    frame(o.frame ? new Block(*o.frame) : nullptr) {}

inline Item::Item(Item&& o) noexcept
  : type(o.type), line_number(o.line_number), pair(std::move(o.pair)),
    loop(std::move(o.loop)), frame(std::move(o.frame)) {}

inline Item& Item::operator=(const Item& o) {
  if (this != &o) {
    Item tmp(o);
    *this = std::move(tmp);
  }
  return *this;
}

inline Item& Item::operator=(Item&& o) noexcept {
  if (this != &o) {
    type = o.type;
    line_number = o.line_number;
    pair = std::move(o.pair);
    loop = std::move(o.loop);
    frame = std::move(o.frame);
  }
  return *this;
}

inline Item::~Item() = default;

inline Table Block::find(const std::string& prefix,
                         const std::vector<std::string>& tags) const {
  std::vector<std::string> full_tags;
  for (const std::string& tag : tags)
    full_tags.push_back(prefix + (tag[0] == '?' ? tag.substr(1) : tag));
  auto required = [&](size_t n) { return tags[n][0] != '?'; };
  // a loop that has any of the tags has all the tags of the category
  for (const Item& item : items)
    if (item.type == ItemType::Loop)
      for (const std::string& full_tag : full_tags)
        if (item.loop.find_tag(full_tag) != -1) {
          std::vector<int> cols;
          for (size_t n = 0; n != full_tags.size(); ++n) {
            cols.push_back(item.loop.find_tag(full_tags[n]));
            if (cols.back() == -1 && required(n))
              return Table();
          }
          return Table(&item.loop, std::move(cols));
        }
  std::vector<const std::string*> values;
  for (size_t n = 0; n != full_tags.size(); ++n) {
    const Item* p = find_pair_item(full_tags[n]);
    if (!p && required(n))
      return Table();
    values.push_back(p ? &p->pair[1] : nullptr);
  }
  return Table(std::move(values));
}


struct Document {
  std::string source;
  std::vector<Block> blocks;

  // used while parsing: items of the current block or save frame
  std::vector<Item>* items_ = nullptr;

  Block* find_block(const std::string& name) {
    for (Block& b : blocks)
      if (b.name == name)
        return &b;
    return nullptr;
  }

  Block& add_new_block(const std::string& name) {
    if (find_block(name))
      fail("Block with such name already exists: " + name);
    blocks.emplace_back(name);
    return blocks.back();
  }

  /// blocks[0] if it is the only block, as in mmCIF files
  Block& sole_block() {
    if (blocks.size() != 1)
      fail("expected a single data block, got " + std::to_string(blocks.size()));
    return blocks[0];
  }
  const Block& sole_block() const {
    return const_cast<Document*>(this)->sole_block();
  }
};

/// Throws if a block name, save frame name or tag is repeated
/// (case-insensitively).
inline void check_duplicates(const Document& d) {
  auto fail_at = [&](const Block& b, const Item& item, const std::string& msg) {
    fail(d.source + ":" + std::to_string(item.line_number) +
         " in data_" + b.name + ": " + msg);
  };
  std::unordered_set<std::string> seen;
  for (const Block& block : d.blocks)
    // an empty name comes from global_, which may repeat
    if (!seen.insert(to_lower(block.name)).second && !block.name.empty())
      fail("duplicate block name: " + block.name);
  for (const Block& block : d.blocks) {
    seen.clear();
    for (const Item& item : block.items) {
      if (item.type == ItemType::Pair) {
        if (!seen.insert(to_lower(item.pair[0])).second)
          fail_at(block, item, "duplicate tag " + item.pair[0]);
      } else if (item.type == ItemType::Loop) {
        for (const std::string& tag : item.loop.tags)
          if (!seen.insert(to_lower(tag)).second)
            fail_at(block, item, "duplicate tag " + tag);
      } else if (!seen.insert("save_" + to_lower(item.frame->name)).second) {
        fail_at(block, item, "duplicate save_" + item.frame->name);
      }
    }
  }
}

} // namespace cif
} // namespace biods
#endif
