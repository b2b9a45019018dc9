// Copyright The biods Developers.
//
// Text CIF 1.1 parser: a PEGTL grammar and actions that fill cif::Document.

#ifndef BIODS_CIF_HPP_
#define BIODS_CIF_HPP_
#include <cstdio>     // for stdin
#include <string>

#include <tao/pegtl.hpp>

#include "cifdoc.hpp" // for Document, etc
#include "fileutil.hpp" // for CharArray

namespace biods {
namespace cif {
using std::size_t;
namespace pegtl = tao::pegtl;

// **** grammar rules, named similarly as in CIF 1.1 ****
namespace rules {

  using namespace pegtl;

  // Character sets.
  // OrdinaryChar: printable ASCII except " # $ ' _ ; [ ] and space
  struct ordinary_char : ranges<'!', '!', '%', '&', '(', ':', '<', 'Z',
                                '\\', '\\', '^', '^', '`', '~'> {};
  // space, \t, \n, \v, \f, \r
  using ws_char = pegtl::space;
  // !"#$%&'()*+,-./0-9:;<=>?@A-Z[\]^_`a-z{|}~
  struct nonblank_ch : range<'!', '~'> {};

  // White space and comments.
  struct comment : if_must<one<'#'>, until<eolf>> {};
  struct whitespace : pegtl::plus<sor<ws_char, comment>> {};
  struct ws_or_eof : sor<whitespace, pegtl::eof> {};

  // Reserved words.
  struct str_data : TAO_PEGTL_ISTRING("data_") {};
  struct str_loop : TAO_PEGTL_ISTRING("loop_") {};
  struct str_global : TAO_PEGTL_ISTRING("global_") {};
  struct str_save : TAO_PEGTL_ISTRING("save_") {};
  struct str_stop : TAO_PEGTL_ISTRING("stop_") {};
  struct keyword : sor<str_data, str_loop, str_global, str_save, str_stop> {};

  // Character strings and text fields.
  template<typename Q>
  struct endq : seq<Q, at<sor<one<' ','\n','\r','\t','#'>, pegtl::eof>>> {};
  // Non-ascii characters are accepted inside quotes (the PDB has such files).
  template<typename Q> struct quoted_tail : until<endq<Q>, not_one<'\n'>> {};
  template<typename Q> struct quoted : if_must<Q, quoted_tail<Q>> {};
  struct singlequoted : quoted<one<'\''>> {};
  struct doublequoted : quoted<one<'"'>> {};
  struct field_sep : seq<bol, one<';'>> {};
  struct textfield : if_must<field_sep, until<field_sep>> {};
  struct unquoted : seq<not_at<keyword>, not_at<one<'_','$','#'>>,
                        pegtl::plus<nonblank_ch>> {};

  // Basic structure of CIF. Tags and values.
  // A bare data_ (empty block name) is accepted.
  struct datablockname : star<nonblank_ch> {};
  struct datablockheading : sor<seq<str_data, datablockname>, str_global> {};
  struct tag : seq<one<'_'>, pegtl::plus<nonblank_ch>> {};
  // unquoted value made of ordinary characters only; in a typical mmCIF file
  // most values match it.
  struct simunq : seq<pegtl::plus<ordinary_char>, at<ws_char>> {};
  struct value: sor<simunq, singlequoted, doublequoted, textfield, unquoted> {};
  struct loop_tag : tag {};
  struct loop_value : value {};
  struct loop_end : opt<str_stop, ws_or_eof> {};
  struct loop: if_must<str_loop,
                       whitespace,
                       pegtl::plus<seq<loop_tag, whitespace, discard>>,
                       sor<pegtl::plus<seq<loop_value, ws_or_eof, discard>>,
                           // empty loop
                           at<sor<str_loop, pegtl::eof>>>,
                       loop_end> {};
  struct dataitem : if_must<tag, whitespace, value, ws_or_eof, discard> {};
  struct framename : pegtl::plus<nonblank_ch> {};
  struct endframe : str_save {};
  struct frame : if_must<str_save, framename, whitespace,
                         star<sor<dataitem, loop>>,
                         endframe, ws_or_eof> {};
  struct datablock : seq<datablockheading, ws_or_eof,
                         star<sor<dataitem, loop, frame>>> {};
  struct file : must<opt<whitespace>, star<datablock>, pegtl::eof> {};

} // namespace rules


// **** error messages ****

template<typename Rule> const std::string& error_message() {
  static const std::string s = "parse error";
  return s;
}
#define BIODS_CIF_ERROR_MSG(rule, msg) \
  template<> inline const std::string& error_message<rule>() { \
    static const std::string s = msg; \
    return s; \
  }
BIODS_CIF_ERROR_MSG(rules::quoted_tail<rules::one<'\''>>, "unterminated 'string'")
BIODS_CIF_ERROR_MSG(rules::quoted_tail<rules::one<'"'>>, "unterminated \"string\"")
BIODS_CIF_ERROR_MSG(pegtl::until<rules::field_sep>, "unterminated text field")
BIODS_CIF_ERROR_MSG(rules::value, "expected value")
BIODS_CIF_ERROR_MSG(rules::framename, "unnamed save_ frame")
#undef BIODS_CIF_ERROR_MSG

template<typename Rule> struct Errors : public pegtl::normal<Rule> {
  template<typename Input, typename ... States>
  static void raise(const Input& in, States&& ...) {
    throw pegtl::parse_error(error_message<Rule>(), in);
  }
};

// **** parsing actions that fill the storage ****

template<typename Rule> struct Action : pegtl::nothing<Rule> {};

template<> struct Action<rules::datablockname> {
  template<typename Input> static void apply(const Input& in, Document& out) {
    out.blocks.emplace_back(in.string());
    out.items_ = &out.blocks.back().items;
  }
};
template<> struct Action<rules::str_global> {
  template<typename Input> static void apply(const Input&, Document& out) {
    out.blocks.emplace_back();
    out.items_ = &out.blocks.back().items;
  }
};
template<> struct Action<rules::framename> {
  template<typename Input> static void apply(const Input& in, Document& out) {
    out.items_->emplace_back(FrameArg{in.string()});
    out.items_->back().line_number = (int) in.iterator().line;
    out.items_ = &out.items_->back().frame->items;
  }
};
template<> struct Action<rules::endframe> {
  template<typename Input> static void apply(const Input&, Document& out) {
    out.items_ = &out.blocks.back().items;
  }
};
template<> struct Action<rules::tag> {
  template<typename Input> static void apply(const Input& in, Document& out) {
    out.items_->emplace_back(in.string());
    out.items_->back().line_number = (int) in.iterator().line;
  }
};
template<> struct Action<rules::value> {
  template<typename Input> static void apply(const Input& in, Document& out) {
    out.items_->back().pair[1] = in.string();
  }
};
template<> struct Action<rules::str_loop> {
  template<typename Input> static void apply(const Input& in, Document& out) {
    out.items_->emplace_back(LoopArg{});
    out.items_->back().line_number = (int) in.iterator().line;
  }
};
template<> struct Action<rules::loop_tag> {
  template<typename Input> static void apply(const Input& in, Document& out) {
    out.items_->back().loop.tags.emplace_back(in.string());
  }
};
template<> struct Action<rules::loop_value> {
  template<typename Input> static void apply(const Input& in, Document& out) {
    out.items_->back().loop.values.emplace_back(in.string());
  }
};
template<> struct Action<rules::loop> {
  template<typename Input> static void apply(const Input& in, Document& out) {
    const Loop& loop = out.items_->back().loop;
    if (loop.values.size() % loop.tags.size() != 0)
      throw pegtl::parse_error("Wrong number of values in the loop", in);
  }
};


template<typename Input> Document parse_input(Input&& in) {
  Document doc;
  pegtl::parse<rules::file, Action, Errors>(in, doc);
  doc.source = in.source();
  doc.items_ = nullptr;
  check_duplicates(doc);
  return doc;
}

inline Document read_string(const std::string& data) {
  return parse_input(pegtl::memory_input<>(data, "string"));
}

inline Document read_memory(const char* data, size_t size, const char* name) {
  return parse_input(pegtl::memory_input<>(data, size, name));
}

/// Reads MaybeGzipped input, "-" being stdin.
template<typename T> Document read(T&& input) {
  if (input.is_stdin())
    return parse_input(pegtl::cstream_input<>(stdin, 16*1024, "stdin"));
  if (input.is_compressed()) {
    CharArray mem = input.uncompress_into_buffer();
    return read_memory(mem.data(), mem.size(), input.path().c_str());
  }
  return parse_input(pegtl::file_input<>(input.path()));
}

} // namespace cif
} // namespace biods
#endif
