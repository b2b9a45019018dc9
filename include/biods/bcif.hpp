// Copyright The biods Developers.
//
// BinaryCIF (version 0.3) reading and writing.
// A BinaryCIF file is a MessagePack map with columnar, encoded CIF data.

#ifndef BIODS_BCIF_HPP_
#define BIODS_BCIF_HPP_

#include <cstdint>
#include <memory>  // for shared_ptr
#include <string>
#include <vector>
#include "cifdoc.hpp"  // for cif::Document
#include "fail.hpp"    // for BIODS_DLL

namespace biods {

struct BcifWriteOptions {
  /// floats with more decimal places than this are stored as strings
  int max_decimals = 6;
  /// categories (e.g. "_atom_site_anisotrop") that are not written
  std::vector<std::string> skip_categories;
  /// written to the "encoder" field
  std::string encoder = "biods";
};

namespace bcif {

enum class DataType : int {
  Int8 = 1,
  Int16 = 2,
  Int32 = 3,
  Uint8 = 4,
  Uint16 = 5,
  Uint32 = 6,
  Float32 = 32,
  Float64 = 33,
};

BIODS_DLL int data_type_size(DataType type);

enum class EncodingKind {
  ByteArray,
  FixedPoint,
  IntervalQuantization,
  RunLength,
  Delta,
  IntegerPacking,
  StringArray,
};

BIODS_DLL const char* encoding_kind_name(EncodingKind kind);
BIODS_DLL EncodingKind encoding_kind_from_name(const std::string& name);

struct StringArrayParts;

/// One step of the pipeline. Only the fields relevant to the kind are used.
struct Encoding {
  EncodingKind kind;
  DataType type = DataType::Int32;      // ByteArray
  DataType src_type = DataType::Int32;  // FixedPoint, IntervalQuantization,
                                        // RunLength, Delta
  double factor = 1;                    // FixedPoint
  double min = 0, max = 0;              // IntervalQuantization
  int num_steps = 0;                    // IntervalQuantization
  std::int32_t origin = 0;              // Delta
  int src_size = 0;                     // RunLength, IntegerPacking
  int byte_count = 1;                   // IntegerPacking
  bool is_unsigned = false;             // IntegerPacking
  std::shared_ptr<StringArrayParts> string_array;  // StringArray

  explicit Encoding(EncodingKind kind_);
};

/// StringArray keeps unique strings concatenated in string_data.
/// The offsets (encoded with offset_encoding) delimit the strings and
/// the column data are indices of strings (encoded with data_encoding),
/// -1 for masked values.
struct StringArrayParts {
  std::vector<Encoding> data_encoding;
  std::vector<Encoding> offset_encoding;
  std::string string_data;
  std::vector<std::uint8_t> offsets;
};

inline Encoding::Encoding(EncodingKind kind_) : kind(kind_) {
  if (kind == EncodingKind::StringArray)
    string_array = std::make_shared<StringArrayParts>();
}

/// Encoded data together with the encodings applied to it (in order).
struct EncodedData {
  std::vector<Encoding> encoding;
  std::vector<std::uint8_t> data;
};

enum class ValueKind { Int, Fixed, Float, String };

/// Decoded column values.
struct BIODS_DLL Values {
  ValueKind kind = ValueKind::Int;
  std::vector<std::int32_t> ints;    // Int and Fixed
  int decimals = 0;                  // Fixed: value = ints[i] / 10^decimals
  std::vector<double> floats;        // Float
  bool single_precision = false;     // Float, decoded from Float32
  std::vector<std::string> strings;  // String

  size_t size() const {
    switch (kind) {
      case ValueKind::Int:
      case ValueKind::Fixed: return ints.size();
      case ValueKind::Float: return floats.size();
      case ValueKind::String: return strings.size();
    }
    unreachable();
  }
  /// value i as it would be written in a text CIF file
  std::string to_cif(size_t i) const;
};

/// Decimal representation of n/10^decimals, e.g. (-5, 2) -> "-0.05".
BIODS_DLL std::string format_fixed(std::int64_t n, int decimals);

/// Picks the smallest of ByteArray(Int32) and IntegerPacking pipelines
/// (optionally preceded by Delta and/or RunLength).
BIODS_DLL EncodedData encode_integers(const std::vector<std::int32_t>& values);
BIODS_DLL EncodedData encode_fixed_point(const std::vector<std::int32_t>& scaled,
                                         int decimals);
/// Empty strings in masked rows should be marked with masked[i] != 0.
BIODS_DLL EncodedData encode_strings(const std::vector<std::string>& values,
                                     const std::vector<std::uint8_t>& masked);

BIODS_DLL Values decode(const EncodedData& data);
BIODS_DLL std::vector<std::int32_t> decode_integers(const EncodedData& data);

/// Mask values.
enum : std::uint8_t { Present = 0, NotApplicable = 1, Unknown = 2 };

/// A column ready for encoding: raw CIF values classified and converted.
struct EncodedColumn {
  std::string name;
  EncodedData data;
  bool has_mask = false;
  EncodedData mask;
};

/// Encodes raw CIF tokens (quotes are removed, '.' and '?' go to the mask).
BIODS_DLL EncodedColumn encode_column(const std::string& name,
                                      const std::vector<const std::string*>& raw,
                                      int max_decimals);

} // namespace bcif

BIODS_DLL std::vector<char> write_bcif_to_buffer(
    const cif::Document& doc, const BcifWriteOptions& options=BcifWriteOptions());
BIODS_DLL void write_bcif_file(const cif::Document& doc, const std::string& path,
                               const BcifWriteOptions& options=BcifWriteOptions());

BIODS_DLL cif::Document read_bcif_memory(const char* data, size_t size,
                                         const char* name);
/// Reads *.bcif or *.bcif.gz file ("-" for stdin).
BIODS_DLL cif::Document read_bcif_file(const std::string& path);

inline bool is_bcif_data(const char* data, size_t size) {
  // MessagePack map: fixmap, map16 or map32
  if (size == 0)
    return false;
  unsigned char c = static_cast<unsigned char>(data[0]);
  return (c >= 0x80 && c <= 0x8f) || c == 0xde || c == 0xdf;
}

} // namespace biods
#endif
