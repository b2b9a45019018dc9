// Copyright The biods Developers.

#include <biods/bcif.hpp>
#include <algorithm>   // for max
#include <cmath>       // for floor, log10, pow, round
#include <cstring>     // for memcpy
#include <limits>
#include <unordered_map>
#include <msgpack.hpp>
#include <biods/fileutil.hpp>  // for write_buffer_to_file, swap_four_bytes
#include <biods/gz.hpp>        // for MaybeGzipped
#include <biods/sprintf.hpp>   // for to_str_shortest
#include <biods/util.hpp>      // for in_vector, cat

namespace biods {
namespace bcif {

int data_type_size(DataType type) {
  switch (type) {
    case DataType::Int8:
    case DataType::Uint8: return 1;
    case DataType::Int16:
    case DataType::Uint16: return 2;
    case DataType::Int32:
    case DataType::Uint32:
    case DataType::Float32: return 4;
    case DataType::Float64: return 8;
  }
  fail("Unknown BinaryCIF data type: " + std::to_string((int)type));
}

static DataType data_type_from_int(int n) {
  switch (n) {
    case 1: case 2: case 3: case 4: case 5: case 6: case 32: case 33:
      return static_cast<DataType>(n);
  }
  fail("Unknown BinaryCIF data type: " + std::to_string(n));
}

const char* encoding_kind_name(EncodingKind kind) {
  switch (kind) {
    case EncodingKind::ByteArray: return "ByteArray";
    case EncodingKind::FixedPoint: return "FixedPoint";
    case EncodingKind::IntervalQuantization: return "IntervalQuantization";
    case EncodingKind::RunLength: return "RunLength";
    case EncodingKind::Delta: return "Delta";
    case EncodingKind::IntegerPacking: return "IntegerPacking";
    case EncodingKind::StringArray: return "StringArray";
  }
  unreachable();
}

EncodingKind encoding_kind_from_name(const std::string& name) {
  static const EncodingKind kinds[] = {
    EncodingKind::ByteArray, EncodingKind::FixedPoint,
    EncodingKind::IntervalQuantization, EncodingKind::RunLength,
    EncodingKind::Delta, EncodingKind::IntegerPacking, EncodingKind::StringArray
  };
  for (EncodingKind kind : kinds)
    if (name == encoding_kind_name(kind))
      return kind;
  fail("Unknown BinaryCIF encoding: " + name);
}

std::string format_fixed(std::int64_t n, int decimals) {
  bool negative = n < 0;
  std::uint64_t u = negative ? 0 - static_cast<std::uint64_t>(n)
                             : static_cast<std::uint64_t>(n);
  std::string digits = std::to_string(u);
  if (decimals > 0) {
    if (digits.size() < (size_t) decimals + 1)
      digits.insert(0, decimals + 1 - digits.size(), '0');
    digits.insert(digits.size() - decimals, 1, '.');
  }
  if (negative)
    digits.insert(0, 1, '-');
  return digits;
}

std::string Values::to_cif(size_t i) const {
  switch (kind) {
    case ValueKind::Int:
      return std::to_string(ints.at(i));
    case ValueKind::Fixed:
      return format_fixed(ints.at(i), decimals);
    case ValueKind::Float:
      if (single_precision)
        return to_str_shortest((float) floats.at(i));
      return to_str_shortest(floats.at(i));
    case ValueKind::String:
      return cif::quote(strings.at(i));
  }
  unreachable();
}

// ##### encoding #####

namespace {

// BinaryCIF data is little-endian
template<size_t N>
void swap_if_big_endian(std::uint8_t* bytes) {
  if (is_little_endian())
    return;
  switch (N) {
    case 2: swap_two_bytes(bytes); break;
    case 4: swap_four_bytes(bytes); break;
    case 8: swap_eight_bytes(bytes); break;
  }
}

template<typename T>
void append_le(std::vector<std::uint8_t>& out, T value) {
  std::uint8_t bytes[sizeof(T)];
  std::memcpy(bytes, &value, sizeof(T));
  swap_if_big_endian<sizeof(T)>(bytes);
  out.insert(out.end(), bytes, bytes + sizeof(T));
}

std::vector<std::uint8_t> byte_array_encode(const std::vector<std::int32_t>& values,
                                            DataType type) {
  std::vector<std::uint8_t> out;
  out.reserve(values.size() * data_type_size(type));
  for (std::int32_t v : values)
    switch (type) {
      case DataType::Int8: append_le((std::int8_t) v); break;
      case DataType::Int16: append_le((std::int16_t) v); break;
      case DataType::Int32: append_le(v); break;
      case DataType::Uint8: append_le((std::uint8_t) v); break;
      case DataType::Uint16: append_le((std::uint16_t) v); break;
      case DataType::Uint32: append_le((std::uint32_t) v); break;
      case DataType::Float32: append_le((float) v); break;
      case DataType::Float64: append_le((double) v); break;
    }
  return out;
}

struct Packing {
  int byte_count;
  bool is_unsigned;
  size_t size;  // number of packed values
};

size_t packing_size(const std::vector<std::int32_t>& values, std::int32_t upper) {
  std::int32_t lower = -upper - 1;
  size_t size = 0;
  for (std::int32_t v : values) {
    if (v == 0)
      size += 1;
    else if (v > 0)
      size += v / upper + 1;
    else
      size += v / lower + 1;
  }
  return size;
}

Packing determine_packing(const std::vector<std::int32_t>& values) {
  bool is_unsigned = true;
  for (std::int32_t v : values)
    if (v < 0) {
      is_unsigned = false;
      break;
    }
  size_t size8 = packing_size(values, is_unsigned ? 0xFF : 0x7F);
  size_t size16 = packing_size(values, is_unsigned ? 0xFFFF : 0x7FFF);
  if (size8 <= 2 * size16)
    return Packing{1, is_unsigned, size8};
  return Packing{2, is_unsigned, size16};
}

std::vector<std::int32_t> integer_packing_encode(const std::vector<std::int32_t>& values,
                                                 const Packing& packing) {
  std::int32_t upper;
  if (packing.is_unsigned)
    upper = packing.byte_count == 1 ? 0xFF : 0xFFFF;
  else
    upper = packing.byte_count == 1 ? 0x7F : 0x7FFF;
  std::int32_t lower = packing.is_unsigned ? 0 : -upper - 1;
  std::vector<std::int32_t> out;
  out.reserve(packing.size);
  for (std::int32_t v : values) {
    if (v >= 0) {
      while (v >= upper) {
        out.push_back(upper);
        v -= upper;
      }
    } else {
      while (v <= lower) {
        out.push_back(lower);
        v -= lower;
      }
    }
    out.push_back(v);
  }
  return out;
}

DataType packed_type(const Packing& packing) {
  if (packing.is_unsigned)
    return packing.byte_count == 1 ? DataType::Uint8 : DataType::Uint16;
  return packing.byte_count == 1 ? DataType::Int8 : DataType::Int16;
}

// IntegerPacking + ByteArray applied to values, appended to encoding
void pack_integers(const std::vector<std::int32_t>& values, EncodedData& out) {
  Packing packing = determine_packing(values);
  Encoding ip(EncodingKind::IntegerPacking);
  ip.byte_count = packing.byte_count;
  ip.is_unsigned = packing.is_unsigned;
  ip.src_size = (int) values.size();
  out.encoding.push_back(ip);
  Encoding ba(EncodingKind::ByteArray);
  ba.type = packed_type(packing);
  out.encoding.push_back(ba);
  out.data = byte_array_encode(integer_packing_encode(values, packing), ba.type);
}

bool delta_encode(const std::vector<std::int32_t>& values,
                  std::vector<std::int32_t>& out, std::int32_t& origin) {
  out.resize(values.size());
  origin = values.empty() ? 0 : values[0];
  for (size_t i = 0; i < values.size(); ++i) {
    std::int64_t d = i == 0 ? 0 : (std::int64_t) values[i] - values[i-1];
    if (d < std::numeric_limits<std::int32_t>::min() ||
        d > std::numeric_limits<std::int32_t>::max())
      return false;
    out[i] = (std::int32_t) d;
  }
  return true;
}

std::vector<std::int32_t> run_length_encode(const std::vector<std::int32_t>& values) {
  std::vector<std::int32_t> out;
  for (size_t i = 0; i < values.size(); ) {
    size_t j = i + 1;
    while (j < values.size() && values[j] == values[i])
      ++j;
    out.push_back(values[i]);
    out.push_back(std::int32_t(j - i));
    i = j;
  }
  return out;
}

} // anonymous namespace

EncodedData encode_integers(const std::vector<std::int32_t>& values) {
  std::vector<EncodedData> candidates;
  // ByteArray(Int32)
  candidates.emplace_back();
  candidates.back().encoding.emplace_back(EncodingKind::ByteArray);
  candidates.back().data = byte_array_encode(values, DataType::Int32);
  // IntegerPacking
  candidates.emplace_back();
  pack_integers(values, candidates.back());

  Encoding rl(EncodingKind::RunLength);
  rl.src_size = (int) values.size();
  std::vector<std::int32_t> rle = run_length_encode(values);
  // RunLength + IntegerPacking
  candidates.emplace_back();
  candidates.back().encoding.push_back(rl);
  pack_integers(rle, candidates.back());

  Encoding delta(EncodingKind::Delta);
  std::vector<std::int32_t> deltas;
  if (delta_encode(values, deltas, delta.origin)) {
    // Delta + IntegerPacking
    candidates.emplace_back();
    candidates.back().encoding.push_back(delta);
    pack_integers(deltas, candidates.back());
    // Delta + RunLength + IntegerPacking
    candidates.emplace_back();
    candidates.back().encoding.push_back(delta);
    candidates.back().encoding.push_back(rl);
    pack_integers(run_length_encode(deltas), candidates.back());
  }

  size_t best = 0;
  for (size_t i = 1; i < candidates.size(); ++i)
    if (candidates[i].data.size() < candidates[best].data.size())
      best = i;
  return std::move(candidates[best]);
}

EncodedData encode_fixed_point(const std::vector<std::int32_t>& scaled,
                               int decimals) {
  EncodedData result = encode_integers(scaled);
  Encoding fp(EncodingKind::FixedPoint);
  fp.factor = std::pow(10., decimals);
  fp.src_type = DataType::Float64;
  result.encoding.insert(result.encoding.begin(), fp);
  return result;
}

EncodedData encode_strings(const std::vector<std::string>& values,
                           const std::vector<std::uint8_t>& masked) {
  std::unordered_map<std::string, std::int32_t> index_of;
  std::vector<std::int32_t> indices(values.size(), -1);
  std::vector<std::int32_t> offsets(1, 0);
  Encoding sa(EncodingKind::StringArray);
  StringArrayParts& parts = *sa.string_array;
  for (size_t i = 0; i != values.size(); ++i) {
    if (!masked.empty() && masked[i] != Present)
      continue;
    auto it = index_of.find(values[i]);
    if (it == index_of.end()) {
      it = index_of.emplace(values[i], (std::int32_t) index_of.size()).first;
      parts.string_data += values[i];
      offsets.push_back((std::int32_t) parts.string_data.size());
    }
    indices[i] = it->second;
  }
  EncodedData encoded_offsets = encode_integers(offsets);
  parts.offset_encoding = std::move(encoded_offsets.encoding);
  parts.offsets = std::move(encoded_offsets.data);
  EncodedData encoded_indices = encode_integers(indices);
  parts.data_encoding = std::move(encoded_indices.encoding);
  EncodedData result;
  result.encoding.push_back(std::move(sa));
  result.data = std::move(encoded_indices.data);
  return result;
}

namespace {

// Parses decimal integer written in the canonical form (no '+', no leading
// zeros, no "-0") that fits in int32.
bool parse_canonical_int(const std::string& s, std::int32_t& out) {
  size_t start = (!s.empty() && s[0] == '-') ? 1 : 0;
  size_t len = s.size() - start;
  if (len == 0 || len > 10)
    return false;
  if (s[start] == '0' && (len > 1 || start == 1))
    return false;
  std::int64_t n = 0;
  for (size_t i = start; i < s.size(); ++i) {
    if (s[i] < '0' || s[i] > '9')
      return false;
    n = n * 10 + (s[i] - '0');
  }
  if (start)
    n = -n;
  if (n < std::numeric_limits<std::int32_t>::min() ||
      n > std::numeric_limits<std::int32_t>::max())
    return false;
  out = (std::int32_t) n;
  return true;
}

// Number of decimal places in a plain decimal number (-?[0-9]+(.[0-9]+)?),
// or -1 if it is not such a number.
int count_decimals(const std::string& s) {
  size_t i = (!s.empty() && s[0] == '-') ? 1 : 0;
  size_t int_digits = 0;
  for (; i < s.size() && s[i] >= '0' && s[i] <= '9'; ++i)
    ++int_digits;
  if (int_digits == 0)
    return -1;
  if (i == s.size())
    return 0;
  if (s[i] != '.')
    return -1;
  size_t frac_start = ++i;
  for (; i < s.size() && s[i] >= '0' && s[i] <= '9'; ++i) {}
  if (i != s.size() || i == frac_start)
    return -1;
  return int(i - frac_start);
}

// n = s * 10^decimals, s must have at most decimals decimal places
bool scale_decimal(const std::string& s, int decimals, std::int32_t& out) {
  std::int64_t n = 0;
  int frac = -1;
  bool negative = s[0] == '-';
  for (size_t i = negative ? 1 : 0; i < s.size(); ++i) {
    if (s[i] == '.') {
      frac = 0;
      continue;
    }
    n = n * 10 + (s[i] - '0');
    if (frac >= 0)
      ++frac;
    if (n > std::numeric_limits<std::int32_t>::max())
      return false;
  }
  for (int k = std::max(frac, 0); k < decimals; ++k) {
    n *= 10;
    if (n > std::numeric_limits<std::int32_t>::max())
      return false;
  }
  out = (std::int32_t) (negative ? -n : n);
  return true;
}

} // anonymous namespace

EncodedColumn encode_column(const std::string& name,
                            const std::vector<const std::string*>& raw,
                            int max_decimals) {
  EncodedColumn col;
  col.name = name;
  size_t n = raw.size();
  std::vector<std::uint8_t> mask(n, Present);
  std::vector<std::string> strings(n);
  for (size_t i = 0; i != n; ++i) {
    const std::string& v = *raw[i];
    if (cif::is_null(v))
      mask[i] = v[0] == '.' ? NotApplicable : Unknown;
    else
      strings[i] = cif::as_string(v);
  }
  for (std::uint8_t m : mask)
    if (m != Present) {
      col.has_mask = true;
      break;
    }
  if (col.has_mask) {
    std::vector<std::int32_t> mask_ints(mask.begin(), mask.end());
    col.mask = encode_integers(mask_ints);
  }

  // integers
  std::vector<std::int32_t> ints(n, 0);
  bool ok = true;
  for (size_t i = 0; i != n && ok; ++i)
    if (mask[i] == Present)
      ok = parse_canonical_int(strings[i], ints[i]);
  if (ok) {
    col.data = encode_integers(ints);
    return col;
  }

  // fixed-point numbers
  int decimals = 0;
  ok = true;
  for (size_t i = 0; i != n && ok; ++i)
    if (mask[i] == Present) {
      int d = count_decimals(strings[i]);
      if (d < 0 || d > max_decimals)
        ok = false;
      else
        decimals = std::max(decimals, d);
    }
  if (ok && decimals > 0) {
    for (size_t i = 0; i != n && ok; ++i)
      if (mask[i] == Present)
        ok = scale_decimal(strings[i], decimals, ints[i]) &&
             format_fixed(ints[i], decimals) == strings[i];
    if (ok) {
      col.data = encode_fixed_point(ints, decimals);
      return col;
    }
  }

  col.data = encode_strings(strings, mask);
  return col;
}

// ##### decoding #####

namespace {

// intermediate state of the decoding pipeline
struct Pipeline {
  bool is_bytes = true;
  std::vector<std::uint8_t> bytes;
  Values values;
};

template<typename T>
T read_le(const std::uint8_t* p) {
  std::uint8_t b[sizeof(T)];
  std::memcpy(b, p, sizeof(T));
  swap_if_big_endian<sizeof(T)>(b);
  T value;
  std::memcpy(&value, b, sizeof(T));
  return value;
}

void expect_ints(const Pipeline& p, const Encoding& enc) {
  if (p.is_bytes || p.values.kind != ValueKind::Int)
    fail(cat(encoding_kind_name(enc.kind), " expects integer input"));
}

void byte_array_decode(Pipeline& p, const Encoding& enc) {
  if (!p.is_bytes)
    fail("ByteArray expects binary input");
  size_t size = data_type_size(enc.type);
  if (p.bytes.size() % size != 0)
    fail(cat("truncated ByteArray: ", p.bytes.size(), " bytes, item size ", size));
  size_t n = p.bytes.size() / size;
  const std::uint8_t* ptr = p.bytes.data();
  Values& v = p.values;
  if (enc.type == DataType::Float32 || enc.type == DataType::Float64) {
    v.kind = ValueKind::Float;
    v.single_precision = enc.type == DataType::Float32;
    v.floats.resize(n);
    for (size_t i = 0; i != n; ++i, ptr += size)
      v.floats[i] = v.single_precision ? read_le<float>(ptr) : read_le<double>(ptr);
  } else {
    v.kind = ValueKind::Int;
    v.ints.resize(n);
    for (size_t i = 0; i != n; ++i, ptr += size)
      switch (enc.type) {
        case DataType::Int8: v.ints[i] = read_le<std::int8_t>(ptr); break;
        case DataType::Int16: v.ints[i] = read_le<std::int16_t>(ptr); break;
        case DataType::Int32: v.ints[i] = read_le<std::int32_t>(ptr); break;
        case DataType::Uint8: v.ints[i] = read_le<std::uint8_t>(ptr); break;
        case DataType::Uint16: v.ints[i] = read_le<std::uint16_t>(ptr); break;
        // values above INT32_MAX wrap around
        case DataType::Uint32: v.ints[i] = (std::int32_t) read_le<std::uint32_t>(ptr); break;
        default: unreachable();
      }
  }
  p.is_bytes = false;
  p.bytes.clear();
}

void integer_packing_decode(Pipeline& p, const Encoding& enc) {
  expect_ints(p, enc);
  std::int32_t upper;
  if (enc.is_unsigned)
    upper = enc.byte_count == 1 ? 0xFF : 0xFFFF;
  else
    upper = enc.byte_count == 1 ? 0x7F : 0x7FFF;
  std::int32_t lower = enc.is_unsigned ? std::numeric_limits<std::int32_t>::min()
                                       : -upper - 1;
  const std::vector<std::int32_t>& packed = p.values.ints;
  // each value takes at least one packed number
  if ((size_t) enc.src_size > packed.size())
    fail(cat("IntegerPacking: srcSize ", enc.src_size, " exceeds the ",
             packed.size(), " packed values"));
  std::vector<std::int32_t> result;
  result.reserve(enc.src_size);
  for (size_t i = 0; i < packed.size(); ) {
    std::int64_t value = 0;
    std::int32_t t = packed[i++];
    while (t == upper || t == lower) {
      value += t;
      if (i == packed.size())
        fail("IntegerPacking: data ends in the middle of a value");
      t = packed[i++];
    }
    result.push_back(std::int32_t(value + t));
  }
  if (result.size() != (size_t) enc.src_size)
    fail(cat("IntegerPacking: decoded ", result.size(),
             " values, expected srcSize ", enc.src_size));
  p.values.ints.swap(result);
}

void delta_decode(Pipeline& p, const Encoding& enc) {
  expect_ints(p, enc);
  std::vector<std::int32_t>& v = p.values.ints;
  if (v.empty())
    return;
  v[0] = (std::int32_t) ((std::uint32_t) v[0] + (std::uint32_t) enc.origin);
  for (size_t i = 1; i < v.size(); ++i)
    v[i] = (std::int32_t) ((std::uint32_t) v[i-1] + (std::uint32_t) v[i]);
}

void run_length_decode(Pipeline& p, const Encoding& enc) {
  expect_ints(p, enc);
  const std::vector<std::int32_t>& pairs = p.values.ints;
  if (pairs.size() % 2 != 0)
    fail("RunLength: odd number of values");
  std::int64_t total = 0;
  for (size_t i = 1; i < pairs.size(); i += 2) {
    if (pairs[i] < 0)
      fail(cat("RunLength: negative count ", pairs[i]));
    total += pairs[i];
  }
  if (total != enc.src_size)
    fail(cat("RunLength: decoded ", total, " values, expected srcSize ",
             enc.src_size));
  std::vector<std::int32_t> result;
  result.reserve(enc.src_size);
  for (size_t i = 0; i < pairs.size(); i += 2)
    result.insert(result.end(), pairs[i + 1], pairs[i]);
  p.values.ints.swap(result);
}

void fixed_point_decode(Pipeline& p, const Encoding& enc) {
  expect_ints(p, enc);
  if (enc.factor <= 0)
    fail("FixedPoint: invalid factor");
  double log_factor = std::log10(enc.factor);
  int decimals = (int) std::round(log_factor);
  Values& v = p.values;
  if (decimals >= 0 && decimals < 16 && std::pow(10., decimals) == enc.factor) {
    v.kind = ValueKind::Fixed;
    v.decimals = decimals;
    return;
  }
  v.kind = ValueKind::Float;
  v.single_precision = enc.src_type == DataType::Float32;
  v.floats.resize(v.ints.size());
  for (size_t i = 0; i != v.ints.size(); ++i)
    v.floats[i] = v.ints[i] / enc.factor;
  v.ints.clear();
}

void interval_quantization_decode(Pipeline& p, const Encoding& enc) {
  expect_ints(p, enc);
  if (enc.num_steps < 2)
    fail("IntervalQuantization: numSteps must be at least 2");
  Values& v = p.values;
  double delta = (enc.max - enc.min) / (enc.num_steps - 1);
  v.kind = ValueKind::Float;
  v.single_precision = enc.src_type == DataType::Float32;
  v.floats.resize(v.ints.size());
  for (size_t i = 0; i != v.ints.size(); ++i)
    v.floats[i] = enc.min + delta * v.ints[i];
  v.ints.clear();
}

void string_array_decode(Pipeline& p, const Encoding& enc) {
  if (!p.is_bytes)
    fail("StringArray expects binary input");
  const StringArrayParts& parts = *enc.string_array;
  EncodedData offsets_data;
  offsets_data.encoding = parts.offset_encoding;
  offsets_data.data = parts.offsets;
  std::vector<std::int32_t> offsets = decode_integers(offsets_data);
  EncodedData indices_data;
  indices_data.encoding = parts.data_encoding;
  indices_data.data.swap(p.bytes);
  std::vector<std::int32_t> indices = decode_integers(indices_data);

  std::vector<std::string> unique;
  unique.reserve(offsets.size());
  for (size_t i = 1; i < offsets.size(); ++i) {
    std::int32_t start = offsets[i-1];
    std::int32_t end = offsets[i];
    if (start < 0 || end < start || (size_t) end > parts.string_data.size())
      fail("StringArray: offsets out of range");
    unique.emplace_back(parts.string_data, start, end - start);
  }
  Values& v = p.values;
  v.kind = ValueKind::String;
  v.strings.resize(indices.size());
  for (size_t i = 0; i != indices.size(); ++i) {
    std::int32_t idx = indices[i];
    if (idx < -1 || idx >= (std::int32_t) unique.size())
      fail(cat("StringArray: index ", idx, " out of range"));
    if (idx >= 0)
      v.strings[i] = unique[idx];
  }
  p.is_bytes = false;
}

} // anonymous namespace

Values decode(const EncodedData& data) {
  Pipeline p;
  p.bytes = data.data;
  for (auto it = data.encoding.rbegin(); it != data.encoding.rend(); ++it) {
    switch (it->kind) {
      case EncodingKind::ByteArray: byte_array_decode(p, *it); break;
      case EncodingKind::FixedPoint: fixed_point_decode(p, *it); break;
      case EncodingKind::IntervalQuantization: interval_quantization_decode(p, *it); break;
      case EncodingKind::RunLength: run_length_decode(p, *it); break;
      case EncodingKind::Delta: delta_decode(p, *it); break;
      case EncodingKind::IntegerPacking: integer_packing_decode(p, *it); break;
      case EncodingKind::StringArray: string_array_decode(p, *it); break;
    }
  }
  if (p.is_bytes)
    fail("BinaryCIF data left undecoded");
  return std::move(p.values);
}

std::vector<std::int32_t> decode_integers(const EncodedData& data) {
  Values v = decode(data);
  if (v.kind != ValueKind::Int)
    fail("BinaryCIF: integer data expected");
  return std::move(v.ints);
}

} // namespace bcif

// ##### MessagePack container #####

namespace {

using Packer = msgpack::packer<msgpack::sbuffer>;

void pack_str(Packer& pk, const std::string& s) {
  pk.pack_str((std::uint32_t) s.size());
  pk.pack_str_body(s.data(), (std::uint32_t) s.size());
}

void pack_bin(Packer& pk, const std::vector<std::uint8_t>& bytes) {
  pk.pack_bin((std::uint32_t) bytes.size());
  pk.pack_bin_body(reinterpret_cast<const char*>(bytes.data()),
                   (std::uint32_t) bytes.size());
}

void pack_encodings(Packer& pk, const std::vector<bcif::Encoding>& encodings);

void pack_encoding(Packer& pk, const bcif::Encoding& enc) {
  using bcif::EncodingKind;
  switch (enc.kind) {
    case EncodingKind::ByteArray:
      pk.pack_map(2);
      break;
    case EncodingKind::FixedPoint:
    case EncodingKind::Delta:
      pk.pack_map(3);
      break;
    case EncodingKind::RunLength:
      pk.pack_map(3);
      break;
    case EncodingKind::IntervalQuantization:
      pk.pack_map(5);
      break;
    case EncodingKind::IntegerPacking:
      pk.pack_map(4);
      break;
    case EncodingKind::StringArray:
      pk.pack_map(5);
      break;
  }
  pack_str(pk, "kind");
  pack_str(pk, bcif::encoding_kind_name(enc.kind));
  switch (enc.kind) {
    case EncodingKind::ByteArray:
      pack_str(pk, "type");
      pk.pack_int((int) enc.type);
      break;
    case EncodingKind::FixedPoint:
      pack_str(pk, "factor");
      pk.pack_double(enc.factor);
      pack_str(pk, "srcType");
      pk.pack_int((int) enc.src_type);
      break;
    case EncodingKind::Delta:
      pack_str(pk, "origin");
      pk.pack_int(enc.origin);
      pack_str(pk, "srcType");
      pk.pack_int((int) enc.src_type);
      break;
    case EncodingKind::RunLength:
      pack_str(pk, "srcType");
      pk.pack_int((int) enc.src_type);
      pack_str(pk, "srcSize");
      pk.pack_int(enc.src_size);
      break;
    case EncodingKind::IntervalQuantization:
      pack_str(pk, "min");
      pk.pack_double(enc.min);
      pack_str(pk, "max");
      pk.pack_double(enc.max);
      pack_str(pk, "numSteps");
      pk.pack_int(enc.num_steps);
      pack_str(pk, "srcType");
      pk.pack_int((int) enc.src_type);
      break;
    case EncodingKind::IntegerPacking:
      pack_str(pk, "byteCount");
      pk.pack_int(enc.byte_count);
      pack_str(pk, "isUnsigned");
      if (enc.is_unsigned)
        pk.pack_true();
      else
        pk.pack_false();
      pack_str(pk, "srcSize");
      pk.pack_int(enc.src_size);
      break;
    case EncodingKind::StringArray:
      pack_str(pk, "dataEncoding");
      pack_encodings(pk, enc.string_array->data_encoding);
      pack_str(pk, "stringData");
      pack_str(pk, enc.string_array->string_data);
      pack_str(pk, "offsetEncoding");
      pack_encodings(pk, enc.string_array->offset_encoding);
      pack_str(pk, "offsets");
      pack_bin(pk, enc.string_array->offsets);
      break;
  }
}

void pack_encodings(Packer& pk, const std::vector<bcif::Encoding>& encodings) {
  pk.pack_array((std::uint32_t) encodings.size());
  for (const bcif::Encoding& enc : encodings)
    pack_encoding(pk, enc);
}

void pack_encoded_data(Packer& pk, const bcif::EncodedData& data) {
  pk.pack_map(2);
  pack_str(pk, "encoding");
  pack_encodings(pk, data.encoding);
  pack_str(pk, "data");
  pack_bin(pk, data.data);
}

struct CategoryData {
  std::string name;  // e.g. "_atom_site"
  size_t row_count = 0;
  std::vector<std::string> column_names;
  std::vector<std::vector<const std::string*>> columns;
};

// "_atom_site.id" -> ("_atom_site", "id"); "_tag" -> ("_tag", "")
void split_tag(const std::string& tag, std::string& category, std::string& column) {
  size_t dot = tag.find('.');
  if (dot == std::string::npos) {
    category = tag;
    column.clear();
  } else {
    category = tag.substr(0, dot);
    column = tag.substr(dot + 1);
  }
}

std::vector<CategoryData> collect_categories(const cif::Block& block,
                                             const BcifWriteOptions& options) {
  std::vector<CategoryData> cats;
  auto skipped = [&](const std::string& name) {
    for (const std::string& s : options.skip_categories)
      if (to_lower(s) == to_lower(name) || to_lower(s) == to_lower(name) + ".")
        return true;
    return false;
  };
  auto find_cat = [&](const std::string& name) -> CategoryData* {
    for (CategoryData& c : cats)
      if (c.name == name)
        return &c;
    return nullptr;
  };
  std::string cat_name, col_name;
  for (const cif::Item& item : block.items) {
    if (item.type == cif::ItemType::Frame)
      fail("save frames are not supported in BinaryCIF: save_" + item.frame->name);
    if (item.type == cif::ItemType::Pair) {
      split_tag(item.pair[0], cat_name, col_name);
      if (skipped(cat_name))
        continue;
      CategoryData* cat = find_cat(cat_name);
      if (!cat) {
        cats.emplace_back();
        cat = &cats.back();
        cat->name = cat_name;
        cat->row_count = 1;
      } else if (cat->row_count != 1) {
        fail("category " + cat_name + " is given both as pairs and as loop");
      }
      cat->column_names.push_back(col_name);
      cat->columns.emplace_back(1, &item.pair[1]);
    } else if (item.type == cif::ItemType::Loop) {
      const cif::Loop& loop = item.loop;
      if (loop.tags.empty())
        continue;
      split_tag(loop.tags[0], cat_name, col_name);
      if (skipped(cat_name))
        continue;
      if (find_cat(cat_name))
        fail("category " + cat_name + " occurs more than once in block " + block.name);
      cats.emplace_back();
      CategoryData& cat = cats.back();
      cat.name = cat_name;
      cat.row_count = loop.length();
      std::string tag_cat;
      for (size_t j = 0; j != loop.tags.size(); ++j) {
        split_tag(loop.tags[j], tag_cat, col_name);
        if (tag_cat != cat_name)
          fail("loop with " + loop.tags[0] + " contains " + loop.tags[j]);
        cat.column_names.push_back(col_name);
        cat.columns.emplace_back();
        std::vector<const std::string*>& col = cat.columns.back();
        col.reserve(cat.row_count);
        for (size_t row = 0; row != cat.row_count; ++row)
          col.push_back(&loop.values[row * loop.width() + j]);
      }
    }
  }
  return cats;
}

} // anonymous namespace

std::vector<char> write_bcif_to_buffer(const cif::Document& doc,
                                       const BcifWriteOptions& options) {
  msgpack::sbuffer sbuf;
  Packer pk(&sbuf);
  pk.pack_map(3);
  pack_str(pk, "version");
  pack_str(pk, "0.3.0");
  pack_str(pk, "encoder");
  pack_str(pk, options.encoder);
  pack_str(pk, "dataBlocks");
  pk.pack_array((std::uint32_t) doc.blocks.size());
  for (const cif::Block& block : doc.blocks) {
    std::vector<CategoryData> cats = collect_categories(block, options);
    pk.pack_map(2);
    pack_str(pk, "header");
    pack_str(pk, block.name);
    pack_str(pk, "categories");
    pk.pack_array((std::uint32_t) cats.size());
    for (const CategoryData& cat : cats) {
      pk.pack_map(3);
      pack_str(pk, "name");
      pack_str(pk, cat.name);
      pack_str(pk, "rowCount");
      pk.pack_uint64(cat.row_count);
      pack_str(pk, "columns");
      pk.pack_array((std::uint32_t) cat.columns.size());
      for (size_t i = 0; i != cat.columns.size(); ++i) {
        bcif::EncodedColumn col = bcif::encode_column(cat.column_names[i],
                                                      cat.columns[i],
                                                      options.max_decimals);
        pk.pack_map(3);
        pack_str(pk, "name");
        pack_str(pk, col.name);
        pack_str(pk, "data");
        pack_encoded_data(pk, col.data);
        pack_str(pk, "mask");
        if (col.has_mask)
          pack_encoded_data(pk, col.mask);
        else
          pk.pack_nil();
      }
    }
  }
  return std::vector<char>(sbuf.data(), sbuf.data() + sbuf.size());
}

void write_bcif_file(const cif::Document& doc, const std::string& path,
                     const BcifWriteOptions& options) {
  std::vector<char> buf = write_bcif_to_buffer(doc, options);
  write_buffer_to_file(path, buf.data(), buf.size());
}

namespace {

const msgpack::object* find_key(const msgpack::object& obj, const char* key) {
  if (obj.type != msgpack::type::MAP)
    fail(cat("BinaryCIF: map expected when looking for ", key));
  size_t len = std::strlen(key);
  for (std::uint32_t i = 0; i != obj.via.map.size; ++i) {
    const msgpack::object_kv& kv = obj.via.map.ptr[i];
    if (kv.key.type == msgpack::type::STR && kv.key.via.str.size == len &&
        std::memcmp(kv.key.via.str.ptr, key, len) == 0)
      return &kv.val;
  }
  return nullptr;
}

const msgpack::object& get_key(const msgpack::object& obj, const char* key) {
  const msgpack::object* val = find_key(obj, key);
  if (!val)
    fail(cat("BinaryCIF: missing field ", key));
  return *val;
}

std::string get_str(const msgpack::object& obj, const char* key) {
  const msgpack::object& val = get_key(obj, key);
  if (val.type == msgpack::type::STR)
    return std::string(val.via.str.ptr, val.via.str.size);
  if (val.type == msgpack::type::BIN)
    return std::string(val.via.bin.ptr, val.via.bin.size);
  fail(cat("BinaryCIF: field ", key, " should be a string"));
}

double get_number(const msgpack::object& obj, const char* key) {
  const msgpack::object& val = get_key(obj, key);
  switch (val.type) {
    case msgpack::type::POSITIVE_INTEGER: return (double) val.via.u64;
    case msgpack::type::NEGATIVE_INTEGER: return (double) val.via.i64;
    case msgpack::type::FLOAT32:
    case msgpack::type::FLOAT64: return val.via.f64;
    default: fail(cat("BinaryCIF: field ", key, " should be a number"));
  }
}

std::int64_t get_int(const msgpack::object& obj, const char* key) {
  const msgpack::object& val = get_key(obj, key);
  switch (val.type) {
    case msgpack::type::POSITIVE_INTEGER:
      if (val.via.u64 > (std::uint64_t) std::numeric_limits<std::int64_t>::max())
        fail(cat("BinaryCIF: ", key, " is out of range"));
      return (std::int64_t) val.via.u64;
    case msgpack::type::NEGATIVE_INTEGER: return val.via.i64;
    case msgpack::type::FLOAT32:
    case msgpack::type::FLOAT64: {
      // some encoders write integers as floats
      double d = val.via.f64;
      // false for NaN
      if (!(d > -9.2e18 && d < 9.2e18) || d != std::floor(d))
        fail(cat("BinaryCIF: ", key, " should be an integer, not ", d));
      return (std::int64_t) d;
    }
    default: fail(cat("BinaryCIF: field ", key, " should be an integer"));
  }
}

int get_size(const msgpack::object& obj, const char* key) {
  std::int64_t n = get_int(obj, key);
  if (n < 0 || n > std::numeric_limits<std::int32_t>::max())
    fail(cat("BinaryCIF: invalid ", key, ": ", n));
  return (int) n;
}

std::vector<std::uint8_t> get_bytes(const msgpack::object& obj, const char* key) {
  const msgpack::object& val = get_key(obj, key);
  const char* ptr;
  size_t size;
  if (val.type == msgpack::type::BIN) {
    ptr = val.via.bin.ptr;
    size = val.via.bin.size;
  } else if (val.type == msgpack::type::STR) {
    ptr = val.via.str.ptr;
    size = val.via.str.size;
  } else {
    fail(cat("BinaryCIF: field ", key, " should be binary"));
  }
  return std::vector<std::uint8_t>(ptr, ptr + size);
}

const msgpack::object_array& get_array(const msgpack::object& obj, const char* key) {
  const msgpack::object& val = get_key(obj, key);
  if (val.type != msgpack::type::ARRAY)
    fail(cat("BinaryCIF: field ", key, " should be an array"));
  return val.via.array;
}

std::vector<bcif::Encoding> unpack_encodings(const msgpack::object& obj, const char* key);

bcif::Encoding unpack_encoding(const msgpack::object& obj) {
  using bcif::EncodingKind;
  bcif::Encoding enc(bcif::encoding_kind_from_name(get_str(obj, "kind")));
  switch (enc.kind) {
    case EncodingKind::ByteArray:
      enc.type = bcif::data_type_from_int((int) get_int(obj, "type"));
      break;
    case EncodingKind::FixedPoint:
      enc.factor = get_number(obj, "factor");
      enc.src_type = bcif::data_type_from_int((int) get_int(obj, "srcType"));
      break;
    case EncodingKind::IntervalQuantization:
      enc.min = get_number(obj, "min");
      enc.max = get_number(obj, "max");
      enc.num_steps = get_size(obj, "numSteps");
      enc.src_type = bcif::data_type_from_int((int) get_int(obj, "srcType"));
      break;
    case EncodingKind::RunLength:
      enc.src_size = get_size(obj, "srcSize");
      break;
    case EncodingKind::Delta:
      enc.origin = (std::int32_t) get_int(obj, "origin");
      break;
    case EncodingKind::IntegerPacking:
      enc.byte_count = (int) get_int(obj, "byteCount");
      if (enc.byte_count != 1 && enc.byte_count != 2)
        fail(cat("IntegerPacking: unsupported byteCount ", enc.byte_count));
      enc.is_unsigned = get_key(obj, "isUnsigned").type == msgpack::type::BOOLEAN &&
                        get_key(obj, "isUnsigned").via.boolean;
      enc.src_size = get_size(obj, "srcSize");
      break;
    case EncodingKind::StringArray:
      enc.string_array->data_encoding = unpack_encodings(obj, "dataEncoding");
      enc.string_array->string_data = get_str(obj, "stringData");
      enc.string_array->offset_encoding = unpack_encodings(obj, "offsetEncoding");
      enc.string_array->offsets = get_bytes(obj, "offsets");
      break;
  }
  return enc;
}

std::vector<bcif::Encoding> unpack_encodings(const msgpack::object& obj, const char* key) {
  const msgpack::object_array& arr = get_array(obj, key);
  std::vector<bcif::Encoding> encodings;
  encodings.reserve(arr.size);
  for (std::uint32_t i = 0; i != arr.size; ++i)
    encodings.push_back(unpack_encoding(arr.ptr[i]));
  return encodings;
}

bcif::EncodedData unpack_encoded_data(const msgpack::object& obj) {
  bcif::EncodedData data;
  data.encoding = unpack_encodings(obj, "encoding");
  data.data = get_bytes(obj, "data");
  return data;
}

void add_category(cif::Block& block, std::string name, const msgpack::object& obj) {
  if (name.empty() || name[0] != '_')
    name.insert(0, 1, '_');
  size_t row_count = (size_t) get_size(obj, "rowCount");
  const msgpack::object_array& columns = get_array(obj, "columns");
  std::vector<std::string> tags;
  std::vector<bcif::Values> values;
  std::vector<std::vector<std::int32_t>> masks;
  for (std::uint32_t i = 0; i != columns.size; ++i) {
    const msgpack::object& col = columns.ptr[i];
    std::string col_name = get_str(col, "name");
    tags.push_back(col_name.empty() ? name : name + "." + col_name);
    values.push_back(bcif::decode(unpack_encoded_data(get_key(col, "data"))));
    if (values.back().size() != row_count)
      fail(cat("BinaryCIF: ", tags.back(), " has ", values.back().size(),
               " values, rowCount is ", row_count));
    masks.emplace_back();
    const msgpack::object* mask = find_key(col, "mask");
    if (mask && mask->type != msgpack::type::NIL) {
      masks.back() = bcif::decode_integers(unpack_encoded_data(*mask));
      if (masks.back().size() != row_count)
        fail(cat("BinaryCIF: mask of ", tags.back(), " has wrong size"));
    }
  }
  auto value_at = [&](size_t col, size_t row) -> std::string {
    const std::vector<std::int32_t>& mask = masks[col];
    if (!mask.empty() && mask[row] != bcif::Present)
      return mask[row] == bcif::NotApplicable ? "." : "?";
    return values[col].to_cif(row);
  };
  if (row_count == 1) {
    for (size_t col = 0; col != tags.size(); ++col)
      block.items.emplace_back(tags[col], value_at(col, 0));
  } else {
    block.items.emplace_back(cif::LoopArg{});
    cif::Loop& loop = block.items.back().loop;
    loop.tags = std::move(tags);
    loop.values.reserve(row_count * loop.tags.size());
    for (size_t row = 0; row != row_count; ++row)
      for (size_t col = 0; col != loop.tags.size(); ++col)
        loop.values.push_back(value_at(col, row));
  }
}

} // anonymous namespace

cif::Document read_bcif_memory(const char* data, size_t size, const char* name) {
  cif::Document doc;
  doc.source = name;
  msgpack::object_handle oh;
  try {
    oh = msgpack::unpack(data, size);
  } catch (msgpack::unpack_error& e) {
    fail(std::string(name) + ": malformed MessagePack: " + e.what());
  }
  const msgpack::object& root = oh.get();
  try {
    const msgpack::object_array& blocks = get_array(root, "dataBlocks");
    for (std::uint32_t i = 0; i != blocks.size; ++i) {
      const msgpack::object& b = blocks.ptr[i];
      doc.blocks.emplace_back(get_str(b, "header"));
      cif::Block& block = doc.blocks.back();
      const msgpack::object_array& categories = get_array(b, "categories");
      for (std::uint32_t j = 0; j != categories.size; ++j)
        add_category(block, get_str(categories.ptr[j], "name"), categories.ptr[j]);
    }
  } catch (std::runtime_error& e) {
    fail(std::string(name) + ": " + e.what());
  }
  cif::check_duplicates(doc);
  return doc;
}

cif::Document read_bcif_file(const std::string& path) {
  CharArray mem = read_into_buffer(MaybeGzipped(path));
  return read_bcif_memory(mem.data(), mem.size(), path.c_str());
}

} // namespace biods
