// Copyright The biods Developers.
//
// Array2D - a dense row-major matrix, used for per-residue coordinates
// (residues x atoms) and residue-residue distance maps.

#ifndef BIODS_ARRAY2D_HPP_
#define BIODS_ARRAY2D_HPP_

#include <algorithm>  // for fill
#include <stdexcept>  // for out_of_range
#include <vector>

namespace biods {

template<typename T>
struct Array2D {
  int rows = 0;
  int cols = 0;
  std::vector<T> data;

  Array2D() = default;
  Array2D(int rows_, int cols_, T init=T())
    : rows(rows_), cols(cols_), data((size_t)rows_ * cols_, init) {}

  size_t index_q(int i, int j) const { return (size_t)i * cols + j; }

  T& operator()(int i, int j) { return data[index_q(i, j)]; }
  const T& operator()(int i, int j) const { return data[index_q(i, j)]; }

  T& at(int i, int j) {
    if (i < 0 || i >= rows || j < 0 || j >= cols)
      throw std::out_of_range("Array2D index out of range");
    return data[index_q(i, j)];
  }
  const T& at(int i, int j) const { return const_cast<Array2D*>(this)->at(i, j); }

  void fill(T value) { std::fill(data.begin(), data.end(), value); }
  bool empty() const { return data.empty(); }
};

} // namespace biods
#endif
