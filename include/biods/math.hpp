// Copyright The biods Developers.
//
// Cartesian coordinates and the rigid-body operators of assemblies.

#ifndef BIODS_MATH_HPP_
#define BIODS_MATH_HPP_

#include <cmath>      // for fabs, sqrt, isnan
#include <limits>     // for quiet_NaN
#include <stdexcept>  // for out_of_range

namespace biods {

inline double nan_value() { return std::numeric_limits<double>::quiet_NaN(); }

/// Position in Angstroms. Missing atoms have NaN coordinates.
struct Vec3 {
  double x, y, z;

  Vec3() : x(0), y(0), z(0) {}
  Vec3(double x_, double y_, double z_) : x(x_), y(y_), z(z_) {}
  static Vec3 nan() { return Vec3(nan_value(), nan_value(), nan_value()); }

  // x, y, z for 0, 1, 2
  double& at(int i) {
    if (i == 0) return x;
    if (i == 1) return y;
    if (i == 2) return z;
    throw std::out_of_range("Vec3 index must be 0, 1 or 2.");
  }

  Vec3 operator+(const Vec3& o) const { return {x + o.x, y + o.y, z + o.z}; }
  Vec3 operator-(const Vec3& o) const { return {x - o.x, y - o.y, z - o.z}; }

  /// NaN if either position is missing
  double dist(const Vec3& o) const {
    Vec3 d = *this - o;
    return std::sqrt(d.x * d.x + d.y * d.y + d.z * d.z);
  }
  bool has_nan() const { return std::isnan(x) || std::isnan(y) || std::isnan(z); }
  bool approx(const Vec3& o, double epsilon) const {
    return std::fabs(x - o.x) <= epsilon && std::fabs(y - o.y) <= epsilon &&
           std::fabs(z - o.z) <= epsilon;
  }
};

/// 3x3 matrix, identity by default.
struct Mat33 {
  double a[3][3] = { {1.,0.,0.}, {0.,1.,0.}, {0.,0.,1.} };

  Mat33() = default;
  Mat33(double a1, double a2, double a3, double b1, double b2, double b3,
        double c1, double c2, double c3)
  : a{{a1, a2, a3}, {b1, b2, b3}, {c1, c2, c3}} {}

  double* operator[](int i) { return a[i]; }
  const double* operator[](int i) const { return a[i]; }

  Vec3 operator*(const Vec3& p) const {
    return {a[0][0] * p.x + a[0][1] * p.y + a[0][2] * p.z,
            a[1][0] * p.x + a[1][1] * p.y + a[1][2] * p.z,
            a[2][0] * p.x + a[2][1] * p.y + a[2][2] * p.z};
  }
  Mat33 operator*(const Mat33& b) const {
    Mat33 r;
    for (int i = 0; i != 3; ++i)
      for (int j = 0; j != 3; ++j)
        r.a[i][j] = a[i][0] * b.a[0][j] + a[i][1] * b.a[1][j] + a[i][2] * b.a[2][j];
    return r;
  }
  bool is_identity() const {
    for (int i = 0; i != 3; ++i)
      for (int j = 0; j != 3; ++j)
        if (a[i][j] != (i == j ? 1. : 0.))
          return false;
    return true;
  }
};

/// x -> mat * x + vec
struct Transform {
  Mat33 mat;
  Vec3 vec;

  Vec3 apply(const Vec3& x) const { return mat * x + vec; }
  /// the transform that applies b first, then this
  Transform combine(const Transform& b) const { return {mat * b.mat, mat * b.vec + vec}; }
  bool is_identity() const {
    return mat.is_identity() && vec.x == 0. && vec.y == 0. && vec.z == 0.;
  }
};

} // namespace biods
#endif
