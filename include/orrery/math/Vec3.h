#pragma once
#include <cmath>

namespace orrery::math {

struct Vec3d {
  double x{0}, y{0}, z{0};

  constexpr Vec3d() = default;
  constexpr Vec3d(double x_, double y_, double z_) : x(x_), y(y_), z(z_) {}

  Vec3d operator+(const Vec3d& o) const { return {x + o.x, y + o.y, z + o.z}; }
  Vec3d operator-(const Vec3d& o) const { return {x - o.x, y - o.y, z - o.z}; }
  Vec3d operator-() const { return {-x, -y, -z}; }
  Vec3d operator*(double s) const { return {x * s, y * s, z * s}; }
  Vec3d operator/(double s) const { return {x / s, y / s, z / s}; }

  Vec3d& operator+=(const Vec3d& o) { x += o.x; y += o.y; z += o.z; return *this; }
  Vec3d& operator-=(const Vec3d& o) { x -= o.x; y -= o.y; z -= o.z; return *this; }

  bool operator==(const Vec3d& o) const { return x == o.x && y == o.y && z == o.z; }
  bool operator!=(const Vec3d& o) const { return !(*this == o); }

  double lengthSq() const { return x*x + y*y + z*z; }
  double length() const { return std::sqrt(lengthSq()); }

  Vec3d normalized(double eps=1e-12) const {
    const double len = length();
    if (len < eps) return {0,0,0};
    return *this / len;
  }
};

inline Vec3d operator*(double s, const Vec3d& v) { return v * s; }

inline double dot(const Vec3d& a, const Vec3d& b) { return a.x*b.x + a.y*b.y + a.z*b.z; }

inline double distance(const Vec3d& a, const Vec3d& b) { return (a - b).length(); }

} // namespace orrery::math
