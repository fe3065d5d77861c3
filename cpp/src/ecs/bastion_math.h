#ifndef BASTION_MATH_H
#define BASTION_MATH_H

#include <cmath>

namespace bastion {

// ─── Vectors ──────────────────────────────────────────────
// The grid lies on the world x-y plane, +z is up.
struct Vec3 {
  float x, y, z;
}; // 12 bytes

using Point = Vec3;

inline Vec3 operator+(const Vec3 &a, const Vec3 &b) {
  return {a.x + b.x, a.y + b.y, a.z + b.z};
}
inline Vec3 operator-(const Vec3 &a, const Vec3 &b) {
  return {a.x - b.x, a.y - b.y, a.z - b.z};
}
inline Vec3 operator*(const Vec3 &v, float s) {
  return {v.x * s, v.y * s, v.z * s};
}
inline Vec3 &operator+=(Vec3 &a, const Vec3 &b) {
  a.x += b.x;
  a.y += b.y;
  a.z += b.z;
  return a;
}

inline float dot(const Vec3 &a, const Vec3 &b) {
  return a.x * b.x + a.y * b.y + a.z * b.z;
}

inline Vec3 cross(const Vec3 &a, const Vec3 &b) {
  return {a.y * b.z - a.z * b.y, a.z * b.x - a.x * b.z,
          a.x * b.y - a.y * b.x};
}

inline float length(const Vec3 &v) { return std::sqrt(dot(v, v)); }

// Zero-length input yields the zero vector (no division by zero).
inline Vec3 normalized(const Vec3 &v) {
  float len_sq = dot(v, v);
  if (len_sq <= 0.0f)
    return {0.0f, 0.0f, 0.0f};
  float inv = 1.0f / std::sqrt(len_sq);
  return v * inv;
}

// Moves `frac` of the remaining distance, frac clamped to [0, 1].
inline float lerp(float from, float to, float frac) {
  if (frac < 0.0f)
    frac = 0.0f;
  if (frac > 1.0f)
    frac = 1.0f;
  return from + (to - from) * frac;
}

// ─── Transform ────────────────────────────────────────────
struct Transform {
  Vec3 position = {0.0f, 0.0f, 0.0f};
  Vec3 scale = {1.0f, 1.0f, 1.0f};
  Vec3 forward = {0.0f, 1.0f, 0.0f};
  Vec3 up = {0.0f, 0.0f, 1.0f};
}; // 48 bytes

inline void set_position(Transform &t, const Point &p) { t.position = p; }
inline void set_scale(Transform &t, const Vec3 &s) { t.scale = s; }
inline void translate(Transform &t, const Vec3 &delta) { t.position += delta; }

// Orients forward toward `target`, re-orthogonalizing `up` against it.
// A target at the transform's own position leaves the basis unchanged.
inline void look_at(Transform &t, const Point &target, const Vec3 &up) {
  Vec3 fwd = normalized(target - t.position);
  if (dot(fwd, fwd) == 0.0f)
    return;
  Vec3 right = normalized(cross(fwd, up));
  if (dot(right, right) == 0.0f) {
    t.forward = fwd;
    return;
  }
  t.forward = fwd;
  t.up = cross(right, fwd);
}

} // namespace bastion

#endif // BASTION_MATH_H
