// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2025-2026 SenseHub Project
#ifndef SENSEHUB_MATH_VEC3_H
#define SENSEHUB_MATH_VEC3_H

// Vec3: three-axis sensor vector.
// Pure C++, no bus or platform dependencies.

namespace sensehub {

struct Vec3 {
    float x{0.0f};
    float y{0.0f};
    float z{0.0f};

    constexpr Vec3() = default;
    constexpr Vec3(float x_, float y_, float z_) : x(x_), y(y_), z(z_) {}

    Vec3 operator*(float s) const { return {x * s, y * s, z * s}; }
    Vec3 operator-() const { return {-x, -y, -z}; }

    bool operator==(const Vec3& rhs) const { return x == rhs.x && y == rhs.y && z == rhs.z; }
    bool operator!=(const Vec3& rhs) const { return !(*this == rhs); }

    float norm_sq() const { return x * x + y * y + z * z; }
    float norm() const;
};

} // namespace sensehub

#endif // SENSEHUB_MATH_VEC3_H
