// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2025-2026 SenseHub Project
#include "math/vec3.h"

#include <cmath>

namespace sensehub {

float Vec3::norm() const {
    return sqrtf(norm_sq());
}

} // namespace sensehub
