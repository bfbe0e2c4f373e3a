#pragma once

#include <dr/app/gfx_utils.hpp>

#include "dr_shim.hpp"

namespace pentacube
{

/// Creates a rotation of the given angle (radians) about a unit axis
Mat3<f32> make_rotate(f32 angle, Vec3<f32> const& unit_axis);

/// Remaps clip space z from [-w, w] to [0, w]
Mat4<f32> make_opengl_to_wgpu();

} // namespace pentacube
