#pragma once

#include "dr_shim.hpp"

namespace pentacube
{

struct Camera
{
    Vec3<f32> eye{0.0f, 1.3f, 6.0f};
    Vec3<f32> target{0.0f, 0.0f, 0.0f};
    Vec3<f32> up{0.0f, 1.0f, 0.0f};
    f32 aspect{4.0f / 3.0f};
    f32 fov_y_deg{45.0f};
    f32 z_near{0.1f};
    f32 z_far{100.0f};

    /// Returns the world to clip transform with clip z in [0, w]
    Mat4<f32> view_proj() const;

    /// Updates the aspect ratio from framebuffer dimensions. Zero-sized framebuffers (e.g. a
    /// minimized window) leave the camera unchanged.
    void set_aspect(i32 width, i32 height);

    void set_eye(Vec3<f32> const& eye);
};

struct CameraUniform
{
    f32 view_proj[16];

    static CameraUniform make();

    void update(Camera const& camera);
};

static_assert(sizeof(CameraUniform) == 64);

} // namespace pentacube
