#include "camera.hpp"

#include <dr/linalg_reshape.hpp>

#include "gfx_utils.hpp"

namespace pentacube
{

Mat4<f32> Camera::view_proj() const
{
    Mat4<f32> const world_to_view = make_look_at(eye, target, up);
    Mat4<f32> const view_to_clip =
        make_perspective<NdcType_OpenGl>(deg_to_rad(fov_y_deg), aspect, z_near, z_far);
    return make_opengl_to_wgpu() * view_to_clip * world_to_view;
}

void Camera::set_aspect(i32 const width, i32 const height)
{
    if (width <= 0 || height <= 0)
        return;

    aspect = static_cast<f32>(width) / height;
}

void Camera::set_eye(Vec3<f32> const& new_eye) { eye = new_eye; }

CameraUniform CameraUniform::make()
{
    CameraUniform result{};
    as_mat<4, 4>(result.view_proj) = Mat4<f32>::Identity();
    return result;
}

void CameraUniform::update(Camera const& camera)
{
    as_mat<4, 4>(view_proj) = camera.view_proj();
}

} // namespace pentacube
