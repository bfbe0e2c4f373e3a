#include "gfx_utils.hpp"

#include <Eigen/Geometry>

namespace pentacube
{

Mat3<f32> make_rotate(f32 const angle, Vec3<f32> const& unit_axis)
{
    return Eigen::AngleAxis<f32>{angle, unit_axis}.toRotationMatrix();
}

Mat4<f32> make_opengl_to_wgpu()
{
    Mat4<f32> m = Mat4<f32>::Identity();
    m(2, 2) = 0.5f;
    m(2, 3) = 0.5f;
    return m;
}

} // namespace pentacube
