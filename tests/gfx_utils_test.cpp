#include <cmath>

#include <gtest/gtest.h>

#include <gfx_utils.hpp>

#include "test_utils.hpp"

namespace pentacube
{

TEST(GfxUtils, RotateAboutZ)
{
    Mat3<f32> const r = make_rotate(0.5f * pi<f32>, Vec3<f32>::UnitZ());
    EXPECT_TRUE(all_near(r * Vec3<f32>::UnitX(), Vec3<f32>::UnitY()));
    EXPECT_TRUE(all_near(r * Vec3<f32>::UnitZ(), Vec3<f32>::UnitZ()));
}

TEST(GfxUtils, RotateAboutTiltedAxis)
{
    Vec3<f32> const axis = Vec3<f32>{1.0f, -2.0f, 1.0f}.normalized();
    Mat3<f32> const r = make_rotate(0.25f * pi<f32>, axis);

    EXPECT_TRUE(all_near(r * axis, axis));
    EXPECT_TRUE(all_near(r * r.transpose(), Mat3<f32>::Identity()));
    EXPECT_NEAR(r.trace(), 1.0f + 2.0f * std::cos(0.25f * pi<f32>), 1.0e-5f);
}

// Camera setup relies on this convention of dr's look-at
TEST(GfxUtils, LookAtMapsEyeToOrigin)
{
    Vec3<f32> const eye{0.0f, 1.3f, 6.0f};
    Mat4<f32> const m = make_look_at(eye, Vec3<f32>::Zero(), Vec3<f32>::UnitY());

    EXPECT_TRUE(all_near(m * eye.homogeneous(), Vec4<f32>{0.0f, 0.0f, 0.0f, 1.0f}));

    // Target lies straight ahead on the negative z axis
    Vec4<f32> const target = m * Vec4<f32>{0.0f, 0.0f, 0.0f, 1.0f};
    EXPECT_NEAR(target.x(), 0.0f, 1.0e-5f);
    EXPECT_NEAR(target.y(), 0.0f, 1.0e-5f);
    EXPECT_NEAR(target.z(), -eye.norm(), 1.0e-5f);
}

TEST(GfxUtils, OpenGlToWgpuRemapsDepth)
{
    Mat4<f32> const m = make_opengl_to_wgpu();

    Vec4<f32> const near = m * Vec4<f32>{0.0f, 0.0f, -1.0f, 1.0f};
    Vec4<f32> const far = m * Vec4<f32>{0.0f, 0.0f, 1.0f, 1.0f};
    EXPECT_FLOAT_EQ(near.z(), 0.0f);
    EXPECT_FLOAT_EQ(far.z(), 1.0f);
}

} // namespace pentacube
